#pragma once

/*compile-time defaults, each one can be overridden with -D or the rc file*/

#ifndef MC_DEFAULT_TAB_SIZE
#define MC_DEFAULT_TAB_SIZE 4
#endif

#ifndef MC_DEFAULT_INDENT_SIZE
#define MC_DEFAULT_INDENT_SIZE 4
#endif

#ifndef MC_DEFAULT_USE_TAB_STOPS
#define MC_DEFAULT_USE_TAB_STOPS 1
#endif

#ifndef MC_DEFAULT_MERGE_OVERLAPPING
#define MC_DEFAULT_MERGE_OVERLAPPING 1
#endif

#ifndef MC_DEFAULT_EMPTY_SELECTION_CLIPBOARD
#define MC_DEFAULT_EMPTY_SELECTION_CLIPBOARD 1
#endif

#ifndef MC_DEFAULT_AUTO_CLOSING_PAIRS
#define MC_DEFAULT_AUTO_CLOSING_PAIRS "()[]{}''\"\"``"
#endif

#define MC_RC_FILE_NAME ".mcursorrc"

#ifndef MC_WRITE_CHUNK_SIZE
#define MC_WRITE_CHUNK_SIZE (1 << 16)
#endif
