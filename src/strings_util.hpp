#pragma once
/*
 * StringsUtil
 *
 * Purpose: byte-offset helpers over UTF-8 line content: whitespace scans and
 * grapheme stepping (base + combining marks, ZWJ sequences, flag pairs).
 * Note: offsets are 0-based bytes; malformed bytes count as one character.
 */
#include <cstdint>
#include <string>

int first_non_whitespace_index(const std::string& s);
int last_non_whitespace_index(const std::string& s);
bool is_whitespace_only(const std::string& s);

bool is_utf8_continuation(unsigned char c);
/* decodes the code point at offset; writes its byte length to len */
uint32_t decode_utf8(const std::string& s, int offset, int& len);
/* largest code point boundary <= offset */
int code_point_start(const std::string& s, int offset);

/* length in bytes of the grapheme starting at offset, 0 at end of string */
int next_char_length(const std::string& s, int offset);
/* length in bytes of the grapheme ending at offset, 0 at start of string */
int prev_char_length(const std::string& s, int offset);
/* offset left after deleting one grapheme to the left of offset */
int get_left_delete_offset(int offset, const std::string& s);
