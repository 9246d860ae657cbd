#include "strings_util.hpp"
#include <algorithm>

static inline bool is_space_or_tab(char c) { return c == ' ' || c == '\t'; }

static bool is_extend(uint32_t cp) {
  return (cp >= 0x0300 && cp <= 0x036F)
      || (cp >= 0x0483 && cp <= 0x0489)
      || (cp >= 0x0591 && cp <= 0x05BD)
      || (cp >= 0x0610 && cp <= 0x061A)
      || (cp >= 0x064B && cp <= 0x065F)
      || (cp >= 0x0E31 && cp <= 0x0E3A && cp != 0x0E32 && cp != 0x0E33)
      || (cp >= 0x1AB0 && cp <= 0x1AFF)
      || (cp >= 0x1DC0 && cp <= 0x1DFF)
      || cp == 0x200C || cp == 0x200D
      || (cp >= 0x20D0 && cp <= 0x20FF)
      || (cp >= 0xFE00 && cp <= 0xFE0F)
      || (cp >= 0xFE20 && cp <= 0xFE2F)
      || (cp >= 0x1F3FB && cp <= 0x1F3FF)
      || (cp >= 0xE0020 && cp <= 0xE007F)
      || (cp >= 0xE0100 && cp <= 0xE01EF);
}

static inline bool is_regional_indicator(uint32_t cp) { return cp >= 0x1F1E6 && cp <= 0x1F1FF; }

int first_non_whitespace_index(const std::string& s) {
  for (size_t i = 0; i < s.size(); ++i) {
    if (!is_space_or_tab(s[i])) return static_cast<int>(i);
  }
  return -1;
}

int last_non_whitespace_index(const std::string& s) {
  for (int i = static_cast<int>(s.size()) - 1; i >= 0; --i) {
    if (!is_space_or_tab(s[static_cast<size_t>(i)])) return i;
  }
  return -1;
}

bool is_whitespace_only(const std::string& s) { return first_non_whitespace_index(s) == -1; }

bool is_utf8_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

uint32_t decode_utf8(const std::string& s, int offset, int& len) {
  int n = static_cast<int>(s.size());
  if (offset < 0 || offset >= n) { len = 0; return 0; }
  unsigned char c = static_cast<unsigned char>(s[offset]);
  int need = 0;
  uint32_t cp = 0;
  if (c < 0x80) { len = 1; return c; }
  if ((c & 0xE0) == 0xC0) { need = 1; cp = c & 0x1F; }
  else if ((c & 0xF0) == 0xE0) { need = 2; cp = c & 0x0F; }
  else if ((c & 0xF8) == 0xF0) { need = 3; cp = c & 0x07; }
  else { len = 1; return c; }
  if (offset + need >= n) { len = 1; return c; }
  for (int k = 1; k <= need; ++k) {
    unsigned char cc = static_cast<unsigned char>(s[offset + k]);
    if (!is_utf8_continuation(cc)) { len = 1; return c; }
    cp = (cp << 6) | (cc & 0x3F);
  }
  len = need + 1;
  return cp;
}

int code_point_start(const std::string& s, int offset) {
  int n = static_cast<int>(s.size());
  offset = std::clamp(offset, 0, n);
  int p = offset;
  while (p > 0 && p < n && is_utf8_continuation(static_cast<unsigned char>(s[p])) && offset - p < 3) p--;
  if (p == offset) return offset;
  int len = 0;
  decode_utf8(s, p, len);
  return (p + len > offset) ? p : offset;
}

int next_char_length(const std::string& s, int offset) {
  int n = static_cast<int>(s.size());
  if (offset < 0 || offset >= n) return 0;
  int len = 0;
  uint32_t base = decode_utf8(s, offset, len);
  int pos = offset + len;
  bool after_zwj = false;
  bool ri_paired = false;
  while (pos < n) {
    int l = 0;
    uint32_t cp = decode_utf8(s, pos, l);
    if (is_extend(cp)) { after_zwj = (cp == 0x200D); pos += l; continue; }
    if (after_zwj) { after_zwj = false; pos += l; continue; }
    if (is_regional_indicator(base) && is_regional_indicator(cp) && !ri_paired) { ri_paired = true; pos += l; continue; }
    break;
  }
  return pos - offset;
}

int prev_char_length(const std::string& s, int offset) {
  int n = static_cast<int>(s.size());
  offset = std::clamp(offset, 0, n);
  int pos = 0;
  int last = 0;
  while (pos < offset) {
    last = pos;
    int l = next_char_length(s, pos);
    if (l <= 0) break;
    pos += l;
  }
  return offset - last;
}

int get_left_delete_offset(int offset, const std::string& s) {
  return offset - prev_char_length(s, offset);
}
