#include "text_buffer.hpp"
#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "config.hpp"
#include "file_reader.hpp"
#include "posix_fd.hpp"

TextBuffer::TextBuffer() { ensure_not_empty(); }

size_t TextBuffer::byte_size() const {
  size_t n = 0;
  for (const auto& l : lines_) n += l.size() + 1;
  return n > 0 ? n - 1 : 0;
}

void TextBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

void TextBuffer::init_from_lines(std::vector<std::string> lines) {
  lines_ = std::move(lines);
  ensure_not_empty();
}

void TextBuffer::insert_line(int row, const std::string& s) {
  size_t pos = std::min(static_cast<size_t>(std::max(row, 0)), lines_.size());
  lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), s);
}

void TextBuffer::insert_lines(int row, const std::vector<std::string>& ss) {
  size_t pos = std::min(static_cast<size_t>(std::max(row, 0)), lines_.size());
  lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), ss.begin(), ss.end());
}

void TextBuffer::erase_line(int row) {
  if (row < 0 || row >= line_count()) return;
  lines_.erase(lines_.begin() + row);
  ensure_not_empty();
}

void TextBuffer::erase_lines(int start_row, int end_row) {
  if (end_row < start_row) end_row = start_row;
  start_row = std::clamp(start_row, 0, line_count());
  end_row = std::clamp(end_row, 0, line_count());
  lines_.erase(lines_.begin() + start_row, lines_.begin() + end_row);
  ensure_not_empty();
}

void TextBuffer::replace_line(int row, const std::string& s) {
  if (row < 0 || row >= line_count()) return;
  lines_[static_cast<size_t>(row)] = s;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextBuffer b;
  std::vector<std::string> ls;
  ok = mmap_readlines(path, ls, msg);
  if (ok) b.init_from_lines(std::move(ls));
  return b;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  std::vector<char> buf(static_cast<size_t>(MC_WRITE_CHUNK_SIZE));
  size_t used = 0;
  auto write_span = [&](const char* p, size_t len) -> bool {
    while (len > 0) {
      ssize_t w = ::write(ufd.get(), p, len);
      if (w < 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
      p += w;
      len -= static_cast<size_t>(w);
    }
    return true;
  };
  auto append = [&](const char* p, size_t len) -> bool {
    if (len > buf.size() - used) {
      if (!write_span(buf.data(), used)) return false;
      used = 0;
      if (len >= buf.size()) return write_span(p, len);
    }
    std::memcpy(buf.data() + used, p, len);
    used += len;
    return true;
  };
  int n = line_count();
  for (int i = 0; i < n; ++i) {
    const std::string& s = lines_[static_cast<size_t>(i)];
    if (!append(s.data(), s.size())) return false;
    if (i + 1 < n && !append("\n", 1)) return false;
  }
  if (used > 0 && !write_span(buf.data(), used)) return false;
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#endif
  if (!ufd.close()) { msg = std::string("write file failed: ") + tmp.string(); return false; }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}
