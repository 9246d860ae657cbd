#pragma once
/*
 * TextBuffer
 *
 * Purpose: line storage behind TextModel (0-based rows, never empty).
 * Feature: safe writes (write .tmp → fdatasync → atomic rename).
 * Note: no coordinates or cursors here; TextModel layers those on top.
 */
#include <filesystem>
#include <string>
#include <vector>

class TextBuffer {
public:
  TextBuffer();

  int line_count() const { return static_cast<int>(lines_.size()); }
  const std::string& line(int r) const { return lines_[static_cast<size_t>(r)]; }
  const std::vector<std::string>& lines() const { return lines_; }
  size_t byte_size() const;

  void init_from_lines(std::vector<std::string> lines);
  void insert_line(int row, const std::string& s);
  void insert_lines(int row, const std::vector<std::string>& ss);
  void erase_line(int row);
  void erase_lines(int start_row, int end_row); // end_row exclusive
  void replace_line(int row, const std::string& s);

  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  void ensure_not_empty();
  std::vector<std::string> lines_;
};
