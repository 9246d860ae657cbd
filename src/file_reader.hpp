#pragma once
/*
 * FileReader
 *
 * Purpose: read a file via mmap and split it into lines; normalize CRLF.
 * Usage: mmap_readlines(path, out_lines, msg); returns false with msg on failure.
 */
#include <vector>
#include <string>
#include <filesystem>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);

/* splits in-memory text the same way (CRLF and LF both end a line) */
std::vector<std::string> split_lines(const char* data, size_t n);
