#pragma once
/*
 * FileReader
 *
 * Purpose: read a whole file via mmap and split it into lines.
 * Terminators: LF, CRLF and lone CR all end a line; a terminator at the very
 *              end does not start an extra empty line. Empty file -> no lines.
 * Usage: read_lines(path, out_lines, msg); non-Ok status comes with msg.
 */
#include <vector>
#include <string>
#include <string_view>
#include <filesystem>

enum class ReadStatus { Ok, NotFound, PermissionDenied, IoError };

ReadStatus read_lines(const std::filesystem::path& path,
                      std::vector<std::string>& out_lines,
                      std::string& msg);

/* splits an in-memory image with the same rules as read_lines */
void split_lines(std::string_view data, std::vector<std::string>& out_lines);
