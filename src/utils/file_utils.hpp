#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <optional>
#include <string>

namespace FileUtils {

// Writes <path>.tmp, flushes it, then renames over <path>.
void write_file_atomically(const std::string& file_path, const std::string& contents);

// Empty optional when the file does not exist.
std::optional<std::string> read_file_if_exists(const std::string& file_path);

} // namespace FileUtils

#endif // FILE_UTILS_HPP
