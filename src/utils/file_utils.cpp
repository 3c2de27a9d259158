#include "file_utils.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace FileUtils {

void write_file_atomically(const std::string& file_path, const std::string& contents) {
    std::filesystem::path target_path(file_path);
    std::filesystem::path temporary_path(file_path + ".tmp");

    try {
        if (target_path.has_parent_path()) {
            std::filesystem::create_directories(target_path.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& filesystem_exception_error) {
        throw std::runtime_error("Failed to create directory for " + file_path + ": " + std::string(filesystem_exception_error.what()));
    }

    {
        std::ofstream temporary_stream(temporary_path, std::ios::out | std::ios::trunc);
        if (!temporary_stream.is_open()) {
            throw std::runtime_error("Failed to open temporary file " + temporary_path.string());
        }
        temporary_stream << contents;
        temporary_stream.flush();
        if (!temporary_stream.good()) {
            throw std::runtime_error("Failed to write temporary file " + temporary_path.string());
        }
    }

    std::error_code rename_error;
    std::filesystem::rename(temporary_path, target_path, rename_error);
    if (rename_error) {
        std::error_code remove_error;
        std::filesystem::remove(temporary_path, remove_error);
        throw std::runtime_error("Failed to replace " + file_path + ": " + rename_error.message());
    }
}

std::optional<std::string> read_file_if_exists(const std::string& file_path) {
    std::error_code exists_error;
    if (!std::filesystem::exists(file_path, exists_error)) {
        return std::nullopt;
    }
    std::ifstream input_stream(file_path);
    if (!input_stream.is_open()) {
        throw std::runtime_error("Failed to open " + file_path);
    }
    std::stringstream contents_stream;
    contents_stream << input_stream.rdbuf();
    return contents_stream.str();
}

} // namespace FileUtils
