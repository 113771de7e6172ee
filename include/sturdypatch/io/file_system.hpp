#pragma once

#include "sturdypatch/interfaces.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sturdypatch {

// Byte-exact file access: no newline translation on read or write
class FileSystem : public IFileSystem {
public:
    auto read_text(const std::string& path) -> std::optional<std::string> override;
    auto write_text(const std::string& text, const std::string& path) -> bool override;
    auto file_exists(const std::string& path) -> bool override;
    auto list_directory(const std::string& path) -> std::vector<std::string> override;
    auto create_directories(const std::string& path) -> bool override;
};

} // namespace sturdypatch
