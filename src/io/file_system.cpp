#include "sturdypatch/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace sturdypatch {

auto FileSystem::read_text(const std::string& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }

    return oss.str();
}

auto FileSystem::write_text(const std::string& text, const std::string& path) -> bool {
    // Write to temporary file first for atomic operation
    std::string temp_path = path + ".tmp";

    try {
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                return false;
            }

            file.write(text.data(), static_cast<std::streamsize>(text.size()));
            if (file.fail()) {
                return false;
            }
        } // File automatically closed here

        std::filesystem::rename(temp_path, path);
        return true;

    } catch (const std::filesystem::filesystem_error&) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return false;
    }
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

auto FileSystem::list_directory(const std::string& path) -> std::vector<std::string> {
    std::vector<std::string> names;
    std::error_code ec;

    auto directory = path.empty() ? std::filesystem::path(".") : std::filesystem::path(path);
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        names.push_back(entry.path().filename().string());
    }

    return names; // Empty on error
}

auto FileSystem::create_directories(const std::string& path) -> bool {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

} // namespace sturdypatch
