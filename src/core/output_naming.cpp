#include "sturdypatch/core/output_naming.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <regex>
#include <sstream>
#include <utility>

namespace sturdypatch {

namespace {

const std::regex version_pattern{R"(^(\d+)\.(\d+))"};

auto parse_version(const std::string& sibling_stem, const std::string& prefix)
    -> std::optional<std::pair<int, int>> {
    if (!sibling_stem.starts_with(prefix)) {
        return std::nullopt;
    }

    std::smatch match;
    auto rest = sibling_stem.substr(prefix.size());
    if (!std::regex_search(rest, match, version_pattern)) {
        return std::nullopt;
    }

    try {
        return std::pair{std::stoi(match[1].str()), std::stoi(match[2].str())};
    } catch (const std::exception&) {
        // Out of range version numbers are not ours
        return std::nullopt;
    }
}

} // namespace

auto compute_default_version(const std::string& stem, std::span<const std::string> sibling_names)
    -> std::string {
    const auto prefix = stem + "_v";
    std::optional<std::pair<int, int>> highest;

    for (const auto& name : sibling_names) {
        auto sibling_stem = std::filesystem::path(name).stem().string();
        auto version = parse_version(sibling_stem, prefix);
        if (version && (!highest || *version > *highest)) {
            highest = version;
        }
    }

    if (!highest) {
        return "_v0.0";
    }

    auto [major, minor] = *highest;
    ++minor;
    if (minor >= 10) {
        ++major;
        minor = 0;
    }

    return "_v" + std::to_string(major) + "." + std::to_string(minor);
}

auto normalize_version_suffix(const std::string& suffix) -> std::string {
    if (suffix.empty() || suffix.front() == '_') {
        return suffix;
    }
    return "_" + suffix;
}

auto versioned_output_path(const std::string& path, const std::string& suffix) -> std::string {
    std::filesystem::path original(path);
    auto file_name = original.stem().string() + normalize_version_suffix(suffix)
                     + original.extension().string();
    return (original.parent_path() / file_name).string();
}

auto log_file_name(std::chrono::system_clock::time_point when) -> std::string {
    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm local_time{};
    localtime_r(&time, &local_time);

    std::ostringstream oss;
    oss << "sturdypatch_log_" << std::put_time(&local_time, "%Y-%m-%d_%H-%M-%S") << ".txt";
    return oss.str();
}

} // namespace sturdypatch
