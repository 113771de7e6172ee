#pragma once

#include <chrono>
#include <span>
#include <string>

namespace sturdypatch {

// Next "_v<major>.<minor>" suffix for stem given the names of its sibling files.
// "_v0.0" when no sibling is versioned yet; minor rolls over into major at 10.
auto compute_default_version(const std::string& stem, std::span<const std::string> sibling_names)
    -> std::string;

// Ensure a non-empty suffix starts with '_'
auto normalize_version_suffix(const std::string& suffix) -> std::string;

// <dir>/<stem><suffix><ext>
auto versioned_output_path(const std::string& path, const std::string& suffix) -> std::string;

// sturdypatch_log_<YYYY-mm-dd_HH-MM-SS>.txt in local time
auto log_file_name(std::chrono::system_clock::time_point when) -> std::string;

} // namespace sturdypatch
