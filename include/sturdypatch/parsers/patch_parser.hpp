#pragma once

#include "sturdypatch/core/patch.hpp"
#include "sturdypatch/interfaces.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace sturdypatch {

// JSON payload: { "hunks": [ { "description", "search_block", "replace_block" } ] }
class PatchParser : public IPatchParser {
public:
    auto parse_patch(const std::string& payload) -> Patch override;

private:
    auto parse_hunk(const nlohmann::json& entry, size_t hunk_number) -> Hunk;
    auto read_string_field(const nlohmann::json& entry, const char* field, size_t hunk_number)
        -> std::string;
};

// Remove a surrounding Markdown code fence (```json ... ```), if any
auto strip_code_fence(const std::string& payload) -> std::string;

// Schema text shown to patch authors
auto patch_schema() -> std::string;

} // namespace sturdypatch
