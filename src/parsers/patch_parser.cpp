#include "sturdypatch/parsers/patch_parser.hpp"
#include <nlohmann/json.hpp>

namespace sturdypatch {

namespace {

constexpr const char* default_description = "(no description)";

auto trim_blank_lines(const std::string& text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace

auto PatchParser::parse_patch(const std::string& payload) -> Patch {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(strip_code_fence(payload));
    } catch (const nlohmann::json::exception& e) {
        // Syntax errors and out-of-range numbers alike
        throw ValidationError(std::string("Invalid JSON: ") + e.what());
    }

    if (!document.is_object()) {
        throw ValidationError("Patch JSON must be an object with a 'hunks' array.");
    }

    auto hunks_it = document.find("hunks");
    if (hunks_it == document.end() || !hunks_it->is_array()) {
        throw ValidationError("Patch JSON must contain a 'hunks' array.");
    }

    Patch patch;
    patch.hunks.reserve(hunks_it->size());

    size_t hunk_number = 0;
    for (const auto& entry : *hunks_it) {
        patch.hunks.push_back(parse_hunk(entry, ++hunk_number));
    }

    // Whole-payload validation happens before any hunk is matched
    validate_patch(patch);
    return patch;
}

auto PatchParser::parse_hunk(const nlohmann::json& entry, size_t hunk_number) -> Hunk {
    if (!entry.is_object()) {
        throw ValidationError("Hunk " + std::to_string(hunk_number) + " is not an object.",
                              hunk_number);
    }

    Hunk hunk{.description = default_description,
              .search_block = read_string_field(entry, "search_block", hunk_number),
              .replace_block = read_string_field(entry, "replace_block", hunk_number)};

    // description is optional, but must be a string when given
    if (auto it = entry.find("description"); it != entry.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw ValidationError(
                "Hunk " + std::to_string(hunk_number) + " description must be a string.",
                hunk_number);
        }
        if (!it->get_ref<const std::string&>().empty()) {
            hunk.description = it->get<std::string>();
        }
    }

    return hunk;
}

auto PatchParser::read_string_field(const nlohmann::json& entry, const char* field,
                                    size_t hunk_number) -> std::string {
    auto it = entry.find(field);
    if (it == entry.end()) {
        throw ValidationError(
            "Hunk " + std::to_string(hunk_number) + " is missing " + field + ".", hunk_number);
    }
    if (!it->is_string()) {
        throw ValidationError(
            "Hunk " + std::to_string(hunk_number) + " " + field + " must be a string.",
            hunk_number);
    }
    return it->get<std::string>();
}

auto strip_code_fence(const std::string& payload) -> std::string {
    auto trimmed = trim_blank_lines(payload);
    if (!trimmed.starts_with("```")) {
        return payload;
    }

    // Drop the opening fence line, including any language tag
    auto body_start = trimmed.find('\n');
    if (body_start == std::string::npos) {
        return payload;
    }
    auto body = trimmed.substr(body_start + 1);

    auto closing = body.rfind("```");
    if (closing != std::string::npos) {
        body = body.substr(0, closing);
    }

    return trim_blank_lines(body);
}

auto patch_schema() -> std::string {
    return R"json({
  "hunks": [
    {
      "description": "Short human description",
      "search_block": "exact text to find\n(can span multiple lines)",
      "replace_block": "replacement text\n(same or different length)"
    }
  ]
})json";
}

} // namespace sturdypatch
