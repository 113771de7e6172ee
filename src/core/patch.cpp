#include "sturdypatch/core/patch.hpp"
#include "sturdypatch/core/document.hpp"

namespace sturdypatch {

ValidationError::ValidationError(const std::string& message, std::optional<size_t> hunk_number)
    : std::runtime_error(message), hunk_number_(hunk_number) {}

auto validate_patch(const Patch& patch) -> void {
    for (size_t i = 0; i < patch.hunks.size(); ++i) {
        auto search_tokens = tokenize_block(patch.hunks[i].search_block);
        if (!has_content(search_tokens)) {
            throw ValidationError("Hunk " + std::to_string(i + 1)
                                      + " has an empty search_block.",
                                  i + 1);
        }
    }
}

} // namespace sturdypatch
