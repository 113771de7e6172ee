#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sturdypatch {

struct Hunk {
    std::string description;    // Free text, not used for matching
    std::string search_block;   // Raw multi-line text to locate
    std::string replace_block;  // Raw multi-line replacement, empty means deletion

    auto operator==(const Hunk& other) const -> bool = default;
};

// Ordered hunks; later hunks see the document as modified by earlier ones
struct Patch {
    std::vector<Hunk> hunks;

    auto operator==(const Patch& other) const -> bool = default;
};

// Structurally malformed payload. Fatal to the whole run: nothing is applied.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message,
                             std::optional<size_t> hunk_number = std::nullopt);

    // 1-based number of the offending hunk, if the error is tied to one
    auto hunk_number() const -> std::optional<size_t> { return hunk_number_; }

private:
    std::optional<size_t> hunk_number_;
};

// Throws ValidationError for the first hunk whose search block has no content line
auto validate_patch(const Patch& patch) -> void;

} // namespace sturdypatch
