#include "sturdypatch/core/hunk_applier.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace sturdypatch {

auto apply_replacement(const Document& document, MatchSpan span,
                       std::span<const std::string> replacement) -> Document {
    auto lines = document.lines();
    if (span.length == 0 || span.end() > lines.size()) {
        throw std::out_of_range("Match span " + std::to_string(span.start) + "+"
                                + std::to_string(span.length) + " is outside a document of "
                                + std::to_string(lines.size()) + " lines");
    }

    bool unterminated_tail
        = span.end() == lines.size() && lines.back().line_ending == LineEnding::NONE;
    auto fallback_ending = dominant_line_ending(document);

    std::vector<StructuredLine> spliced;
    spliced.reserve(lines.size() - span.length + replacement.size());
    spliced.insert(spliced.end(), lines.begin(), lines.begin() + span.start);

    for (size_t j = 0; j < replacement.size(); ++j) {
        const auto& donor = lines[span.start + std::min(j, span.length - 1)];

        // Only the old last line has no terminator; lines that are no longer
        // last need one
        auto ending = donor.line_ending == LineEnding::NONE ? fallback_ending : donor.line_ending;

        // Blank replacement lines take the donor's indentation too

        spliced.push_back(StructuredLine{.indentation = donor.indentation,
                                         .content = replacement[j],
                                         .trailing = {},
                                         .line_ending = ending});
    }

    // Keep "no newline at end of file"
    if (unterminated_tail && !spliced.empty()) {
        spliced.back().line_ending = LineEnding::NONE;
    }

    spliced.insert(spliced.end(), lines.begin() + span.end(), lines.end());

    return Document(std::move(spliced));
}

} // namespace sturdypatch
