#pragma once

#include "sturdypatch/core/document.hpp"
#include "sturdypatch/core/matcher.hpp"
#include <span>
#include <string>

namespace sturdypatch {

// Replace the lines under span with the replacement tokens and return the new
// Document; the input Document is left untouched.
//
// Replacement line j borrows indentation and terminator from matched line
// min(j, span.length - 1), so lines appended past the match align with the
// last matched line. Trailing whitespace of replaced lines is dropped.
// A document that ended without a terminator still does afterwards.
// An empty replacement deletes the span.
//
// Throws std::out_of_range when span is empty or exceeds the document.
auto apply_replacement(const Document& document, MatchSpan span,
                       std::span<const std::string> replacement) -> Document;

} // namespace sturdypatch
