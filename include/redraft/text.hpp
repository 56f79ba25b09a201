/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace redraft {

// Number of CJK unified ideographs (U+4E00..U+9FFF) in UTF-8 text.
[[nodiscard]] std::size_t countCjk(const std::string& text) noexcept;

// Number of ASCII letters.
[[nodiscard]] std::size_t countLatin(const std::string& text) noexcept;

// Language-sensitive length: ideograph count when any are present, letter count otherwise.
[[nodiscard]] std::size_t measureLength(const std::string& text) noexcept;

// Splits a document into non-empty segments of at most maxSize measured length.
// Paragraphs (lines) that fit are kept whole; longer ones are cut at sentence
// terminals and regrouped. A single sentence longer than maxSize stays whole.
[[nodiscard]] std::vector<std::string> segmentText(const std::string& text, std::size_t maxSize = 500);

[[nodiscard]] std::string trimCopy(const std::string& text);

// Keeps at most maxChars code points, appending "..." when anything was cut.
[[nodiscard]] std::string truncateText(const std::string& text, std::size_t maxChars);

}
