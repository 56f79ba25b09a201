/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/text.hpp"
#include <cstdint>

namespace redraft {

namespace {

constexpr char32_t kInvalid = 0xFFFFFFFF;

// Decodes one code point starting at pos and advances pos. Malformed
// sequences consume a single byte and yield kInvalid.
char32_t nextCodePoint(const std::string& text, std::size_t& pos) noexcept {
    auto byte = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };

    unsigned char lead = byte(pos);
    std::size_t length = 0;
    char32_t cp = 0;

    if (lead < 0x80) {
        ++pos;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        ++pos;
        return kInvalid;
    }

    if (pos + length > text.size()) {
        ++pos;
        return kInvalid;
    }
    for (std::size_t i = 1; i < length; ++i) {
        unsigned char cont = byte(pos + i);
        if ((cont & 0xC0) != 0x80) {
            ++pos;
            return kInvalid;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    pos += length;
    return cp;
}

bool isCjk(char32_t cp) noexcept {
    return cp >= 0x4E00 && cp <= 0x9FFF;
}

bool isSentenceTerminal(char32_t cp) noexcept {
    switch (cp) {
        case U'。':
        case U'！':
        case U'？':
        case U'；':
        case U'．':
        case U'!':
        case U'?':
        case U';':
        case U'.':
            return true;
        default:
            return false;
    }
}

bool isSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// Each returned sentence carries its terminal; a trailing fragment without one is kept too.
std::vector<std::string> splitSentences(const std::string& paragraph) {
    std::vector<std::string> sentences;
    std::string current;
    std::size_t pos = 0;
    while (pos < paragraph.size()) {
        std::size_t start = pos;
        char32_t cp = nextCodePoint(paragraph, pos);
        current.append(paragraph, start, pos - start);
        // An ASCII period inside a token ("3.14", "e.g") does not end a sentence
        bool boundary = cp != U'.' || pos == paragraph.size() || isSpace(paragraph[pos]);
        if (cp != kInvalid && isSentenceTerminal(cp) && boundary) {
            sentences.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        sentences.push_back(std::move(current));
    }
    return sentences;
}

void emit(std::vector<std::string>& out, const std::string& piece) {
    std::string trimmed = trimCopy(piece);
    if (!trimmed.empty()) {
        out.push_back(std::move(trimmed));
    }
}

}

std::size_t countCjk(const std::string& text) noexcept {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (isCjk(nextCodePoint(text, pos))) {
            ++count;
        }
    }
    return count;
}

std::size_t countLatin(const std::string& text) noexcept {
    std::size_t count = 0;
    for (char c : text) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
            ++count;
        }
    }
    return count;
}

std::size_t measureLength(const std::string& text) noexcept {
    std::size_t cjk = countCjk(text);
    return cjk > 0 ? cjk : countLatin(text);
}

std::string trimCopy(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && isSpace(text[begin])) ++begin;
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

std::vector<std::string> segmentText(const std::string& text, std::size_t maxSize) {
    std::vector<std::string> segments;

    std::size_t lineStart = 0;
    while (lineStart <= text.size()) {
        std::size_t lineEnd = text.find('\n', lineStart);
        if (lineEnd == std::string::npos) {
            lineEnd = text.size();
        }
        std::string paragraph = trimCopy(text.substr(lineStart, lineEnd - lineStart));
        lineStart = lineEnd + 1;

        if (paragraph.empty()) {
            continue;
        }
        if (measureLength(paragraph) <= maxSize) {
            segments.push_back(std::move(paragraph));
            continue;
        }

        std::string buffer;
        for (const auto& sentence : splitSentences(paragraph)) {
            if (measureLength(buffer + sentence) <= maxSize) {
                buffer += sentence;
            } else {
                emit(segments, buffer);
                buffer = sentence;
            }
        }
        emit(segments, buffer);
    }

    return segments;
}

std::string truncateText(const std::string& text, std::size_t maxChars) {
    std::size_t chars = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        if (chars == maxChars) {
            return text.substr(0, i) + "...";
        }
        unsigned char c = static_cast<unsigned char>(text[i]);
        std::size_t width = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 1;
        i += width;
        ++chars;
    }
    return text;
}

}
