/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "redraft/records.hpp"

namespace redraft {

// Messages share the role/content shape of history entries.
using ChatMessage = HistoryEntry;

struct ChatRequest {
    ModelConfig model;
    std::vector<ChatMessage> messages;
    float temperature = 0.7f;
    std::optional<int> maxTokens;
};

enum class FailureKind : uint8_t {
    None = 0,
    Transport,      // backend unreachable / could not run
    Status,         // backend answered with an error
    MissingContent  // backend answered without text
};

struct RunResult {
    bool ok = false;
    std::string output;
    std::string error;
    FailureKind failure = FailureKind::None;

    [[nodiscard]] static RunResult success(std::string text) {
        return {true, std::move(text), "", FailureKind::None};
    }
    [[nodiscard]] static RunResult failed(FailureKind kind, std::string message) {
        return {false, "", std::move(message), kind};
    }
};

[[nodiscard]] const char* toString(FailureKind kind) noexcept;

// Chat-completion collaborator. Implementations must be callable from
// several job threads at once.
class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    [[nodiscard]] virtual RunResult complete(const ChatRequest& request) noexcept = 0;
};

// Summarises processed output so later segments keep stylistic context
// without the full transcript.
class Compressor {
public:
    static constexpr float kTemperature = 0.3f;
    static constexpr const char* kSeparator = "\n\n---\n\n";

    explicit Compressor(LanguageModel& model) noexcept : model_(model) {}

    // Joins the system and assistant contents of entries and asks the model
    // for a summary under the given instruction.
    [[nodiscard]] RunResult compress(const std::vector<HistoryEntry>& entries,
                                     const std::string& instruction,
                                     const ModelConfig& config) noexcept;

private:
    LanguageModel& model_;
};

}
