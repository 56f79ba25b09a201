/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/model.hpp"
#include "redraft/logger.hpp"

namespace redraft {

const char* toString(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::Transport: return "transport";
        case FailureKind::Status: return "status";
        case FailureKind::MissingContent: return "missing_content";
    }
    return "unknown";
}

RunResult Compressor::compress(const std::vector<HistoryEntry>& entries,
                               const std::string& instruction,
                               const ModelConfig& config) noexcept {
    try {
        // Summaries carried over from an earlier compression come first
        std::vector<const std::string*> parts;
        for (const auto& entry : entries) {
            if (entry.role == "system" && !entry.content.empty()) {
                parts.push_back(&entry.content);
            }
        }
        for (const auto& entry : entries) {
            if (entry.role == "assistant" && !entry.content.empty()) {
                parts.push_back(&entry.content);
            }
        }

        std::string joined;
        for (const auto* part : parts) {
            if (!joined.empty()) {
                joined += kSeparator;
            }
            joined += *part;
        }

        ChatRequest request;
        request.model = config;
        request.temperature = kTemperature;
        request.messages.push_back({"system", instruction});
        request.messages.push_back({"user",
            "Compress the following processed text and extract its key style features:\n\n" + joined});

        LOG_DEBUG("Compressing " + std::to_string(parts.size()) + " history entries");
        RunResult result = model_.complete(request);
        if (result.ok && result.output.empty()) {
            return RunResult::failed(FailureKind::MissingContent, "Compression returned no content");
        }
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Compression error: " + std::string(e.what()));
        return RunResult::failed(FailureKind::Transport, "Compression error: " + std::string(e.what()));
    }
}

}
