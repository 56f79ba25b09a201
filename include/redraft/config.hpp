/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>

#include "redraft/records.hpp"
#include "redraft/types.hpp"

namespace redraft {

// Process-wide defaults. Every field can be overridden through a REDRAFT_* variable.
struct Settings {
    int maxConcurrent = 5;
    std::size_t maxSegmentSize = 500;
    std::size_t trivialThreshold = 15;
    std::size_t historyCompressionThreshold = 5000;
    std::size_t errorMaxLength = 500;
    std::size_t subscriberQueueCapacity = 256;
    std::size_t maxDocumentBytes = 10'000'000; // 10MB
    float temperature = 0.7f;

    ModelConfig polish;
    ModelConfig enhance;
    ModelConfig emotion;
    ModelConfig compression;

    [[nodiscard]] static Settings fromEnv();

    // Stage default, with job overrides applied field by field
    [[nodiscard]] ModelConfig resolve(Stage stage, const ModelConfig& overrides) const;
    [[nodiscard]] const ModelConfig& defaultsFor(Stage stage) const noexcept;
};

namespace env {
[[nodiscard]] int getInt(const char* name, int defv) noexcept;
[[nodiscard]] std::size_t getSize(const char* name, std::size_t defv) noexcept;
[[nodiscard]] float getFloat(const char* name, float defv) noexcept;
[[nodiscard]] std::string getString(const char* name, const std::string& defv);
}

}
