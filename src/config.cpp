/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/config.hpp"
#include "redraft/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

namespace redraft {

namespace env {

int getInt(const char* name, int defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (...) {
        LOG_WARN(std::string("Ignoring invalid integer in ") + name + ": " + val);
        return defv;
    }
}

std::size_t getSize(const char* name, std::size_t defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (...) {
        LOG_WARN(std::string("Ignoring invalid size in ") + name + ": " + val);
        return defv;
    }
}

float getFloat(const char* name, float defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stof(val);
    } catch (...) {
        LOG_WARN(std::string("Ignoring invalid number in ") + name + ": " + val);
        return defv;
    }
}

std::string getString(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

}

namespace {

ModelConfig stageDefaults(const std::string& prefix, const std::string& model,
                          const std::string& sharedKey, const std::string& sharedUrl) {
    ModelConfig config;
    config.model = env::getString((prefix + "_MODEL").c_str(), model);
    config.apiKey = env::getString((prefix + "_API_KEY").c_str(), sharedKey);
    config.baseUrl = env::getString((prefix + "_BASE_URL").c_str(), sharedUrl);
    return config;
}

std::string pick(const std::string& override, const std::string& fallback) {
    return override.empty() ? fallback : override;
}

}

Settings Settings::fromEnv() {
    Settings s;
    s.maxConcurrent = std::max(1, env::getInt("REDRAFT_MAX_CONCURRENT", s.maxConcurrent));
    s.maxSegmentSize = env::getSize("REDRAFT_SEGMENT_MAX_SIZE", s.maxSegmentSize);
    s.trivialThreshold = env::getSize("REDRAFT_SEGMENT_SKIP_THRESHOLD", s.trivialThreshold);
    s.historyCompressionThreshold = env::getSize("REDRAFT_HISTORY_THRESHOLD", s.historyCompressionThreshold);
    s.errorMaxLength = env::getSize("REDRAFT_ERROR_MAX_LENGTH", s.errorMaxLength);
    s.subscriberQueueCapacity = env::getSize("REDRAFT_SUBSCRIBER_QUEUE", s.subscriberQueueCapacity);
    s.maxDocumentBytes = env::getSize("REDRAFT_MAX_DOCUMENT_BYTES", s.maxDocumentBytes);
    s.temperature = env::getFloat("REDRAFT_TEMPERATURE", s.temperature);

    const std::string sharedKey = env::getString("REDRAFT_API_KEY", "");
    const std::string sharedUrl = env::getString("REDRAFT_BASE_URL", "");

    s.polish = stageDefaults("REDRAFT_POLISH", "polish.gguf", sharedKey, sharedUrl);
    s.enhance = stageDefaults("REDRAFT_ENHANCE", "enhance.gguf", sharedKey, sharedUrl);
    // Emotion rewriting falls back to the polish model when not configured
    s.emotion = stageDefaults("REDRAFT_EMOTION", s.polish.model, s.polish.apiKey, s.polish.baseUrl);
    s.compression = stageDefaults("REDRAFT_COMPRESSION", s.polish.model, sharedKey, sharedUrl);

    LOG_DEBUG("Settings: max_concurrent=" + std::to_string(s.maxConcurrent) +
              ", segment_max=" + std::to_string(s.maxSegmentSize) +
              ", skip_threshold=" + std::to_string(s.trivialThreshold) +
              ", history_threshold=" + std::to_string(s.historyCompressionThreshold));
    return s;
}

const ModelConfig& Settings::defaultsFor(Stage stage) const noexcept {
    switch (stage) {
        case Stage::Enhance: return enhance;
        case Stage::EmotionPolish: return emotion;
        case Stage::Polish:
        default: return polish;
    }
}

ModelConfig Settings::resolve(Stage stage, const ModelConfig& overrides) const {
    const ModelConfig& base = defaultsFor(stage);
    ModelConfig resolved;
    resolved.model = pick(overrides.model, base.model);
    resolved.apiKey = pick(overrides.apiKey, base.apiKey);
    resolved.baseUrl = pick(overrides.baseUrl, base.baseUrl);
    return resolved;
}

}
