/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/fsio.hpp"
#include "redraft/logger.hpp"
#include "redraft/text.hpp"
#include <fstream>
#include <iterator>
#include <sstream>

namespace redraft::fsio {

std::optional<std::string> readFile(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        return content;
    } catch (...) {
        return std::nullopt;
    }
}

bool writeFileAtomic(const std::filesystem::path& path, const std::string& content) noexcept {
    try {
        auto tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) return false;
            file << content;
            file.flush();
            if (!file.good()) return false;
        }

        std::error_code ec;
        std::filesystem::rename(tempPath, path, ec);
        if (ec) {
            LOG_ERROR("Failed to publish " + path.string() + ": " + ec.message());
            std::filesystem::remove(tempPath, ec);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write " + path.string() + ": " + std::string(e.what()));
        return false;
    } catch (...) {
        return false;
    }
}

std::map<std::string, std::string> parseKeyValues(const std::string& text) {
    std::map<std::string, std::string> values;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = trimCopy(line.substr(0, eq));
        if (key.empty()) {
            continue;
        }
        values[key] = line.substr(eq + 1);
    }
    return values;
}

std::string formatKeyValues(const std::map<std::string, std::string>& values) {
    std::string out;
    for (const auto& [key, value] : values) {
        out += key;
        out += '=';
        out += value;
        out += '\n';
    }
    return out;
}

std::map<Stage, ModelConfig> parseOverrides(const std::string& text) {
    std::map<Stage, ModelConfig> overrides;
    for (const auto& [key, value] : parseKeyValues(text)) {
        auto dot = key.find('.');
        if (dot == std::string::npos) {
            LOG_WARN("Ignoring override without stage: " + key);
            continue;
        }
        auto stage = parseStage(key.substr(0, dot));
        if (!stage) {
            LOG_WARN("Ignoring override for unknown stage: " + key);
            continue;
        }
        std::string field = key.substr(dot + 1);
        std::string trimmed = trimCopy(value);
        auto& config = overrides[*stage];
        if (field == "model") {
            config.model = trimmed;
        } else if (field == "api_key") {
            config.apiKey = trimmed;
        } else if (field == "base_url") {
            config.baseUrl = trimmed;
        } else {
            LOG_WARN("Ignoring unknown override field: " + key);
        }
    }
    return overrides;
}

std::string formatOverrides(const std::map<Stage, ModelConfig>& overrides) {
    std::map<std::string, std::string> values;
    for (const auto& [stage, config] : overrides) {
        std::string prefix = std::string(toString(stage)) + ".";
        if (!config.model.empty()) values[prefix + "model"] = config.model;
        if (!config.apiKey.empty()) values[prefix + "api_key"] = config.apiKey;
        if (!config.baseUrl.empty()) values[prefix + "base_url"] = config.baseUrl;
    }
    return formatKeyValues(values);
}

}
