/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "redraft/records.hpp"
#include "redraft/types.hpp"

namespace redraft::fsio {

[[nodiscard]] std::optional<std::string> readFile(const std::filesystem::path& path) noexcept;

// Writes to "<path>.tmp" and renames over path, so readers never see a partial file.
[[nodiscard]] bool writeFileAtomic(const std::filesystem::path& path, const std::string& content) noexcept;

// "key=value" lines. Blank lines and lines without '=' are ignored.
[[nodiscard]] std::map<std::string, std::string> parseKeyValues(const std::string& text);
[[nodiscard]] std::string formatKeyValues(const std::map<std::string, std::string>& values);

// Per-stage model overrides as "stage.field=value" lines, field in {model, api_key, base_url}.
[[nodiscard]] std::map<Stage, ModelConfig> parseOverrides(const std::string& text);
[[nodiscard]] std::string formatOverrides(const std::map<Stage, ModelConfig>& overrides);

}
