/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include "redraft/model.hpp"
#include "redraft/types.hpp"

namespace redraft::prompts {

// Stage instruction: what the rewrite should achieve.
[[nodiscard]] const std::string& instructionFor(Stage stage);

// Instruction given to the compressor for a stage's history.
[[nodiscard]] const std::string& compressionFor(Stage stage);

// Prefix of the single system entry that replaces compressed history.
inline constexpr const char* kSummaryPrefix = "Summary of previously processed segments:\n";

// History, then the stage instruction as a system message, then the text.
[[nodiscard]] std::vector<ChatMessage> buildMessages(const std::vector<HistoryEntry>& history,
                                                     Stage stage,
                                                     const std::string& text);

}
