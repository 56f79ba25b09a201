/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <cstdlib>

#include "redraft/config.hpp"
#include "redraft/model.hpp"
#include "redraft/prompts.hpp"
#include "test_support.hpp"

namespace redraft {
namespace {

TEST(CompressorTest, SendsSummariesBeforeOutputs) {
    test::FakeModel model;
    Compressor compressor(model);

    std::vector<HistoryEntry> entries{
        {"assistant", "out one"},
        {"system", "old summary"},
        {"assistant", "out two"},
        {"assistant", ""},
    };
    ModelConfig config;
    config.model = "compress.gguf";

    RunResult result = compressor.compress(entries, "Summarise the style.", config);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.output, "style summary");

    auto calls = model.calls();
    ASSERT_EQ(calls.size(), 1u);
    const ChatRequest& request = calls[0];
    EXPECT_EQ(request.model.model, "compress.gguf");
    EXPECT_FLOAT_EQ(request.temperature, Compressor::kTemperature);
    ASSERT_EQ(request.messages.size(), 2u);
    EXPECT_EQ(request.messages[0].role, "system");
    EXPECT_EQ(request.messages[0].content, "Summarise the style.");
    EXPECT_EQ(request.messages[1].role, "user");
    EXPECT_EQ(request.messages[1].content,
              "Compress the following processed text and extract its key style features:\n\n"
              "old summary\n\n---\n\nout one\n\n---\n\nout two");
}

TEST(CompressorTest, EmptySummaryIsMissingContent) {
    test::FakeModel model;
    model.setHandler([](const ChatRequest&) { return RunResult::success(""); });
    Compressor compressor(model);

    RunResult result = compressor.compress({{"assistant", "text"}}, "instruction", ModelConfig{});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, FailureKind::MissingContent);
}

TEST(CompressorTest, BackendFailurePassesThrough) {
    test::FakeModel model;
    model.setHandler([](const ChatRequest&) {
        return RunResult::failed(FailureKind::Transport, "connection refused");
    });
    Compressor compressor(model);

    RunResult result = compressor.compress({{"assistant", "text"}}, "instruction", ModelConfig{});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, FailureKind::Transport);
    EXPECT_EQ(result.error, "connection refused");
}

TEST(PromptsTest, MessagesAppendInstructionAndText) {
    std::vector<HistoryEntry> history{{"system", "summary"}, {"assistant", "previous"}};
    auto messages = prompts::buildMessages(history, Stage::Polish, "current text");

    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages[0], history[0]);
    EXPECT_EQ(messages[1], history[1]);
    EXPECT_EQ(messages[2].role, "system");
    EXPECT_EQ(messages[2].content, prompts::instructionFor(Stage::Polish));
    EXPECT_EQ(messages[3].role, "user");
    EXPECT_EQ(messages[3].content, "\n\ncurrent text");
}

TEST(PromptsTest, EveryStageHasDistinctInstruction) {
    EXPECT_FALSE(prompts::instructionFor(Stage::Polish).empty());
    EXPECT_NE(prompts::instructionFor(Stage::Polish), prompts::instructionFor(Stage::Enhance));
    EXPECT_NE(prompts::instructionFor(Stage::Polish), prompts::instructionFor(Stage::EmotionPolish));
    EXPECT_NE(prompts::compressionFor(Stage::EmotionPolish), prompts::compressionFor(Stage::Polish));
    EXPECT_EQ(prompts::compressionFor(Stage::Polish), prompts::compressionFor(Stage::Enhance));
}

TEST(SettingsTest, OverridesApplyFieldByField) {
    Settings settings;
    settings.enhance.model = "enhance.gguf";
    settings.enhance.apiKey = "default-key";
    settings.enhance.baseUrl = "http://default";

    ModelConfig overrides;
    overrides.model = "custom.gguf";
    ModelConfig resolved = settings.resolve(Stage::Enhance, overrides);
    EXPECT_EQ(resolved.model, "custom.gguf");
    EXPECT_EQ(resolved.apiKey, "default-key");
    EXPECT_EQ(resolved.baseUrl, "http://default");

    resolved = settings.resolve(Stage::Enhance, ModelConfig{});
    EXPECT_EQ(resolved.model, "enhance.gguf");
}

TEST(SettingsTest, ReadsEnvironment) {
    ::setenv("REDRAFT_MAX_CONCURRENT", "3", 1);
    ::setenv("REDRAFT_SEGMENT_MAX_SIZE", "120", 1);
    ::setenv("REDRAFT_POLISH_MODEL", "p.gguf", 1);
    ::unsetenv("REDRAFT_EMOTION_MODEL");
    ::setenv("REDRAFT_HISTORY_THRESHOLD", "not-a-number", 1);

    Settings settings = Settings::fromEnv();
    EXPECT_EQ(settings.maxConcurrent, 3);
    EXPECT_EQ(settings.maxSegmentSize, 120u);
    EXPECT_EQ(settings.polish.model, "p.gguf");
    EXPECT_EQ(settings.emotion.model, "p.gguf");
    EXPECT_EQ(settings.historyCompressionThreshold, 5000u);

    ::unsetenv("REDRAFT_MAX_CONCURRENT");
    ::unsetenv("REDRAFT_SEGMENT_MAX_SIZE");
    ::unsetenv("REDRAFT_POLISH_MODEL");
    ::unsetenv("REDRAFT_HISTORY_THRESHOLD");
}

}
}
