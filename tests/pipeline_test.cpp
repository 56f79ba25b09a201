/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <thread>

#include "redraft/pipeline.hpp"
#include "redraft/prompts.hpp"
#include "test_support.hpp"

namespace redraft {
namespace {

using namespace std::chrono_literals;

const std::string kTwelve = "一二三四五六七八九十百千";
const std::string kFifteen = "一二三四五六七八九十百千万亿兆";

bool isStage(const ChatRequest& request, Stage stage) {
    return request.messages.size() >= 2 &&
           request.messages[request.messages.size() - 2].content == prompts::instructionFor(stage);
}

std::size_t countCallsFor(const test::FakeModel& model, const std::string& input) {
    auto calls = model.rewriteCalls();
    return static_cast<std::size_t>(std::count_if(calls.begin(), calls.end(), [&](const ChatRequest& call) {
        return test::FakeModel::inputOf(call) == input;
    }));
}

std::vector<Event> drain(Subscription& subscription) {
    std::vector<Event> events;
    while (auto event = subscription.next(1ms)) {
        events.push_back(*event);
    }
    return events;
}

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest() : admission_(2), events_(1024) {
        settings_.trivialThreshold = 3;
        settings_.maxSegmentSize = 500;
        settings_.historyCompressionThreshold = 5000;
        settings_.polish.model = "polish.gguf";
        settings_.enhance.model = "enhance.gguf";
        settings_.compression.model = "compress.gguf";
    }

    PipelineRunner& runner() {
        if (!runner_) {
            runner_ = std::make_unique<PipelineRunner>(store_, admission_, events_, model_, settings_);
        }
        return *runner_;
    }

    JobId addJob(const std::string& text, ProcessingMode mode = ProcessingMode::PaperPolish) {
        Job job;
        job.id = "job" + std::to_string(++counter_);
        job.originalText = text;
        job.mode = mode;
        job.currentStage = stagesFor(mode).front();
        job.createdAt = std::chrono::system_clock::now();
        EXPECT_TRUE(store_.createJob(job));
        return job.id;
    }

    // What Jobs::retry does to the record before relaunching
    void requeue(const JobId& id) {
        auto job = store_.loadJob(id);
        ASSERT_TRUE(job.has_value());
        job->status = JobStatus::Queued;
        ASSERT_TRUE(store_.saveJob(*job));
    }

    Job job(const JobId& id) { return store_.loadJob(id).value(); }

    Settings settings_;
    MemoryStore store_;
    AdmissionController admission_;
    EventBroadcaster events_;
    test::FakeModel model_;
    CancelToken token_;
    std::unique_ptr<PipelineRunner> runner_;
    int counter_ = 0;
};

TEST_F(PipelineTest, SingleStageRunCompletesEverySegment) {
    JobId id = addJob("Alpha beta gamma.\n\nDelta epsilon zeta.\nEta theta iota.");
    auto subscription = events_.subscribe(id);

    RunOutcome outcome = runner().run(id, token_);
    EXPECT_EQ(outcome.status, JobStatus::Completed);

    Job done = job(id);
    EXPECT_EQ(done.status, JobStatus::Completed);
    EXPECT_DOUBLE_EQ(done.progress, 100.0);
    EXPECT_EQ(done.totalSegments, 3u);
    EXPECT_FALSE(done.failedSegmentIndex.has_value());
    EXPECT_TRUE(done.completedAt.has_value());

    auto segments = store_.loadSegments(id);
    ASSERT_EQ(segments.size(), 3u);
    for (const auto& segment : segments) {
        EXPECT_EQ(segment.status, SegmentStatus::Completed);
        EXPECT_EQ(segment.firstOutput, "R:" + segment.originalText);
    }
    EXPECT_EQ(assembleOutput(segments, done.mode),
              "R:Alpha beta gamma.\n\nR:Delta epsilon zeta.\n\nR:Eta theta iota.");
    EXPECT_EQ(store_.loadChanges(id).size(), 3u);
    EXPECT_EQ(admission_.activeCount(), 0u);

    auto events = drain(*subscription);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().type, EventType::StageStarted);
    EXPECT_EQ(events.back().type, EventType::Completed);
    EXPECT_EQ(std::count_if(events.begin(), events.end(),
                            [](const Event& e) { return e.type == EventType::Content; }), 3);
}

TEST_F(PipelineTest, EachCallCarriesEarlierOutputsAsHistory) {
    JobId id = addJob("Alpha beta gamma.\nDelta epsilon zeta.\nEta theta iota.");
    ASSERT_EQ(runner().run(id, token_).status, JobStatus::Completed);

    auto calls = model_.rewriteCalls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].messages.size(), 2u);
    ASSERT_EQ(calls[2].messages.size(), 4u);
    EXPECT_EQ(calls[2].messages[0].role, "assistant");
    EXPECT_EQ(calls[2].messages[0].content, "R:Alpha beta gamma.");
    EXPECT_EQ(calls[2].messages[1].content, "R:Delta epsilon zeta.");
    EXPECT_EQ(calls[2].model.model, "polish.gguf");
    EXPECT_FLOAT_EQ(calls[2].temperature, settings_.temperature);
}

TEST_F(PipelineTest, FailedSegmentIsRecordedAndRetryResumesThere) {
    std::atomic<bool> failDelta{true};
    model_.setHandler([&](const ChatRequest& request) {
        std::string input = test::FakeModel::inputOf(request);
        if (input == "Delta epsilon zeta." && failDelta.exchange(false)) {
            return RunResult::failed(FailureKind::Transport, "connection refused");
        }
        return RunResult::success("R:" + input);
    });

    JobId id = addJob("Alpha beta gamma.\nDelta epsilon zeta.\nEta theta iota.");
    auto subscription = events_.subscribe(id);

    RunOutcome outcome = runner().run(id, token_);
    EXPECT_EQ(outcome.status, JobStatus::Failed);

    Job failed = job(id);
    EXPECT_EQ(failed.status, JobStatus::Failed);
    ASSERT_TRUE(failed.failedSegmentIndex.has_value());
    EXPECT_EQ(*failed.failedSegmentIndex, 1u);
    EXPECT_EQ(failed.error, "Segment 2 failed in polish stage: connection refused");
    EXPECT_EQ(admission_.activeCount(), 0u);

    auto segments = store_.loadSegments(id);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0].status, SegmentStatus::Completed);
    EXPECT_EQ(segments[1].status, SegmentStatus::Failed);
    EXPECT_EQ(segments[2].status, SegmentStatus::Pending);
    EXPECT_EQ(std::count_if(segments.begin(), segments.end(),
                            [](const Segment& s) { return s.status == SegmentStatus::Failed; }), 1);

    auto events = drain(*subscription);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, EventType::Failed);
    EXPECT_EQ(events.back().segmentIndex, std::optional<std::size_t>(1));

    requeue(id);
    outcome = runner().run(id, token_);
    EXPECT_EQ(outcome.status, JobStatus::Completed);

    EXPECT_EQ(countCallsFor(model_, "Alpha beta gamma."), 1u);
    EXPECT_EQ(countCallsFor(model_, "Delta epsilon zeta."), 2u);
    EXPECT_EQ(countCallsFor(model_, "Eta theta iota."), 1u);

    // The resumed call still sees the output of the segment before it
    auto calls = model_.rewriteCalls();
    const ChatRequest& resumed = calls[calls.size() - 2];
    ASSERT_EQ(test::FakeModel::inputOf(resumed), "Delta epsilon zeta.");
    ASSERT_EQ(resumed.messages.size(), 3u);
    EXPECT_EQ(resumed.messages[0].content, "R:Alpha beta gamma.");

    Job done = job(id);
    EXPECT_EQ(done.status, JobStatus::Completed);
    EXPECT_FALSE(done.failedSegmentIndex.has_value());
    for (const auto& segment : store_.loadSegments(id)) {
        EXPECT_EQ(segment.status, SegmentStatus::Completed);
    }
}

TEST_F(PipelineTest, TwoStageRetrySkipsFinishedWork) {
    std::atomic<bool> failEnhance{true};
    model_.setHandler([&](const ChatRequest& request) {
        std::string input = test::FakeModel::inputOf(request);
        if (isStage(request, Stage::Enhance)) {
            if (input == "R:Second paragraph here." && failEnhance.exchange(false)) {
                return RunResult::failed(FailureKind::Status, "HTTP 500: overloaded");
            }
            return RunResult::success("E:" + input);
        }
        return RunResult::success("R:" + input);
    });

    JobId id = addJob("First paragraph here.\nSecond paragraph here.", ProcessingMode::PaperPolishEnhance);
    ASSERT_EQ(runner().run(id, token_).status, JobStatus::Failed);

    Job failed = job(id);
    EXPECT_EQ(failed.currentStage, Stage::Enhance);
    EXPECT_EQ(failed.failedSegmentIndex, std::optional<std::size_t>(1));
    EXPECT_EQ(failed.error, "Segment 2 failed in enhance stage: HTTP 500: overloaded");
    EXPECT_GE(failed.progress, 50.0);
    EXPECT_EQ(model_.rewriteCalls().size(), 4u);

    requeue(id);
    ASSERT_EQ(runner().run(id, token_).status, JobStatus::Completed);

    // Only the failed enhance call is repeated
    EXPECT_EQ(model_.rewriteCalls().size(), 5u);
    EXPECT_EQ(countCallsFor(model_, "First paragraph here."), 1u);
    EXPECT_EQ(countCallsFor(model_, "Second paragraph here."), 1u);
    EXPECT_EQ(countCallsFor(model_, "R:Second paragraph here."), 2u);

    auto segments = store_.loadSegments(id);
    EXPECT_EQ(assembleOutput(segments, ProcessingMode::PaperPolishEnhance),
              "E:R:First paragraph here.\n\nE:R:Second paragraph here.");
    EXPECT_EQ(segments[1].firstOutput, std::optional<std::string>("R:Second paragraph here."));
    EXPECT_EQ(store_.loadChanges(id).size(), 4u);
}

TEST_F(PipelineTest, EnhanceUsesPolishedTextAndItsOwnModel) {
    JobId id = addJob("Only paragraph in the document.", ProcessingMode::PaperPolishEnhance);
    ASSERT_EQ(runner().run(id, token_).status, JobStatus::Completed);

    auto calls = model_.rewriteCalls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_TRUE(isStage(calls[0], Stage::Polish));
    EXPECT_EQ(calls[0].model.model, "polish.gguf");
    EXPECT_TRUE(isStage(calls[1], Stage::Enhance));
    EXPECT_EQ(calls[1].model.model, "enhance.gguf");
    EXPECT_EQ(test::FakeModel::inputOf(calls[1]), "R:Only paragraph in the document.");
}

TEST_F(PipelineTest, JobOverridesReplaceStageModel) {
    Job seed;
    seed.id = "custom";
    seed.originalText = "Some text to rewrite.";
    seed.mode = ProcessingMode::EmotionPolish;
    seed.currentStage = Stage::EmotionPolish;
    seed.overrides[Stage::EmotionPolish].model = "warm.gguf";
    ASSERT_TRUE(store_.createJob(seed));

    ASSERT_EQ(runner().run("custom", token_).status, JobStatus::Completed);
    auto calls = model_.rewriteCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].model.model, "warm.gguf");
    EXPECT_TRUE(isStage(calls[0], Stage::EmotionPolish));
}

TEST_F(PipelineTest, TrivialSegmentsPassThroughWithoutCalls) {
    JobId id = addJob("1.\nA real paragraph.\nII", ProcessingMode::PaperPolishEnhance);
    ASSERT_EQ(runner().run(id, token_).status, JobStatus::Completed);

    EXPECT_EQ(model_.rewriteCalls().size(), 2u);
    auto segments = store_.loadSegments(id);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_TRUE(segments[0].trivial);
    EXPECT_EQ(segments[0].firstOutput, std::optional<std::string>("1."));
    EXPECT_EQ(segments[0].secondOutput, std::optional<std::string>("1."));
    EXPECT_EQ(segments[0].status, SegmentStatus::Completed);
    EXPECT_FALSE(segments[1].trivial);
    EXPECT_TRUE(segments[2].trivial);
    EXPECT_EQ(assembleOutput(segments, ProcessingMode::PaperPolishEnhance),
              "1.\n\nR:R:A real paragraph.\n\nII");
}

TEST_F(PipelineTest, HistoryIsCompressedPastThreshold) {
    settings_.historyCompressionThreshold = 20;
    model_.setHandler([&](const ChatRequest& request) {
        if (test::FakeModel::isCompression(request)) {
            return RunResult::success("formal tone");
        }
        std::string input = test::FakeModel::inputOf(request);
        if (input == "第一段内容。") return RunResult::success(kTwelve);
        if (input == "第二段内容。") return RunResult::success(kFifteen);
        return RunResult::success("三");
    });

    JobId id = addJob("第一段内容。\n第二段内容。\n第三段内容。");
    auto subscription = events_.subscribe(id);
    ASSERT_EQ(runner().run(id, token_).status, JobStatus::Completed);

    auto rewrites = model_.rewriteCalls();
    ASSERT_EQ(rewrites.size(), 3u);

    // Second call: one raw entry (size 12, under the threshold)
    ASSERT_EQ(rewrites[1].messages.size(), 3u);
    EXPECT_EQ(rewrites[1].messages[0].role, "assistant");

    // Third call: 12 + 15 crossed the threshold, so one summary replaces both
    ASSERT_EQ(rewrites[2].messages.size(), 3u);
    EXPECT_EQ(rewrites[2].messages[0].role, "system");
    EXPECT_EQ(rewrites[2].messages[0].content, std::string(prompts::kSummaryPrefix) + "formal tone");

    std::vector<ChatRequest> compressions;
    for (const auto& call : model_.calls()) {
        if (test::FakeModel::isCompression(call)) compressions.push_back(call);
    }
    ASSERT_EQ(compressions.size(), 1u);
    EXPECT_EQ(compressions[0].model.model, "compress.gguf");
    EXPECT_EQ(compressions[0].messages[0].content, prompts::compressionFor(Stage::Polish));
    EXPECT_NE(compressions[0].messages[1].content.find(kTwelve + Compressor::kSeparator + kFifteen),
              std::string::npos);

    auto stored = store_.loadHistory(id, Stage::Polish);
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->compressed);
    ASSERT_EQ(stored->entries.size(), 1u);

    auto events = drain(*subscription);
    EXPECT_EQ(std::count_if(events.begin(), events.end(),
                            [](const Event& e) { return e.type == EventType::HistoryCompressed; }), 1);
}

TEST_F(PipelineTest, CompressionFailureFailsTriggeringSegment) {
    settings_.historyCompressionThreshold = 20;
    model_.setHandler([&](const ChatRequest& request) {
        if (test::FakeModel::isCompression(request)) {
            return RunResult::failed(FailureKind::Transport, "timeout");
        }
        std::string input = test::FakeModel::inputOf(request);
        return RunResult::success(input == "第一段内容。" ? kTwelve : kFifteen);
    });

    JobId id = addJob("第一段内容。\n第二段内容。\n第三段内容。");
    ASSERT_EQ(runner().run(id, token_).status, JobStatus::Failed);

    Job failed = job(id);
    EXPECT_EQ(failed.failedSegmentIndex, std::optional<std::size_t>(1));
    EXPECT_EQ(failed.error, "Segment 2 failed in polish stage: history compression failed: timeout");
    EXPECT_EQ(store_.loadSegments(id)[1].status, SegmentStatus::Failed);
}

TEST_F(PipelineTest, LongErrorsAreTruncated) {
    settings_.errorMaxLength = 40;
    model_.setHandler([](const ChatRequest&) {
        return RunResult::failed(FailureKind::Status, std::string(500, 'x'));
    });

    JobId id = addJob("Some paragraph to rewrite.");
    ASSERT_EQ(runner().run(id, token_).status, JobStatus::Failed);

    Job failed = job(id);
    EXPECT_EQ(failed.error.size(), 43u);
    EXPECT_EQ(failed.error.substr(0, 10), "Segment 1 ");
    EXPECT_EQ(failed.error.substr(40), "...");
}

TEST_F(PipelineTest, StopTakesEffectAtNextSegment) {
    model_.setHandler([&](const ChatRequest& request) {
        token_.cancel();
        return RunResult::success("R:" + test::FakeModel::inputOf(request));
    });

    JobId id = addJob("Alpha beta gamma.\nDelta epsilon zeta.\nEta theta iota.");
    auto subscription = events_.subscribe(id);
    RunOutcome outcome = runner().run(id, token_);
    EXPECT_EQ(outcome.status, JobStatus::Stopped);
    EXPECT_EQ(outcome.message, kStopMessage);

    Job stopped = job(id);
    EXPECT_EQ(stopped.status, JobStatus::Stopped);
    EXPECT_EQ(stopped.error, kStopMessage);
    EXPECT_FALSE(stopped.failedSegmentIndex.has_value());
    EXPECT_EQ(admission_.activeCount(), 0u);

    auto segments = store_.loadSegments(id);
    EXPECT_EQ(segments[0].status, SegmentStatus::Completed);
    EXPECT_EQ(segments[1].status, SegmentStatus::Pending);
    EXPECT_EQ(drain(*subscription).back().type, EventType::Stopped);

    // Resume: the finished segment is not sent again
    model_.setHandler(nullptr);
    token_.reset();
    requeue(id);
    ASSERT_EQ(runner().run(id, token_).status, JobStatus::Completed);
    EXPECT_EQ(countCallsFor(model_, "Alpha beta gamma."), 1u);
    EXPECT_EQ(model_.rewriteCalls().size(), 3u);

    // Skipped work still shows up as context for the segments after it
    auto calls = model_.rewriteCalls();
    ASSERT_EQ(calls[1].messages.size(), 3u);
    EXPECT_EQ(calls[1].messages[0].content, "R:Alpha beta gamma.");
}

TEST_F(PipelineTest, CancelWhileWaitingForSlotStopsWithoutWork) {
    AdmissionController tight(1);
    PipelineRunner runner(store_, tight, events_, model_, settings_);
    ASSERT_TRUE(tight.acquire("someone-else"));

    JobId id = addJob("Alpha beta gamma.");
    RunOutcome outcome;
    std::thread worker([&] { outcome = runner.run(id, token_); });

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (tight.status().queueLength == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(tight.status(JobId(id)).position, std::optional<std::size_t>(1));

    token_.cancel();
    tight.interrupt();
    worker.join();

    EXPECT_EQ(outcome.status, JobStatus::Stopped);
    EXPECT_EQ(job(id).status, JobStatus::Stopped);
    EXPECT_EQ(model_.callCount(), 0u);
    EXPECT_EQ(tight.activeCount(), 1u);
    tight.release("someone-else");
}

TEST_F(PipelineTest, UnknownJobFails) {
    RunOutcome outcome = runner().run("nope", token_);
    EXPECT_EQ(outcome.status, JobStatus::Failed);
    EXPECT_NE(outcome.message.find("nope"), std::string::npos);
}

TEST_F(PipelineTest, ProgressNeverDecreasesWithinRun) {
    JobId id = addJob("Alpha beta gamma.\nDelta epsilon zeta.\nEta theta iota.\nIota kappa lambda.",
                      ProcessingMode::PaperPolishEnhance);
    auto subscription = events_.subscribe(id);
    ASSERT_EQ(runner().run(id, token_).status, JobStatus::Completed);

    double last = 0.0;
    std::vector<double> seen;
    for (const auto& event : drain(*subscription)) {
        if (event.type != EventType::Progress) continue;
        EXPECT_GE(event.progress, last);
        last = event.progress;
        seen.push_back(event.progress);
    }
    EXPECT_EQ(seen, (std::vector<double>{0.0, 12.5, 25.0, 37.5, 50.0, 62.5, 75.0, 87.5}));
}

TEST(ProgressFormulaTest, SplitsEvenlyAcrossStages) {
    EXPECT_DOUBLE_EQ(PipelineRunner::progressFor(0, 1, 3, 4), 75.0);
    EXPECT_DOUBLE_EQ(PipelineRunner::progressFor(0, 2, 1, 2), 25.0);
    EXPECT_DOUBLE_EQ(PipelineRunner::progressFor(1, 2, 0, 4), 50.0);
    EXPECT_DOUBLE_EQ(PipelineRunner::progressFor(1, 2, 2, 4), 75.0);
    EXPECT_DOUBLE_EQ(PipelineRunner::progressFor(0, 1, 0, 0), 0.0);
}

TEST(SegmentErrorTest, UsesOneBasedIndexAndStageName) {
    EXPECT_EQ(PipelineRunner::segmentError(0, Stage::EmotionPolish, "bad gateway", 500),
              "Segment 1 failed in emotion_polish stage: bad gateway");
}

}
}
