/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "redraft/jobs.hpp"
#include "test_support.hpp"

namespace redraft {
namespace {

using namespace std::chrono_literals;

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

class JobsTest : public ::testing::Test {
protected:
    JobsTest() {
        settings_.maxConcurrent = 2;
        settings_.trivialThreshold = 3;
        settings_.maxDocumentBytes = 1000;
    }

    JobRequest request(const std::string& text, const std::string& mode = "paper_polish") {
        JobRequest req;
        req.text = text;
        req.mode = mode;
        return req;
    }

    Settings settings_;
    MemoryStore store_;
    test::FakeModel model_;
};

TEST_F(JobsTest, SubmitRejectsInvalidRequests) {
    Jobs jobs(store_, model_, settings_);

    auto empty = jobs.submit(request("   \n"));
    EXPECT_FALSE(empty.ok);
    EXPECT_EQ(empty.error, SubmissionError::InvalidContent);

    auto mode = jobs.submit(request("Some text.", "haiku"));
    EXPECT_FALSE(mode.ok);
    EXPECT_EQ(mode.error, SubmissionError::InvalidMode);

    auto big = jobs.submit(request(std::string(1001, 'a')));
    EXPECT_FALSE(big.ok);
    EXPECT_EQ(big.error, SubmissionError::InvalidSize);

    EXPECT_TRUE(store_.listJobs().empty());
    EXPECT_EQ(model_.callCount(), 0u);
}

TEST_F(JobsTest, SubmitRunsToCompletion) {
    Jobs jobs(store_, model_, settings_);

    JobRequest req = request("Alpha beta gamma.\nDelta epsilon zeta.", "paper_polish_enhance");
    req.overrides[Stage::Polish].model = "tiny.gguf";
    SubmitResult submitted = jobs.submit(req);
    ASSERT_TRUE(submitted.ok) << submitted.message;
    ASSERT_FALSE(submitted.id.empty());

    ASSERT_TRUE(jobs.wait(submitted.id, 5s));
    auto snapshot = jobs.status(submitted.id);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->job.status, JobStatus::Completed);
    EXPECT_EQ(snapshot->job.mode, ProcessingMode::PaperPolishEnhance);
    EXPECT_EQ(snapshot->completedSegments, 2u);
    EXPECT_FALSE(snapshot->queuePosition.has_value());

    EXPECT_EQ(jobs.result(submitted.id),
              std::optional<std::string>("R:R:Alpha beta gamma.\n\nR:R:Delta epsilon zeta."));
    EXPECT_EQ(model_.calls().front().model.model, "tiny.gguf");

    auto reports = jobs.reports();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].id, submitted.id);
    EXPECT_EQ(reports[0].status, JobStatus::Completed);
}

TEST_F(JobsTest, ExplicitIdsMustBeUnique) {
    Jobs jobs(store_, model_, settings_);
    JobRequest req = request("Alpha beta gamma.");
    req.id = "fixed";
    ASSERT_TRUE(jobs.submit(req).ok);
    ASSERT_TRUE(jobs.wait("fixed", 5s));

    auto again = jobs.submit(req);
    EXPECT_FALSE(again.ok);
    EXPECT_EQ(again.error, SubmissionError::Duplicate);
}

TEST_F(JobsTest, UnknownJobsReportNotFound) {
    Jobs jobs(store_, model_, settings_);
    EXPECT_FALSE(jobs.status("ghost").has_value());
    EXPECT_FALSE(jobs.result("ghost").has_value());
    EXPECT_EQ(jobs.stop("ghost").error, ControlError::NotFound);
    EXPECT_EQ(jobs.retry("ghost").error, ControlError::NotFound);
}

TEST_F(JobsTest, SubscriberSeesRunThroughCompletion) {
    test::Gate gate;
    model_.setHandler([&](const ChatRequest& request) {
        gate.wait();
        return RunResult::success("R:" + test::FakeModel::inputOf(request));
    });
    Jobs jobs(store_, model_, settings_);

    JobRequest req = request("Alpha beta gamma.\nDelta epsilon zeta.");
    req.id = "watched";
    auto subscription = jobs.subscribe("watched");
    ASSERT_TRUE(jobs.submit(req).ok);
    gate.open();

    auto events = test::collectUntilTerminal(*subscription);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().type, EventType::StageStarted);
    EXPECT_EQ(events.back().type, EventType::Completed);
    jobs.unsubscribe("watched", subscription);
    EXPECT_TRUE(subscription->closed());
}

TEST_F(JobsTest, StopWhileQueuedLeavesTheWaitQueue) {
    settings_.maxConcurrent = 1;
    test::Gate gate;
    model_.setHandler([&](const ChatRequest& request) {
        gate.wait();
        return RunResult::success("R:" + test::FakeModel::inputOf(request));
    });
    Jobs jobs(store_, model_, settings_);

    auto first = jobs.submit(request("Alpha beta gamma."));
    ASSERT_TRUE(first.ok);
    ASSERT_TRUE(gate.waitForWaiter(5s));

    auto second = jobs.submit(request("Delta epsilon zeta."));
    ASSERT_TRUE(second.ok);
    ASSERT_TRUE(eventually([&] { return jobs.admissionStatus().queueLength == 1; }));

    auto queued = jobs.status(second.id);
    ASSERT_TRUE(queued.has_value());
    EXPECT_EQ(queued->job.status, JobStatus::Queued);
    EXPECT_EQ(queued->queuePosition, std::optional<std::size_t>(1));
    EXPECT_EQ(queued->estimatedWaitSeconds, std::optional<std::size_t>(AdmissionController::kAverageJobSeconds));

    ControlResult stopped = jobs.stop(second.id);
    EXPECT_TRUE(stopped.ok) << stopped.message;
    ASSERT_TRUE(jobs.wait(second.id, 5s));
    EXPECT_EQ(jobs.status(second.id)->job.status, JobStatus::Stopped);
    EXPECT_EQ(jobs.status(second.id)->job.error, kStopMessage);

    gate.open();
    ASSERT_TRUE(jobs.wait(first.id, 5s));
    EXPECT_EQ(jobs.status(first.id)->job.status, JobStatus::Completed);
    EXPECT_EQ(model_.callCount(), 1u);
}

TEST_F(JobsTest, StoppedRunsReleaseControlState) {
    test::Gate gate;
    model_.setHandler([&](const ChatRequest& request) {
        gate.wait();
        return RunResult::success("R:" + test::FakeModel::inputOf(request));
    });
    Jobs jobs(store_, model_, settings_);

    auto submitted = jobs.submit(request("Alpha beta gamma.\nDelta epsilon zeta."));
    ASSERT_TRUE(submitted.ok);
    ASSERT_TRUE(gate.waitForWaiter(5s));
    ASSERT_TRUE(jobs.stop(submitted.id).ok);
    EXPECT_EQ(jobs.trackedRunCount(), 2u);

    gate.open();
    ASSERT_TRUE(jobs.wait(submitted.id, 5s));
    EXPECT_EQ(jobs.status(submitted.id)->job.status, JobStatus::Stopped);

    auto reports = jobs.reports();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].status, JobStatus::Stopped);
    EXPECT_EQ(jobs.trackedRunCount(), 0u);
}

TEST_F(JobsTest, StopRejectsFinishedJobs) {
    Jobs jobs(store_, model_, settings_);
    auto submitted = jobs.submit(request("Alpha beta gamma."));
    ASSERT_TRUE(submitted.ok);
    ASSERT_TRUE(jobs.wait(submitted.id, 5s));

    ControlResult result = jobs.stop(submitted.id);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, ControlError::InvalidState);
    EXPECT_EQ(jobs.retry(submitted.id).error, ControlError::InvalidState);
}

TEST_F(JobsTest, StopOfIdleQueuedJobIsImmediate) {
    Job job;
    job.id = "idle";
    job.originalText = "Alpha beta gamma.";
    job.mode = ProcessingMode::PaperPolish;
    ASSERT_TRUE(store_.createJob(job));

    Jobs jobs(store_, model_, settings_);
    auto subscription = jobs.subscribe("idle");
    ControlResult result = jobs.stop("idle");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(store_.loadJob("idle")->status, JobStatus::Stopped);
    EXPECT_EQ(jobs.trackedRunCount(), 0u);

    auto event = subscription->next(1s);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, EventType::Stopped);
}

TEST_F(JobsTest, RetryResumesFailedJob) {
    std::atomic<bool> fail{true};
    model_.setHandler([&](const ChatRequest& request) {
        std::string input = test::FakeModel::inputOf(request);
        if (input == "Delta epsilon zeta." && fail.exchange(false)) {
            return RunResult::failed(FailureKind::MissingContent, "empty choice");
        }
        return RunResult::success("R:" + input);
    });
    Jobs jobs(store_, model_, settings_);

    auto submitted = jobs.submit(request("Alpha beta gamma.\nDelta epsilon zeta.\nEta theta iota."));
    ASSERT_TRUE(submitted.ok);
    ASSERT_TRUE(jobs.wait(submitted.id, 5s));

    auto failed = jobs.status(submitted.id);
    ASSERT_EQ(failed->job.status, JobStatus::Failed);
    EXPECT_EQ(failed->job.failedSegmentIndex, std::optional<std::size_t>(1));
    EXPECT_EQ(failed->completedSegments, 1u);
    EXPECT_FALSE(jobs.result(submitted.id).has_value());

    ControlResult retried = jobs.retry(submitted.id);
    ASSERT_TRUE(retried.ok) << retried.message;
    ASSERT_TRUE(jobs.wait(submitted.id, 5s));

    auto done = jobs.status(submitted.id);
    EXPECT_EQ(done->job.status, JobStatus::Completed);
    EXPECT_TRUE(done->job.error.empty());
    EXPECT_EQ(done->completedSegments, 3u);
    EXPECT_EQ(model_.rewriteCalls().size(), 4u);
}

TEST_F(JobsTest, RecoverRelaunchesUnfinishedJobs) {
    for (auto status : {JobStatus::Queued, JobStatus::Processing, JobStatus::Failed}) {
        Job job;
        job.id = std::string("left_") + toString(status);
        job.originalText = "Alpha beta gamma.";
        job.mode = ProcessingMode::PaperPolish;
        job.status = status;
        ASSERT_TRUE(store_.createJob(job));
    }

    Jobs jobs(store_, model_, settings_);
    EXPECT_EQ(jobs.recover(), 2u);
    ASSERT_TRUE(jobs.wait("left_queued", 5s));
    ASSERT_TRUE(jobs.wait("left_processing", 5s));

    EXPECT_EQ(store_.loadJob("left_queued")->status, JobStatus::Completed);
    EXPECT_EQ(store_.loadJob("left_processing")->status, JobStatus::Completed);
    EXPECT_EQ(store_.loadJob("left_failed")->status, JobStatus::Failed);
}

TEST_F(JobsTest, ShutdownRequeuesInterruptedRuns) {
    test::Gate gate;
    model_.setHandler([&](const ChatRequest& request) {
        gate.wait();
        return RunResult::success("R:" + test::FakeModel::inputOf(request));
    });

    JobId id;
    {
        Jobs jobs(store_, model_, settings_);
        auto submitted = jobs.submit(request("Alpha beta gamma.\nDelta epsilon zeta."));
        ASSERT_TRUE(submitted.ok);
        id = submitted.id;
        ASSERT_TRUE(gate.waitForWaiter(5s));

        // The in-flight call finishes; the run stops at the next segment
        std::thread opener([&] {
            std::this_thread::sleep_for(50ms);
            gate.open();
        });
        jobs.shutdown();
        opener.join();

        EXPECT_EQ(jobs.submit(request("Late text.")).error, SubmissionError::ShuttingDown);
    }

    auto job = store_.loadJob(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Queued);
    EXPECT_EQ(job->error, "Interrupted by shutdown");

    Jobs restarted(store_, model_, settings_);
    EXPECT_EQ(restarted.recover(), 1u);
    ASSERT_TRUE(restarted.wait(id, 5s));
    EXPECT_EQ(store_.loadJob(id)->status, JobStatus::Completed);
    EXPECT_EQ(model_.rewriteCalls().size(), 2u);
}

TEST_F(JobsTest, ConcurrencyLimitCanChangeAtRuntime) {
    Jobs jobs(store_, model_, settings_);
    EXPECT_EQ(jobs.admissionStatus().limit, 2u);
    jobs.setConcurrencyLimit(4);
    EXPECT_EQ(jobs.admissionStatus().limit, 4u);
    jobs.setConcurrencyLimit(0);
    EXPECT_EQ(jobs.admissionStatus().limit, 1u);
}

}
}
