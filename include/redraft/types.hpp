#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace redraft {

// Job lifecycle states. Completed, Failed and Stopped are terminal;
// Failed and Stopped go back to Queued on retry.
enum class JobStatus : std::uint8_t { Queued, Processing, Completed, Failed, Stopped };

enum class SegmentStatus : std::uint8_t { Pending, Processing, Completed, Failed };

enum class Stage : std::uint8_t { Polish, Enhance, EmotionPolish };

enum class ProcessingMode : std::uint8_t { PaperPolish, PaperPolishEnhance, EmotionPolish };

// Opaque job identifier.
using JobId = std::string;

// Unique within a host: "<steady micros>_<pid>_<counter>".
[[nodiscard]] JobId generateJobId();

enum class SubmissionError : uint8_t {
    None = 0,
    IoError,
    InvalidContent,
    InvalidSize,
    InvalidMode,
    Duplicate,
    StoreError,
    ShuttingDown
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] const char* toString(SegmentStatus status) noexcept;
[[nodiscard]] const char* toString(Stage stage) noexcept;
[[nodiscard]] const char* toString(ProcessingMode mode) noexcept;

[[nodiscard]] std::optional<JobStatus> parseJobStatus(const std::string& value) noexcept;
[[nodiscard]] std::optional<SegmentStatus> parseSegmentStatus(const std::string& value) noexcept;
[[nodiscard]] std::optional<Stage> parseStage(const std::string& value) noexcept;
[[nodiscard]] std::optional<ProcessingMode> parseMode(const std::string& value) noexcept;

// Stages executed for a mode, in order.
[[nodiscard]] std::vector<Stage> stagesFor(ProcessingMode mode);

// Stages that write the first output slot (polish, emotion_polish) vs the second (enhance).
[[nodiscard]] inline bool writesSecondOutput(Stage stage) noexcept { return stage == Stage::Enhance; }

[[nodiscard]] inline bool isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed || status == JobStatus::Stopped;
}

} // namespace redraft
