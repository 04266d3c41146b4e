#pragma once

#include "lib.hpp"
#include "media/media.hpp"

#include <functional>
#include <memory>
#include <spdlog/logger.h>
#include <string>
#include <vector>

namespace Batch {

static constexpr double MIN_TARGET_LOUDNESS = -70.0;
static constexpr double MAX_TARGET_LOUDNESS = 0.0;

inline const std::string CONTAINER_EXTENSION = ".pptx";

struct Options {
    Media::Options Normalization;
    bool Force = false;
    bool Verbose = false;
};

// Throws std::invalid_argument for a target or strength out of range.
void Validate(const Options &options);

enum class JobKind {
    Container,
    Video,
};

enum class JobStatus {
    Succeeded,
    Failed,
    Declined, // output existed and overwriting was refused
};

struct JobReport {
    JobKind Kind = JobKind::Container;
    fs::path Input;
    fs::path Output;
    JobStatus Status = JobStatus::Failed;
    std::string Error;
    bool Copied = false; // container without audio, written verbatim
    std::vector<Media::AssetReport> Assets;
};

struct BatchSummary {
    size_t Jobs = 0;
    size_t JobsSucceeded = 0;
    size_t JobsFailed = 0;
    size_t JobsDeclined = 0;
    size_t Assets = 0;
    size_t AssetsSucceeded = 0;
    size_t AssetsSkipped = 0;
    size_t AssetsFailed = 0;

    [[nodiscard]] int ExitCode() const { return JobsFailed == 0 ? 0 : 1; }
};

BatchSummary Summarize(const std::vector<JobReport> &reports);

// Regular files in dir with the given extension (case-insensitive), sorted by name.
std::vector<fs::path> FindInputs(const fs::path &dir, const std::string &extension);

// Asked before replacing an existing output unless Options::Force is set.
using ConfirmOverwrite = std::function<bool(const fs::path &)>;

class Runner {
public:
    Runner(Options options, std::shared_ptr<spdlog::logger> log, ConfirmOverwrite confirm = {},
           const narratune::CancellationToken *token = nullptr);

    JobReport RunPptx(const fs::path &input, const fs::path &output);

    JobReport RunVideo(const fs::path &input, const fs::path &output);

    // One output per input, same file name, in outputDir.
    BatchSummary RunPptxDirectory(const fs::path &inputDir, const fs::path &outputDir);

    BatchSummary RunVideoDirectory(const fs::path &inputDir, const fs::path &outputDir);

    [[nodiscard]] const std::vector<JobReport> &Reports() const { return m_reports; }

private:
    JobReport RunJob(JobKind kind, const fs::path &input, const fs::path &output);
    BatchSummary RunDirectory(JobKind kind, const fs::path &inputDir, const fs::path &outputDir);

    void ProcessContainer(JobReport &report);
    void ProcessVideo(JobReport &report);

    bool MayWrite(const fs::path &output) const;
    void CheckCancelled() const;
    void LogAssets(const std::vector<Media::AssetReport> &assets) const;
    void LogSummary(const BatchSummary &summary) const;

    Options m_options;
    std::shared_ptr<spdlog::logger> m_log;
    ConfirmOverwrite m_confirm;
    const narratune::CancellationToken *m_token;
    std::vector<JobReport> m_reports;
};

} // namespace Batch
