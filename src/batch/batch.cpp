#include "batch.hpp"
#include "container/container.hpp"
#include "video/video.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <variant>

namespace Batch {

namespace {

const std::string RULE(60, '=');
const std::string THIN_RULE(60, '-');

const std::string &ExtensionFor(const JobKind kind) {
    return kind == JobKind::Container ? CONTAINER_EXTENSION : Video::VIDEO_EXTENSION;
}

} // namespace

void Validate(const Options &options) {
    const double target = options.Normalization.TargetLoudness;
    if (!std::isfinite(target) || target < MIN_TARGET_LOUDNESS || target > MAX_TARGET_LOUDNESS) {
        throw std::invalid_argument(fmt::format("Invalid target LUFS: {}. Must be between {} and {}.", target,
                                                MIN_TARGET_LOUDNESS, MAX_TARGET_LOUDNESS));
    }

    const double strength = options.Normalization.DenoiseStrength;
    if (!std::isfinite(strength) || strength < 0.0 || strength > 1.0) {
        throw std::invalid_argument(
                fmt::format("Invalid denoise strength: {}. Must be between 0.0 and 1.0.", strength));
    }
}

BatchSummary Summarize(const std::vector<JobReport> &reports) {
    BatchSummary summary;
    for (const auto &report : reports) {
        ++summary.Jobs;
        switch (report.Status) {
        case JobStatus::Succeeded:
            ++summary.JobsSucceeded;
            break;
        case JobStatus::Failed:
            ++summary.JobsFailed;
            break;
        case JobStatus::Declined:
            ++summary.JobsDeclined;
            break;
        }

        for (const auto &asset : report.Assets) {
            ++summary.Assets;
            if (std::holds_alternative<Media::Success>(asset.Outcome)) {
                ++summary.AssetsSucceeded;
            } else if (std::holds_alternative<Media::Skipped>(asset.Outcome)) {
                ++summary.AssetsSkipped;
            } else {
                ++summary.AssetsFailed;
            }
        }
    }
    return summary;
}

std::vector<fs::path> FindInputs(const fs::path &dir, const std::string &extension) {
    std::vector<fs::path> files;
    if (!fs::is_directory(dir)) {
        return files;
    }
    for (const auto &entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && narratune::ToLower(entry.path().extension().string()) == extension) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

Runner::Runner(Options options, std::shared_ptr<spdlog::logger> log, ConfirmOverwrite confirm,
               const narratune::CancellationToken *token)
    : m_options(std::move(options)), m_log(std::move(log)), m_confirm(std::move(confirm)), m_token(token) {
}

JobReport Runner::RunPptx(const fs::path &input, const fs::path &output) {
    return RunJob(JobKind::Container, input, output);
}

JobReport Runner::RunVideo(const fs::path &input, const fs::path &output) {
    return RunJob(JobKind::Video, input, output);
}

BatchSummary Runner::RunPptxDirectory(const fs::path &inputDir, const fs::path &outputDir) {
    return RunDirectory(JobKind::Container, inputDir, outputDir);
}

BatchSummary Runner::RunVideoDirectory(const fs::path &inputDir, const fs::path &outputDir) {
    return RunDirectory(JobKind::Video, inputDir, outputDir);
}

JobReport Runner::RunJob(const JobKind kind, const fs::path &input, const fs::path &output) {
    JobReport report;
    report.Kind = kind;
    report.Input = input;
    report.Output = output;

    try {
        CheckCancelled();
        if (kind == JobKind::Container) {
            ProcessContainer(report);
        } else {
            ProcessVideo(report);
        }
    } catch (const narratune::Cancelled &) {
        throw;
    } catch (const std::exception &e) {
        report.Status = JobStatus::Failed;
        report.Error = e.what();
        m_log->error("Failed to process {}: {}", input.filename().string(), e.what());
    }

    m_reports.push_back(report);
    return report;
}

BatchSummary Runner::RunDirectory(const JobKind kind, const fs::path &inputDir, const fs::path &outputDir) {
    if (!fs::exists(inputDir)) {
        throw narratune::ValidationError(inputDir, "Input directory not found");
    }
    if (!fs::is_directory(inputDir)) {
        throw narratune::ValidationError(inputDir, "Input path is not a directory");
    }

    const auto &extension = ExtensionFor(kind);
    const auto inputs = FindInputs(inputDir, extension);
    if (inputs.empty()) {
        m_log->warn("No {} files found in: {}", extension, inputDir.string());
        return {};
    }

    m_log->info("Input Directory:  {}", inputDir.string());
    m_log->info("Output Directory: {}", outputDir.string());
    m_log->info("Found {} {} file(s) to process", inputs.size(), extension);
    fs::create_directories(outputDir);

    std::vector<JobReport> reports;
    reports.reserve(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        m_log->info(RULE);
        m_log->info("Processing file {}/{}: {}", i + 1, inputs.size(), inputs[i].filename().string());
        m_log->info(RULE);
        reports.push_back(RunJob(kind, inputs[i], outputDir / inputs[i].filename()));
    }

    const auto summary = Summarize(reports);
    LogSummary(summary);
    return summary;
}

void Runner::ProcessContainer(JobReport &report) {
    const auto &input = report.Input;
    const auto &output = report.Output;

    Container::Validate(input);
    if (!MayWrite(output)) {
        report.Status = JobStatus::Declined;
        m_log->info("Skipped (file exists): {}", output.string());
        return;
    }

    const narratune::ScratchDirectory scratch;
    m_log->info("Extracting: {}", input.filename().string());
    const auto extraction = Container::Extract(input, scratch.Path());
    m_log->info("Found {} audio file(s)", extraction.Index.AudioFiles.size());

    if (extraction.Index.AudioFiles.empty()) {
        m_log->warn("No audio files found in {}, copying it unchanged", input.filename().string());
        if (output.has_parent_path()) {
            fs::create_directories(output.parent_path());
        }
        const narratune::TempFile partial(narratune::PartialPath(output));
        fs::copy_file(input, partial.Path(), fs::copy_options::overwrite_existing);
        narratune::CommitOutput(partial.Path(), output);
        report.Copied = true;
        report.Status = JobStatus::Succeeded;
        m_log->info("Output written to: {}", output.string());
        return;
    }

    report.Assets = Media::NormalizeFiles(extraction.Index.AudioFiles, m_options.Normalization, *m_log, m_token);
    LogAssets(report.Assets);

    CheckCancelled();
    m_log->info("Repacking: {}", output.filename().string());
    Container::Repack(extraction.Root, extraction.Index, output);

    report.Status = JobStatus::Succeeded;
    m_log->info("Success! Output written to: {}", output.string());
}

void Runner::ProcessVideo(JobReport &report) {
    const auto &input = report.Input;
    const auto &output = report.Output;
    auto stage = Video::Stage::Probing;

    try {
        const auto info = Video::Validate(input);
        m_log->debug("{}: video {}, audio {}, {:.2f}s", input.filename().string(), info.VideoCodec, info.AudioCodec,
                     info.Duration);

        if (!MayWrite(output)) {
            report.Status = JobStatus::Declined;
            m_log->info("Skipped (file exists): {}", output.string());
            return;
        }

        const narratune::ScratchDirectory scratch;
        const auto wav = scratch.Path() / "extracted_audio.wav";

        stage = Video::Stage::ExtractingAudio;
        m_log->info("Extracting audio from: {}", input.filename().string());
        Video::ExtractAudio(input, wav);
        CheckCancelled();

        stage = Video::Stage::Normalizing;
        auto outcome = Media::NormalizeFile(wav, m_options.Normalization, *m_log);
        report.Assets.push_back({input.filename().string(), outcome});
        if (!std::holds_alternative<Media::Success>(outcome)) {
            throw std::runtime_error(fmt::format("Audio normalization did not succeed ({})", Media::Describe(outcome)));
        }
        CheckCancelled();

        stage = Video::Stage::Remuxing;
        m_log->info("Replacing audio in: {}", input.filename().string());
        Video::ReplaceAudio(input, wav, output);

        stage = Video::Stage::Done;
        report.Status = JobStatus::Succeeded;
        m_log->info("Success! Output written to: {}", output.string());
        m_log->info(THIN_RULE);
        m_log->info("Normalization: {}: {}", input.filename().string(), Media::Describe(outcome));
        m_log->info(THIN_RULE);
    } catch (const narratune::Cancelled &) {
        throw;
    } catch (const std::exception &e) {
        throw std::runtime_error(fmt::format("{} failed: {}", Video::ToString(stage), e.what()));
    }
}

bool Runner::MayWrite(const fs::path &output) const {
    if (m_options.Force || !fs::exists(output)) {
        return true;
    }
    return m_confirm && m_confirm(output);
}

void Runner::CheckCancelled() const {
    if (m_token) {
        m_token->ThrowIfCancelled();
    }
}

void Runner::LogAssets(const std::vector<Media::AssetReport> &assets) const {
    const auto normalized = static_cast<size_t>(std::count_if(assets.begin(), assets.end(), [](const auto &a) {
        return std::holds_alternative<Media::Success>(a.Outcome);
    }));

    m_log->info(THIN_RULE);
    if (normalized > 0) {
        m_log->info("Successfully normalized {} of {} audio file(s):", normalized, assets.size());
    } else {
        m_log->warn("No audio files were normalized.");
    }
    for (const auto &asset : assets) {
        m_log->info("  {}: {}", asset.Name, Media::Describe(asset.Outcome));
    }
    if (normalized < assets.size()) {
        m_log->warn("Skipped {} file(s) due to errors or unsupported formats.", assets.size() - normalized);
    }
    m_log->info(THIN_RULE);
}

void Runner::LogSummary(const BatchSummary &summary) const {
    m_log->info(RULE);
    m_log->info("Batch Processing Complete");
    m_log->info(RULE);
    m_log->info("Total files:            {}", summary.Jobs);
    m_log->info("Successfully processed: {}", summary.JobsSucceeded);
    if (summary.JobsDeclined > 0) {
        m_log->info("Not overwritten:        {}", summary.JobsDeclined);
    }
    if (summary.JobsFailed > 0) {
        m_log->info("Errors:                 {}", summary.JobsFailed);
    }
    m_log->info("Audio files:            {} normalized, {} skipped, {} failed", summary.AssetsSucceeded,
                summary.AssetsSkipped, summary.AssetsFailed);
    if (summary.AssetsSkipped > 0 || summary.AssetsFailed > 0 || summary.JobsFailed > 0) {
        m_log->warn("Some files were not fully processed; see the messages above.");
    }
}

} // namespace Batch
