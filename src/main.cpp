#include "audio/audio.hpp"
#include "batch/batch.hpp"
#include "lib.hpp"
#include "transcode/transcode.hpp"

#include <CLI/CLI.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

#define RET_OK 0
#define RET_ERROR 1
#define RET_CANCELLED 130

namespace {

struct JobArgs {
    fs::path input, output;
    fs::path input_dir, output_dir;
};

JobArgs pptx_opts, video_opts;

Batch::Options batch_opts;

narratune::CancellationToken cancel_token;

extern "C" void OnInterrupt(int) {
    cancel_token.Cancel();
}

void AddJobOptions(CLI::App *cmd, JobArgs &args, const std::string &what) {
    cmd->add_option("input", args.input, fmt::format("Input {} file", what));
    cmd->add_option("output", args.output, fmt::format("Output {} file", what));
    cmd->add_option("--input-dir", args.input_dir, fmt::format("Directory of {} files to process", what));
    cmd->add_option("--output-dir", args.output_dir, "Directory for processed files");
}

void AddSharedOptions(CLI::App *cmd, bool &strength_given) {
    cmd->add_option("--target-lufs", batch_opts.Normalization.TargetLoudness, "Target loudness in LUFS")
        ->default_val(-16.0);
    cmd->add_flag("--denoise", batch_opts.Normalization.Denoise, "Apply noise reduction before normalization");
    cmd->add_option_function<double>(
           "--denoise-strength",
           [&strength_given](const double v) {
               batch_opts.Normalization.DenoiseStrength = v;
               strength_given = true;
           },
           "Noise reduction strength (0.0 - 1.0)")
        ->default_str("0.5");
    cmd->add_flag("-f,--force", batch_opts.Force, "Overwrite existing output files without asking");
    cmd->add_flag("-v,--verbose", batch_opts.Verbose, "Debug logging");
}

// Either both positionals or both directories, never a mix.
bool CheckJobArgs(const JobArgs &args, spdlog::logger &log) {
    const bool single = !args.input.empty() || !args.output.empty();
    const bool batch = !args.input_dir.empty() || !args.output_dir.empty();
    if (single && batch) {
        log.error("Give either <input> <output> or --input-dir/--output-dir, not both.");
        return false;
    }
    if (batch && (args.input_dir.empty() || args.output_dir.empty())) {
        log.error("--input-dir and --output-dir must be used together.");
        return false;
    }
    if (!batch && (args.input.empty() || args.output.empty())) {
        log.error("Both <input> and <output> are required.");
        return false;
    }
    return true;
}

bool AskOverwrite(const fs::path &path) {
    std::cerr << fmt::format("Output file exists: {}\nOverwrite? (y/n): ", path.string()) << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    answer = narratune::ToLower(answer);
    return answer == "y" || answer == "yes";
}

spdlog::level::level_enum ParseLevel(const std::string &name, spdlog::logger &log) {
    const auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off") {
        log.warn("Unknown log level '{}', defaulting to 'info'.", name);
        return spdlog::level::info;
    }
    return lvl;
}

void PrintBanner(spdlog::logger &log, const std::string &mode) {
    log.info("narratune - narration loudness normalizer ({})", mode);
    log.info("Target loudness: {}", narratune::FormatLufs(batch_opts.Normalization.TargetLoudness));
    if (batch_opts.Normalization.Denoise) {
        log.info("Noise reduction: enabled (strength {:.2f})", batch_opts.Normalization.DenoiseStrength);
    } else {
        log.info("Noise reduction: disabled");
    }
}

void PrintInstallHints(spdlog::logger &log) {
    log.error("ffmpeg is required but could not be run.");
    log.error("Install it with your package manager, for example:");
    log.error("  Debian/Ubuntu: sudo apt install ffmpeg");
    log.error("  Fedora:        sudo dnf install ffmpeg");
    log.error("  macOS:         brew install ffmpeg");
}

} // namespace

int main(const int argc, char **argv) {
    const auto log = spdlog::stderr_color_mt("narratune");
    log->set_pattern("[%^%l%$] %v");

    CLI::App app{"Normalize narration loudness in presentations and videos"};

    std::string log_level = "info";
    app.add_option("--loglevel", log_level, "(trace, debug, info, warn, error, critical, off)")
        ->default_val("info");

    bool strength_given = false;

    const auto subcmd_pptx = app.add_subcommand("pptx", "Normalize audio embedded in .pptx files")->fallthrough();
    AddJobOptions(subcmd_pptx, pptx_opts, ".pptx");
    AddSharedOptions(subcmd_pptx, strength_given);

    const auto subcmd_video = app.add_subcommand("video", "Normalize the audio track of .mp4 files")->fallthrough();
    AddJobOptions(subcmd_video, video_opts, ".mp4");
    AddSharedOptions(subcmd_video, strength_given);

    try {
        app.require_subcommand(1);
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        if (e.get_exit_code() != static_cast<int>(CLI::ExitCodes::Success)) {
            std::cerr << app.help() << std::endl;
        }
        return app.exit(e);
    }

    auto lvl = ParseLevel(log_level, *log);
    if (batch_opts.Verbose && lvl > spdlog::level::debug) {
        lvl = spdlog::level::debug;
    }
    log->set_level(lvl);
    Audio::Initialize(lvl);

    const bool is_pptx = subcmd_pptx->parsed();
    const auto &args = is_pptx ? pptx_opts : video_opts;
    if (!CheckJobArgs(args, *log)) {
        return RET_ERROR;
    }

    try {
        Batch::Validate(batch_opts);
    } catch (const std::invalid_argument &e) {
        log->error(e.what());
        return RET_ERROR;
    }
    if (strength_given && !batch_opts.Normalization.Denoise) {
        log->warn("--denoise-strength has no effect without --denoise");
    }

    try {
        Transcode::EnsureAvailable();
    } catch (const std::exception &e) {
        log->debug(e.what());
        PrintInstallHints(*log);
        return RET_ERROR;
    }

    PrintBanner(*log, is_pptx ? "pptx" : "video");
    std::signal(SIGINT, OnInterrupt);

    int ret = RET_OK;
    try {
        Batch::Runner runner(batch_opts, log, AskOverwrite, &cancel_token);
        if (!args.input_dir.empty()) {
            const auto summary = is_pptx ? runner.RunPptxDirectory(args.input_dir, args.output_dir)
                                         : runner.RunVideoDirectory(args.input_dir, args.output_dir);
            ret = summary.ExitCode();
        } else {
            const auto report = is_pptx ? runner.RunPptx(args.input, args.output)
                                        : runner.RunVideo(args.input, args.output);
            ret = report.Status == Batch::JobStatus::Failed ? RET_ERROR : RET_OK;
        }
    } catch (const narratune::Cancelled &e) {
        log->warn(e.what());
        ret = RET_CANCELLED;
    } catch (const std::exception &e) {
        log->error(e.what());
        ret = RET_ERROR;
    }

    // a tool killed by the same interrupt reports a plain failure
    if (cancel_token.IsCancelled()) {
        ret = RET_CANCELLED;
    }
    return ret;
}
