#pragma once

#include <string>
#include <vector>

namespace Transcode {

struct ProcessResult {
    int ExitCode = -1;
    std::string Out;
    std::string Err;
};

// Spawns argv[0] from PATH without a shell, stdin from /dev/null, and waits for it.
ProcessResult Run(const std::vector<std::string> &argv);

// Like Run, but a non-zero exit throws narratune::TranscodeError carrying the tool's stderr.
ProcessResult RunChecked(const std::vector<std::string> &argv);

} // namespace Transcode
