#include "lib.hpp"

#include <algorithm>
#include <cctype>
#include <random>

namespace narratune {

ScratchDirectory::ScratchDirectory(const std::string &prefix) {
    const auto base = fs::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 gen(rd());

    for (int attempt = 0; attempt < 16; ++attempt) {
        auto candidate = base / fmt::format("{}{:016x}", prefix, gen());
        if (fs::create_directory(candidate)) {
            m_path = std::move(candidate);
            return;
        }
    }
    throw FileError(base, "Failed to create scratch directory");
}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

std::string FormatLufs(const double lufs) {
    return fmt::format("{:.1f} LUFS", lufs);
}

std::string FormatDb(const double db) {
    return fmt::format("{}{:.1f} dB", db > 0 ? "+" : "", db);
}

} // namespace narratune
