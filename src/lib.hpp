#pragma once

#include <atomic>
#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace narratune {
class FileError : public std::exception {
public:
    FileError(const fs::path &path, const std::string &message) {
        m_msg = fmt::format("{} (while opening: {})", message, path.string());
    }

    [[nodiscard]] const char *what() const noexcept override {
        return m_msg.c_str();
    }

private:
    std::string m_msg;
};

// Bad input path, wrong format or a missing stream.
class ValidationError final : public FileError {
public:
    using FileError::FileError;
};

// Archive unreadable, not a ZIP, or unsafe entry names.
class ContainerIntegrityError final : public FileError {
public:
    using FileError::FileError;
};

// External tool exited with a non-zero status.
class TranscodeError final : public std::exception {
public:
    TranscodeError(const std::string &program, const int exitCode, const std::string &output) {
        m_msg = fmt::format("{} exited with status {}", program, exitCode);
        if (!output.empty()) {
            m_msg += fmt::format(": {}", output);
        }
    }

    [[nodiscard]] const char *what() const noexcept override {
        return m_msg.c_str();
    }

private:
    std::string m_msg;
};

class Cancelled final : public std::exception {
public:
    [[nodiscard]] const char *what() const noexcept override {
        return "Operation cancelled by user";
    }
};

class CancellationToken {
public:
    void Cancel() noexcept { m_cancelled.store(true); }

    [[nodiscard]] bool IsCancelled() const noexcept { return m_cancelled.load(); }

    void ThrowIfCancelled() const {
        if (IsCancelled()) {
            throw Cancelled();
        }
    }

private:
    std::atomic<bool> m_cancelled{false};
};

// Unique directory under the system temp dir, removed with everything in it on destruction.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string &prefix = "narratune_");
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory &) = delete;
    ScratchDirectory &operator=(const ScratchDirectory &) = delete;

    [[nodiscard]] const fs::path &Path() const noexcept { return m_path; }

private:
    fs::path m_path;
};

// Removes the file at its path when it goes out of scope, whether or not it was ever written.
class TempFile {
public:
    explicit TempFile(fs::path path) : m_path(std::move(path)) {}

    ~TempFile() {
        std::error_code ec;
        fs::remove(m_path, ec);
    }

    TempFile(const TempFile &) = delete;
    TempFile &operator=(const TempFile &) = delete;

    [[nodiscard]] const fs::path &Path() const noexcept { return m_path; }

private:
    fs::path m_path;
};

// "<stem>.partial<ext>" beside the final path, so the muxer still sees the right extension.
inline fs::path PartialPath(const fs::path &path) {
    auto partial = path;
    partial.replace_filename(fmt::format("{}.partial{}", path.stem().string(), path.extension().string()));
    return partial;
}

// Moves a finished temporary output onto its final path.
inline void CommitOutput(const fs::path &partial, const fs::path &final) {
    std::error_code ec;
    fs::rename(partial, final, ec);
    if (ec) {
        fs::remove(partial, ec);
        throw FileError(final, fmt::format("Failed to move finished output into place: {}", ec.message()));
    }
}

std::string ToLower(std::string s);

std::string FormatLufs(double lufs);

std::string FormatDb(double db);

} // namespace narratune
