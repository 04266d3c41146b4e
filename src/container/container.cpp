#include "container.hpp"
#include "media/media.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>
#include <set>
#include <zip.h>

namespace Container {

namespace {

struct ZipDeleter {
    void operator()(zip_t *zip) const { zip_discard(zip); }
};
using ZipPtr = std::unique_ptr<zip_t, ZipDeleter>;

struct ZipFileDeleter {
    void operator()(zip_file_t *file) const { zip_fclose(file); }
};
using ZipFilePtr = std::unique_ptr<zip_file_t, ZipFileDeleter>;

std::string ZipErrorString(const int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string msg = zip_error_strerror(&error);
    zip_error_fini(&error);
    return msg;
}

ZipPtr OpenArchive(const fs::path &path, const int flags) {
    int code = 0;
    zip_t *raw = zip_open(path.string().c_str(), flags, &code);
    if (!raw) {
        throw narratune::ContainerIntegrityError(path, fmt::format("Not a valid ZIP archive: {}", ZipErrorString(code)));
    }
    return ZipPtr(raw);
}

// Entry name as a path below the extraction root.
fs::path SafeRelative(const fs::path &archive, const std::string &name) {
    const fs::path rel(name);
    if (name.empty() || rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) {
        throw narratune::ContainerIntegrityError(archive, fmt::format("Unsafe entry name: {}", name));
    }
    for (const auto &part : rel) {
        if (part == "..") {
            throw narratune::ContainerIntegrityError(archive, fmt::format("Unsafe entry name: {}", name));
        }
    }
    return rel.lexically_normal();
}

void ExtractEntry(zip_t *zip, const zip_uint64_t index, const zip_stat_t &st, const fs::path &archive,
                  const fs::path &target) {
    const ZipFilePtr file(zip_fopen_index(zip, index, 0));
    if (!file) {
        throw narratune::ContainerIntegrityError(archive,
                                                 fmt::format("Failed to open entry {}: {}", st.name, zip_strerror(zip)));
    }

    std::ofstream out(target, std::ios::binary);
    if (!out) {
        throw narratune::FileError(target, "Failed to create file");
    }

    std::array<char, 64 * 1024> buffer{};
    zip_uint64_t written = 0;
    zip_int64_t n = 0;
    while ((n = zip_fread(file.get(), buffer.data(), buffer.size())) > 0) {
        out.write(buffer.data(), static_cast<std::streamsize>(n));
        written += static_cast<zip_uint64_t>(n);
    }
    if (n < 0) {
        throw narratune::ContainerIntegrityError(
                archive, fmt::format("Failed to read entry {}: {}", st.name, zip_file_strerror(file.get())));
    }
    if ((st.valid & ZIP_STAT_SIZE) && written != st.size) {
        throw narratune::ContainerIntegrityError(archive, fmt::format("Truncated entry: {}", st.name));
    }

    out.close();
    if (!out) {
        throw narratune::FileError(target, "Failed to write file");
    }
}

void AddFile(zip_t *zip, const fs::path &root, const fs::path &rel, const fs::path &archive) {
    const auto src = (root / rel).string();
    const auto name = rel.generic_string();

    zip_source_t *source = zip_source_file(zip, src.c_str(), 0, -1);
    if (!source) {
        throw narratune::FileError(archive, fmt::format("Failed to read {}: {}", name, zip_strerror(zip)));
    }

    const zip_int64_t index = zip_file_add(zip, name.c_str(), source, ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE);
    if (index < 0) {
        zip_source_free(source);
        throw narratune::FileError(archive, fmt::format("Failed to add {}: {}", name, zip_strerror(zip)));
    }

    if (zip_set_file_compression(zip, static_cast<zip_uint64_t>(index), ZIP_CM_DEFLATE, 0) != 0) {
        throw narratune::FileError(archive, fmt::format("Failed to set compression for {}: {}", name, zip_strerror(zip)));
    }
}

} // namespace

void Validate(const fs::path &containerPath) {
    if (!fs::exists(containerPath)) {
        throw narratune::ValidationError(containerPath, "File not found");
    }
    if (!fs::is_regular_file(containerPath)) {
        throw narratune::ValidationError(containerPath, "Not a file");
    }
    OpenArchive(containerPath, ZIP_RDONLY);
}

Extraction Extract(const fs::path &containerPath, const fs::path &scratchRoot) {
    Validate(containerPath);
    const auto zip = OpenArchive(containerPath, ZIP_RDONLY);

    Extraction out;
    out.Root = scratchRoot / "contents";
    fs::create_directories(out.Root);

    const zip_int64_t count = zip_get_num_entries(zip.get(), 0);
    if (count < 0) {
        throw narratune::ContainerIntegrityError(containerPath, "Failed to read the archive directory");
    }

    for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(count); ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(zip.get(), i, 0, &st) != 0 || !(st.valid & ZIP_STAT_NAME)) {
            throw narratune::ContainerIntegrityError(containerPath,
                                                     fmt::format("Failed to stat entry {}: {}", i, zip_strerror(zip.get())));
        }

        const std::string name = st.name;
        const auto target = out.Root / SafeRelative(containerPath, name);
        out.Index.Entries.push_back(name);

        if (name.back() == '/') {
            fs::create_directories(target);
            continue;
        }
        fs::create_directories(target.parent_path());
        ExtractEntry(zip.get(), i, st, containerPath, target);
    }

    out.Index.AudioFiles = FindAudioFiles(out.Root);
    return out;
}

std::vector<fs::path> FindAudioFiles(const fs::path &root) {
    std::vector<fs::path> files;
    const auto dir = root / MEDIA_DIR;
    if (!fs::is_directory(dir)) {
        return files;
    }

    for (const auto &entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && Media::IsAudioFile(entry.path())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

void Repack(const fs::path &root, const Manifest &manifest, const fs::path &outputPath) {
    std::set<fs::path> pending;
    for (const auto &entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            pending.insert(entry.path().lexically_relative(root));
        }
    }

    if (outputPath.has_parent_path()) {
        fs::create_directories(outputPath.parent_path());
    }
    const narratune::TempFile partial(narratune::PartialPath(outputPath));
    auto zip = OpenArchive(partial.Path(), ZIP_CREATE | ZIP_TRUNCATE);

    for (const auto &name : manifest.Entries) {
        const fs::path rel = fs::path(name).lexically_normal();
        if (name.back() == '/') {
            if (fs::is_directory(root / rel) && zip_dir_add(zip.get(), name.c_str(), ZIP_FL_ENC_UTF_8) < 0) {
                throw narratune::FileError(outputPath, fmt::format("Failed to add directory {}: {}", name,
                                                                   zip_strerror(zip.get())));
            }
            continue;
        }
        if (pending.erase(rel) > 0) {
            AddFile(zip.get(), root, rel, outputPath);
        }
    }
    for (const auto &rel : pending) {
        AddFile(zip.get(), root, rel, outputPath);
    }

    if (zip_close(zip.get()) != 0) {
        throw narratune::FileError(outputPath, fmt::format("Failed to write archive: {}", zip_strerror(zip.get())));
    }
    zip.release();

    narratune::CommitOutput(partial.Path(), outputPath);
}

} // namespace Container
