#pragma once

#include "lib.hpp"

#include <string>
#include <vector>

namespace Container {

// Where presentation media lives inside the archive.
inline const fs::path MEDIA_DIR = fs::path("ppt") / "media";

struct Manifest {
    std::vector<std::string> Entries; // archive order, directories end with '/'
    std::vector<fs::path> AudioFiles; // absolute paths in the scratch tree, sorted by name
};

struct Extraction {
    fs::path Root;
    Manifest Index;
};

// Throws ValidationError for a missing path and ContainerIntegrityError when it is not a ZIP archive.
void Validate(const fs::path &containerPath);

// Entry names that are absolute or climb out of scratchRoot abort the extraction.
Extraction Extract(const fs::path &containerPath, const fs::path &scratchRoot);

std::vector<fs::path> FindAudioFiles(const fs::path &root);

void Repack(const fs::path &root, const Manifest &manifest, const fs::path &outputPath);

} // namespace Container
