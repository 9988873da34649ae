#include "PathNaming.hpp"
#include "../utils/FileSystem.hpp"

std::filesystem::path PathNaming::resolve(const std::filesystem::path& destinationDir, const std::string& filename) {
    std::filesystem::path candidate = destinationDir / filename;
    if (!FileSystem::exists(candidate)) {
        return candidate;
    }

    const std::filesystem::path name(filename);
    const std::string baseName = name.stem().string();
    const std::string extension = name.extension().string();

    for (unsigned long counter = 1;; ++counter) {
        candidate = destinationDir / (baseName + " " + std::to_string(counter) + extension);
        if (!FileSystem::exists(candidate)) {
            return candidate;
        }
    }
}
