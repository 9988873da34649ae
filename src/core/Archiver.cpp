#include "Archiver.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/ILogger.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

Archiver::Archiver(ILogger* log) : logger(log) {
}

bool Archiver::archive(const std::filesystem::path& filePath, const std::filesystem::path& archiveRootDir) {
    const std::filesystem::path archivePath = archiveRootDir / dateFolderName();

    std::error_code ec;
    if (!FileSystem::createDirectories(archivePath, ec)) {
        logger->error("Error archiving file " + filePath.string() + ": cannot create " + archivePath.string() +
                      " (" + ec.message() + ")");
        return false;
    }

    const std::filesystem::path target = archivePath / filePath.filename();
    if (!FileSystem::copyFile(filePath, target, ec)) {
        logger->error("Error archiving file " + filePath.string() + ": " + ec.message());
        return false;
    }

    logger->info("Archived " + filePath.string() + " to " + archivePath.string());
    return true;
}

std::string Archiver::dateFolderName(std::chrono::system_clock::time_point when) {
    std::time_t time = std::chrono::system_clock::to_time_t(when);
    std::tm localTime{};
    localtime_r(&time, &localTime);
    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d");
    return oss.str();
}
