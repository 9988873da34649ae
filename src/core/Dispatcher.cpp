#include "Dispatcher.hpp"
#include "PathNaming.hpp"
#include "Router.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/ILogger.hpp"

Dispatcher::Dispatcher(ILogger* log) : logger(log), archiver(log) {
}

MoveOutcome Dispatcher::dispatch(const std::filesystem::path& sourcePath,
                                 const std::filesystem::path& baseDir,
                                 const ExtensionMap& extensionMap,
                                 const std::string& sortedDirName,
                                 const std::string& archiveDirName) {
    MoveOutcome outcome;

    const std::string extension = Router::extensionOf(sourcePath);
    auto category = Router::classify(extension, extensionMap);
    if (!category) {
        logger->warn("Unknown / unsupported file type: " + sourcePath.string());
        outcome.status = MoveStatus::SKIPPED;
        outcome.reason = extension.empty() ? "no extension" : "unsupported extension " + extension;
        return outcome;
    }

    const std::filesystem::path destinationDir = baseDir / sortedDirName / *category;

    std::error_code ec;
    if (!FileSystem::createDirectories(destinationDir, ec)) {
        logger->error("Error moving file " + sourcePath.string() + ": cannot create " + destinationDir.string() +
                      " (" + ec.message() + ")");
        outcome.reason = ec.message();
        return outcome;
    }

    const std::filesystem::path finalDestination = PathNaming::resolve(destinationDir, sourcePath.filename().string());
    if (!FileSystem::moveFile(sourcePath, finalDestination, ec)) {
        logger->error("Error moving file " + sourcePath.string() + ": " + ec.message());
        outcome.reason = ec.message();
        return outcome;
    }

    logger->info("Moved " + sourcePath.string() + " to " + finalDestination.string());
    outcome.status = MoveStatus::MOVED;
    outcome.destination = finalDestination;

    // 归档失败不回滚已经完成的移动
    outcome.archived = archiver.archive(finalDestination, baseDir / archiveDirName);
    return outcome;
}

MoveOutcome Dispatcher::dispatch(const std::filesystem::path& sourcePath,
                                 const std::filesystem::path& baseDir,
                                 const SorterConfig& config) {
    return dispatch(sourcePath, baseDir, config.extensionMap, config.sortedDirectory, config.archiveDirectory);
}
