#include "MonitorController.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/FileSystemMonitor.hpp"
#include "../utils/ILogger.hpp"
#include <exception>
#include <vector>

MonitorController::MonitorController(const SorterConfig& sorterConfig, ILogger* log,
                                     MonitorBackend monitorBackend, std::chrono::milliseconds interval)
    : logger(log), config(sorterConfig), backend(monitorBackend), pollInterval(interval) {
}

MonitorController::~MonitorController() {
    stop();
}

void MonitorController::setMonitorFactory(MonitorFactory factory) {
    std::lock_guard<std::mutex> lock(controlMutex);
    monitorFactory = std::move(factory);
}

bool MonitorController::selectDirectory(const std::string& path) {
    std::lock_guard<std::mutex> lock(controlMutex);

    if (watcher && watcher->isRunning()) {
        logger->error("Stop monitoring before selecting another base directory.");
        return false;
    }

    if (path.empty()) {
        logger->warn("No directory selected.");
        return false;
    }

    std::error_code ec;
    std::filesystem::path chosen = std::filesystem::absolute(path, ec);
    if (ec) {
        logger->error("Cannot resolve directory " + path + ": " + ec.message());
        return false;
    }

    if (!prepareDirectoriesLocked(chosen)) {
        return false;
    }

    baseDir = chosen.lexically_normal();
    logger->info("Base directory selected: " + baseDir.string());
    return true;
}

bool MonitorController::prepareDirectories() {
    std::lock_guard<std::mutex> lock(controlMutex);
    if (baseDir.empty()) {
        logger->warn("No base directory selected. Cannot prepare directories.");
        return false;
    }
    return prepareDirectoriesLocked(baseDir);
}

bool MonitorController::prepareDirectoriesLocked(const std::filesystem::path& base) {
    std::vector<std::filesystem::path> folders = {
        config.incomingPath(base),
        config.sortedPath(base),
        config.archivePath(base)
    };
    for (const auto& category : config.categories()) {
        folders.push_back(config.sortedPath(base) / category);
    }

    for (const auto& folder : folders) {
        std::error_code ec;
        if (!FileSystem::createDirectories(folder, ec)) {
            logger->error("Failed to create directory " + folder.string() + ": " + ec.message());
            return false;
        }
    }

    logger->debug("Prepared " + std::to_string(folders.size()) + " directories under " + base.string());
    return true;
}

std::unique_ptr<FileSystemMonitor> MonitorController::createMonitor() {
    if (monitorFactory) {
        return monitorFactory();
    }
    return createFileSystemMonitor(backend, logger, pollInterval);
}

bool MonitorController::start() {
    std::lock_guard<std::mutex> lock(controlMutex);

    if (baseDir.empty()) {
        logger->error("No base directory selected. Cannot start monitoring.");
        return false;
    }

    if (watcher && watcher->isRunning()) {
        logger->error("Monitoring is already running.");
        return false;
    }

    std::unique_ptr<FileSystemMonitor> monitor;
    try {
        monitor = createMonitor();
    } catch (const std::exception& e) {
        logger->error("Failed to create file system monitor: " + std::string(e.what()));
        return false;
    }

    if (!monitor) {
        logger->error("Failed to create file system monitor");
        return false;
    }

    watcher = std::make_unique<IncomingWatcher>(std::move(monitor), config, baseDir, logger);
    if (!watcher->start()) {
        watcher.reset();
        return false;
    }
    return true;
}

void MonitorController::stop() {
    std::lock_guard<std::mutex> lock(controlMutex);
    if (!watcher) {
        return;
    }
    watcher->stop();
    watcher.reset();
}

bool MonitorController::isRunning() const {
    std::lock_guard<std::mutex> lock(controlMutex);
    return watcher && watcher->isRunning();
}

WatchState MonitorController::getState() const {
    return isRunning() ? WatchState::RUNNING : WatchState::STOPPED;
}

bool MonitorController::hasBaseDirectory() const {
    std::lock_guard<std::mutex> lock(controlMutex);
    return !baseDir.empty();
}

std::filesystem::path MonitorController::getBaseDirectory() const {
    std::lock_guard<std::mutex> lock(controlMutex);
    return baseDir;
}

const SorterConfig& MonitorController::getConfig() const {
    return config;
}

MonitorBackend MonitorController::getBackend() const {
    return backend;
}
