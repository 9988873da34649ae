#include "IncomingWatcher.hpp"
#include "../utils/ILogger.hpp"
#include <exception>

IncomingWatcher::IncomingWatcher(std::unique_ptr<FileSystemMonitor> fsMonitor,
                                 const SorterConfig& sorterConfig,
                                 const std::filesystem::path& baseDirectory,
                                 ILogger* log)
    : monitor(std::move(fsMonitor)), logger(log), config(sorterConfig), baseDir(baseDirectory),
      incomingDir(sorterConfig.incomingPath(baseDirectory)), dispatcher(log),
      running(false), dispatchedCount(0) {
    // 设置事件回调
    monitor->setEventCallback([this](const IncomingEvent& event) {
        enqueue(event);
    });
}

IncomingWatcher::~IncomingWatcher() {
    stop();
}

bool IncomingWatcher::start() {
    if (running) {
        logger->error("Monitoring is already running for " + incomingDir.string());
        return false;
    }
    
    // 添加监控目录
    if (!monitor->addWatchDirectory(incomingDir.string())) {
        logger->error("Failed to add watch directory: " + incomingDir.string());
        return false;
    }
    
    // 启动监控器
    if (!monitor->start()) {
        monitor->removeWatchDirectory(incomingDir.string());
        logger->error("Failed to start file system monitor");
        return false;
    }
    
    // 启动工作线程
    running = true;
    workerThread = std::thread(&IncomingWatcher::workerThreadFunc, this);
    
    logger->info("Monitoring started for directory: " + incomingDir.string());
    return true;
}

void IncomingWatcher::stop() {
    if (!running) {
        return;
    }
    
    // 先停止监控器，之后不会再有新事件入队
    monitor->stop();
    
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        running = false;
    }
    
    // 唤醒工作线程
    queueCV.notify_one();
    
    // 等待工作线程结束（正在进行的分发会先完成）
    if (workerThread.joinable()) {
        workerThread.join();
    }
    
    std::size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        discarded = eventQueue.size();
        std::queue<IncomingEvent>().swap(eventQueue);
    }
    if (discarded > 0) {
        logger->warn("Discarded " + std::to_string(discarded) + " pending file event(s) on stop");
    }
    
    logger->info("Monitoring stopped for directory: " + incomingDir.string());
}

bool IncomingWatcher::isRunning() const {
    return running;
}

WatchState IncomingWatcher::getState() const {
    return running ? WatchState::RUNNING : WatchState::STOPPED;
}

std::size_t IncomingWatcher::getDispatchedCount() const {
    return dispatchedCount;
}

const std::filesystem::path& IncomingWatcher::getIncomingDirectory() const {
    return incomingDir;
}

void IncomingWatcher::enqueue(const IncomingEvent& event) {
    // 只处理文件，忽略目录
    if (event.isDirectory) {
        logger->debug("Ignoring new directory: " + event.filePath);
        return;
    }
    
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        eventQueue.push(event);
    }
    queueCV.notify_one();
}

void IncomingWatcher::workerThreadFunc() {
    while (true) {
        IncomingEvent event;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            queueCV.wait(lock, [this]() {
                return !eventQueue.empty() || !running;
            });
            
            if (!running) {
                break;
            }
            
            event = eventQueue.front();
            eventQueue.pop();
        }
        
        processEvent(event);
    }
}

void IncomingWatcher::processEvent(const IncomingEvent& event) {
    logger->info("New file detected: " + event.filePath);
    
    // 单个文件的任何异常都不能终止工作线程
    try {
        dispatcher.dispatch(event.filePath, baseDir, config);
    } catch (const std::exception& e) {
        logger->error("Exception while dispatching " + event.filePath + ": " + std::string(e.what()));
    }
    ++dispatchedCount;
}
