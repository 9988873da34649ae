#pragma once
#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <filesystem>
#include "Dispatcher.hpp"
#include "SorterConfig.hpp"
#include "Types.hpp"
#include "../utils/FileSystemMonitor.hpp"

class ILogger;

// 监控待分拣目录，把新文件交给 Dispatcher。
// 监控线程只负责入队，工作线程按到达顺序逐个分发，分发慢时事件排队而不会丢失。
class IncomingWatcher {
private:
    std::unique_ptr<FileSystemMonitor> monitor;
    ILogger* logger;
    SorterConfig config;
    std::filesystem::path baseDir;
    std::filesystem::path incomingDir;
    Dispatcher dispatcher;
    
    // 事件队列和线程安全机制
    std::queue<IncomingEvent> eventQueue;
    std::mutex queueMutex;
    std::condition_variable queueCV;
    
    // 工作线程
    std::thread workerThread;
    std::atomic<bool> running;
    std::atomic<std::size_t> dispatchedCount;
    
    // 监控线程回调：过滤目录并入队
    void enqueue(const IncomingEvent& event);
    
    // 处理单个新文件
    void processEvent(const IncomingEvent& event);
    
    // 工作线程函数
    void workerThreadFunc();
    
public:
    IncomingWatcher(std::unique_ptr<FileSystemMonitor> fsMonitor,
                    const SorterConfig& sorterConfig,
                    const std::filesystem::path& baseDirectory,
                    ILogger* log);
    ~IncomingWatcher();
    
    IncomingWatcher(const IncomingWatcher&) = delete;
    IncomingWatcher& operator=(const IncomingWatcher&) = delete;
    
    // 开始监控；已在运行时记录错误并返回false
    bool start();
    
    // 停止监控，返回前等待通知线程退出和正在进行的分发完成；
    // 尚未开始分发的排队事件被丢弃。已停止时什么也不做
    void stop();
    
    // 获取当前状态
    bool isRunning() const;
    WatchState getState() const;
    std::size_t getDispatchedCount() const;
    const std::filesystem::path& getIncomingDirectory() const;
};
