#pragma once
#include <string>
#include <vector>
#include <functional>
#include <atomic>
#include <thread>
#include <memory>
#include <chrono>
#include "../core/Types.hpp"

class ILogger;

// 文件创建通知，由监控线程产生，立即交给回调
struct IncomingEvent {
    std::string filePath;   // 新建条目的绝对路径
    bool isDirectory;       // 新建的是否为目录
};

// 文件系统监控器基类，只报告被监控目录下直接新建的条目（不递归）
class FileSystemMonitor {
public:
    using EventCallback = std::function<void(const IncomingEvent&)>;
    
    explicit FileSystemMonitor(ILogger* log) : logger(log), running(false) {}
    virtual ~FileSystemMonitor() = default;
    
    // 禁用拷贝和移动
    FileSystemMonitor(const FileSystemMonitor&) = delete;
    FileSystemMonitor& operator=(const FileSystemMonitor&) = delete;
    FileSystemMonitor(FileSystemMonitor&&) = delete;
    FileSystemMonitor& operator=(FileSystemMonitor&&) = delete;
    
    // 添加监控目录
    virtual bool addWatchDirectory(const std::string& directory) = 0;
    
    // 移除监控目录
    virtual bool removeWatchDirectory(const std::string& directory) = 0;
    
    // 开始监控，已经在运行时直接返回true
    virtual bool start() = 0;
    
    // 停止监控，返回时监控线程已经退出
    virtual void stop() = 0;
    
    bool isRunning() const {
        return running;
    }
    
    // 设置事件回调，必须在start之前调用；回调在监控线程中执行
    void setEventCallback(EventCallback callback) {
        eventCallback = std::move(callback);
    }
    
protected:
    ILogger* logger;
    EventCallback eventCallback;
    std::atomic<bool> running;
    std::thread monitorThread;
};

// 工厂函数：NATIVE 使用 inotify，POLLING 按 pollInterval 周期扫描目录。
// inotify 初始化失败时抛出 std::runtime_error
std::unique_ptr<FileSystemMonitor> createFileSystemMonitor(
    MonitorBackend backend,
    ILogger* logger,
    std::chrono::milliseconds pollInterval = std::chrono::milliseconds(1000));
