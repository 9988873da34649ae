#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "IncomingWatcher.hpp"
#include "SorterConfig.hpp"
#include "Types.hpp"

class ILogger;
class FileSystemMonitor;

// 控制器：持有配置和基础目录，负责监控的启动与停止，
// 界面层（命令行或测试）只通过这里的方法驱动
class MonitorController {
public:
    using MonitorFactory = std::function<std::unique_ptr<FileSystemMonitor>()>;

private:
    ILogger* logger;
    SorterConfig config;
    std::filesystem::path baseDir;
    MonitorBackend backend;
    std::chrono::milliseconds pollInterval;
    MonitorFactory monitorFactory;
    std::unique_ptr<IncomingWatcher> watcher;
    mutable std::mutex controlMutex;

    bool prepareDirectoriesLocked(const std::filesystem::path& base);
    std::unique_ptr<FileSystemMonitor> createMonitor();

public:
    MonitorController(const SorterConfig& sorterConfig, ILogger* log,
                      MonitorBackend monitorBackend = MonitorBackend::NATIVE,
                      std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
    ~MonitorController();

    MonitorController(const MonitorController&) = delete;
    MonitorController& operator=(const MonitorController&) = delete;

    // 替换监控器的创建方式（测试中注入合成事件用）
    void setMonitorFactory(MonitorFactory factory);

    // 选择基础目录并创建目录结构；运行中不允许切换
    bool selectDirectory(const std::string& path);

    // 在当前基础目录下创建 incoming/sorted/archive 以及每个分类目录，可重复调用
    bool prepareDirectories();

    // 开始监控；未选择基础目录或已经在运行时返回false
    bool start();

    // 停止监控，同步等待后台线程退出
    void stop();

    bool isRunning() const;
    WatchState getState() const;
    bool hasBaseDirectory() const;
    std::filesystem::path getBaseDirectory() const;
    const SorterConfig& getConfig() const;
    MonitorBackend getBackend() const;
};
