#pragma once
#include "ILogger.hpp"
#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

// 控制台日志，可选同时追加写入日志文件
class ConsoleLogger : public ILogger {
private:
    std::atomic<LogLevel> level;
    std::mutex writeMutex;
    std::ofstream logFile;
    std::string logFilePath;

public:
    explicit ConsoleLogger(LogLevel minLevel = LogLevel::INFO);
    ~ConsoleLogger() override;

    // 打开日志文件（追加模式），失败时返回false并继续只输出到控制台
    bool setLogFile(const std::string& path);

    const std::string& getLogFile() const;

    void info(const std::string& message) override;

    void error(const std::string& message) override;

    void warn(const std::string& message) override;

    void debug(const std::string& message) override;

    void setLogLevel(LogLevel level) override;

    LogLevel getLogLevel() const override;

    void log(LogLevel level, const std::string& message) override;
};
