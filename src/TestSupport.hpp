#pragma once
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "utils/FileSystemMonitor.hpp"
#include "utils/ILogger.hpp"

namespace fs = std::filesystem;

// 模拟ILogger接口
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, setLogLevel, (LogLevel level), (override));
    MOCK_METHOD(LogLevel, getLogLevel, (), (const, override));
    MOCK_METHOD(void, log, (LogLevel level, const std::string& message), (override));
};

// 由测试线程手动触发事件的监控器
class FakeFileSystemMonitor : public FileSystemMonitor {
private:
    std::mutex dirMutex;
    std::vector<std::string> directories;

public:
    explicit FakeFileSystemMonitor(ILogger* log) : FileSystemMonitor(log) {}

    bool addWatchDirectory(const std::string& directory) override {
        std::lock_guard<std::mutex> lock(dirMutex);
        directories.push_back(directory);
        return true;
    }

    bool removeWatchDirectory(const std::string& directory) override {
        std::lock_guard<std::mutex> lock(dirMutex);
        for (auto it = directories.begin(); it != directories.end(); ++it) {
            if (*it == directory) {
                directories.erase(it);
                return true;
            }
        }
        return false;
    }

    bool start() override {
        running = true;
        return true;
    }

    void stop() override {
        running = false;
        std::lock_guard<std::mutex> lock(dirMutex);
        directories.clear();
    }

    // 模拟一次创建通知；停止后调用不会产生事件
    void emit(const std::string& path, bool isDirectory = false) {
        if (running && eventCallback) {
            eventCallback(IncomingEvent{path, isDirectory});
        }
    }

    std::vector<std::string> watchedDirectories() {
        std::lock_guard<std::mutex> lock(dirMutex);
        return directories;
    }
};

// 每个测试用例使用独立的临时目录
inline fs::path uniqueTestDirectory(const std::string& prefix) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = prefix;
    if (info != nullptr) {
        name += std::string("_") + info->test_suite_name() + "_" + info->name();
    }
    // 参数化用例的名字里带有 '/'
    std::replace(name.begin(), name.end(), '/', '_');
    return fs::temp_directory_path() / name;
}

inline void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream(path) << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// 轮询等待条件成立，超时返回false
inline bool waitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return predicate();
}
