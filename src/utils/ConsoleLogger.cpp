// src/utils/ConsoleLogger.cpp
#include "ConsoleLogger.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

static std::string getCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm localTime{};
    localtime_r(&time_t, &localTime);
    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

ConsoleLogger::ConsoleLogger(LogLevel minLevel) : level(minLevel) {
}

ConsoleLogger::~ConsoleLogger() {
    std::lock_guard<std::mutex> lock(writeMutex);
    if (logFile.is_open()) {
        logFile.close();
    }
}

bool ConsoleLogger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(writeMutex);
    if (logFile.is_open()) {
        logFile.close();
    }
    logFilePath.clear();

    if (path.empty()) {
        return true;
    }

    logFile.open(path, std::ios::out | std::ios::app);
    if (!logFile) {
        std::cerr << "[" << getCurrentTime() << "] [ERROR] Failed to open log file: " << path << std::endl;
        return false;
    }
    logFilePath = path;
    return true;
}

const std::string& ConsoleLogger::getLogFile() const {
    return logFilePath;
}

void ConsoleLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void ConsoleLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void ConsoleLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void ConsoleLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void ConsoleLogger::setLogLevel(LogLevel newLevel) {
    level = newLevel;
}

LogLevel ConsoleLogger::getLogLevel() const {
    return level;
}

void ConsoleLogger::log(LogLevel messageLevel, const std::string& message) {
    if (messageLevel < level.load()) {
        return;
    }

    std::string line = "[" + getCurrentTime() + "] [" + toString(messageLevel) + "] " + message;

    std::lock_guard<std::mutex> lock(writeMutex);
    if (messageLevel == LogLevel::ERROR_LEVEL) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }

    if (logFile.is_open()) {
        logFile << line << std::endl;
    }
}
