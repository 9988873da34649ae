#pragma once
#include <string>

// 单个文件分发的结果
enum class MoveStatus {
    MOVED,
    SKIPPED,
    FAILED
};

// 监控器运行状态
enum class WatchState {
    STOPPED,
    RUNNING
};

// 文件系统通知的实现方式
enum class MonitorBackend {
    NATIVE,
    POLLING
};

inline std::string toString(MoveStatus status) {
    switch (status) {
        case MoveStatus::MOVED: return "MOVED";
        case MoveStatus::SKIPPED: return "SKIPPED";
        case MoveStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline std::string toString(WatchState state) {
    switch (state) {
        case WatchState::STOPPED: return "STOPPED";
        case WatchState::RUNNING: return "RUNNING";
        default: return "UNKNOWN";
    }
}

inline std::string toString(MonitorBackend backend) {
    switch (backend) {
        case MonitorBackend::NATIVE: return "NATIVE";
        case MonitorBackend::POLLING: return "POLLING";
        default: return "UNKNOWN";
    }
}
