#pragma once
#include <filesystem>
#include <string>
#include "Archiver.hpp"
#include "SorterConfig.hpp"
#include "Types.hpp"

// 一次分发的结果，只在进程内传递和记录日志
struct MoveOutcome {
    MoveStatus status = MoveStatus::FAILED;
    std::filesystem::path destination;  // MOVED 时为最终路径
    std::string reason;                 // SKIPPED / FAILED 时的原因
    bool archived = false;              // 归档是否成功（不影响 status）
};

// 对单个新文件执行 分类 -> 命名 -> 移动 -> 归档
class Dispatcher {
private:
    ILogger* logger;
    Archiver archiver;

public:
    explicit Dispatcher(ILogger* log);

    // 任何失败都在内部处理并记录日志，不抛异常
    MoveOutcome dispatch(const std::filesystem::path& sourcePath,
                         const std::filesystem::path& baseDir,
                         const ExtensionMap& extensionMap,
                         const std::string& sortedDirName,
                         const std::string& archiveDirName);

    MoveOutcome dispatch(const std::filesystem::path& sourcePath,
                         const std::filesystem::path& baseDir,
                         const SorterConfig& config);
};
