#pragma once
#include <chrono>
#include <filesystem>
#include <string>

class ILogger;

// 把已分拣的文件复制一份到按日期划分的归档目录
class Archiver {
private:
    ILogger* logger;

public:
    explicit Archiver(ILogger* log);

    // 复制到 archiveRootDir/<YYYY-MM-DD>/<原文件名>，同名文件直接覆盖。
    // 尽力而为：失败只记录日志并返回false，不抛异常也不重试
    bool archive(const std::filesystem::path& filePath, const std::filesystem::path& archiveRootDir);

    // 按本地时间生成日期目录名，格式 YYYY-MM-DD
    static std::string dateFolderName(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());
};
