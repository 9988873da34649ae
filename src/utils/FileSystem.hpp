#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

// std::filesystem 的薄封装，全部使用 std::error_code 报告错误，不抛异常
class FileSystem {
public:
    // 检查文件或目录是否存在（不解析符号链接）
    static bool exists(const fs::path& path);

    // 创建目录（包括父目录），目录已存在视为成功
    static bool createDirectories(const fs::path& path, std::error_code& ec);

    // 复制单个文件，覆盖已有目标，并保留修改时间
    static bool copyFile(const fs::path& source, const fs::path& destination, std::error_code& ec);

    // 移动单个文件，跨设备时退化为复制后删除源文件
    static bool moveFile(const fs::path& source, const fs::path& destination, std::error_code& ec);

    // 列出目录下的直接子项（不递归）
    static std::vector<fs::path> listEntries(const fs::path& directory, std::error_code& ec);
};
