#pragma once
#include <filesystem>
#include <string>

// 为目标目录中的文件名计算一个不冲突的路径
class PathNaming {
public:
    // 目标不存在时直接返回 destinationDir/filename；
    // 否则依次尝试 "<base> 1<ext>"、"<base> 2<ext>" ……直到找到空位。
    // 检查和后续移动之间没有加锁，并发创建同名文件时可能冲突。
    // 分拣在新建通知到达时就开始，写入方尚未写完的大文件可能得到不完整的归档副本。
    static std::filesystem::path resolve(const std::filesystem::path& destinationDir, const std::string& filename);
};
