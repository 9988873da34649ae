#pragma once
#include <filesystem>
#include <map>
#include <set>
#include <string>

#include <nlohmann/json_fwd.hpp>

class ILogger;

// 扩展名（小写，带点）到分类目录名的映射
using ExtensionMap = std::map<std::string, std::string>;

// 分拣配置，启动监控前加载一次，之后只读
struct SorterConfig {
    std::string incomingDirectory;  // 待分拣目录（相对基础目录）
    std::string sortedDirectory;    // 分拣结果根目录
    std::string archiveDirectory;   // 归档根目录
    ExtensionMap extensionMap;      // 扩展名映射，可以为空

    // 映射中出现的全部分类（去重）
    std::set<std::string> categories() const;

    // 三个目录名都非空
    bool isValid() const;

    std::filesystem::path incomingPath(const std::filesystem::path& baseDir) const;
    std::filesystem::path sortedPath(const std::filesystem::path& baseDir) const;
    std::filesystem::path archivePath(const std::filesystem::path& baseDir) const;
};

// 从 JSON 配置文件读取 SorterConfig，键按文件中的顺序处理
class ConfigLoader {
public:
    // 读取并校验配置文件；I/O 或校验失败时记录原因并返回false
    static bool load(const std::string& filePath, SorterConfig& config, ILogger* logger);

    // 解析 JSON 文本，供 load 和测试使用
    static bool parse(const std::string& content, SorterConfig& config, ILogger* logger);

private:
    static bool fromJson(const nlohmann::ordered_json& data, SorterConfig& config, ILogger* logger);
    static bool readDirectoryName(const nlohmann::ordered_json& data, const std::string& key, std::string& out, ILogger* logger);

    // 相对路径且不含 ".."，拼接到基础目录后不会跑到外面
    static bool isContainedPath(const std::string& value);
};
