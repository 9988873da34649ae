#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "SorterConfig.hpp"

// 按扩展名把文件归到分类目录，纯函数，不做任何 I/O
class Router {
public:
    // 查找扩展名对应的分类；调用方负责先转成小写。找不到返回 std::nullopt
    static std::optional<std::string> classify(const std::string& extension, const ExtensionMap& extensionMap);

    // 规范化扩展名：去掉空白，补齐前导点，转小写
    static std::string normalizeExtension(std::string extension);

    // 取文件扩展名并转小写，没有扩展名时返回空字符串
    static std::string extensionOf(const std::filesystem::path& file);
};
