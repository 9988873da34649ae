#include "Router.hpp"
#include <algorithm>
#include <cctype>

std::optional<std::string> Router::classify(const std::string& extension, const ExtensionMap& extensionMap) {
    if (extension.empty()) {
        return std::nullopt;
    }

    auto it = extensionMap.find(extension);
    if (it == extensionMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Router::normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    if (extension.empty() || extension == ".") {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}

std::string Router::extensionOf(const std::filesystem::path& file) {
    std::string extension = file.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}
