#include "SorterConfig.hpp"
#include "Router.hpp"
#include "../utils/ILogger.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::ordered_json;

std::set<std::string> SorterConfig::categories() const {
    std::set<std::string> result;
    for (const auto& entry : extensionMap) {
        result.insert(entry.second);
    }
    return result;
}

bool SorterConfig::isValid() const {
    return !incomingDirectory.empty() && !sortedDirectory.empty() && !archiveDirectory.empty();
}

std::filesystem::path SorterConfig::incomingPath(const std::filesystem::path& baseDir) const {
    return baseDir / incomingDirectory;
}

std::filesystem::path SorterConfig::sortedPath(const std::filesystem::path& baseDir) const {
    return baseDir / sortedDirectory;
}

std::filesystem::path SorterConfig::archivePath(const std::filesystem::path& baseDir) const {
    return baseDir / archiveDirectory;
}

bool ConfigLoader::load(const std::string& filePath, SorterConfig& config, ILogger* logger) {
    std::ifstream jsonFile(filePath);
    if (!jsonFile) {
        logger->error("No config found at " + filePath + ", you need one to run this.");
        return false;
    }

    std::stringstream buffer;
    buffer << jsonFile.rdbuf();
    if (!parse(buffer.str(), config, logger)) {
        return false;
    }

    logger->info("Using config file: " + filePath);
    return true;
}

bool ConfigLoader::parse(const std::string& content, SorterConfig& config, ILogger* logger) {
    json data;
    try {
        data = json::parse(content);
    } catch (const json::parse_error& e) {
        logger->error("Couldn't parse config file: " + std::string(e.what()));
        return false;
    }

    if (!data.is_object()) {
        logger->error("Invalid configuration: top level must be an object.");
        return false;
    }

    return fromJson(data, config, logger);
}

bool ConfigLoader::fromJson(const json& data, SorterConfig& config, ILogger* logger) {
    SorterConfig parsed;

    if (!readDirectoryName(data, "incoming_directory", parsed.incomingDirectory, logger) ||
        !readDirectoryName(data, "sorted_directory", parsed.sortedDirectory, logger) ||
        !readDirectoryName(data, "archive_directory", parsed.archiveDirectory, logger)) {
        return false;
    }

    auto extensionsIt = data.find("extensions");
    if (extensionsIt == data.end()) {
        logger->error("Invalid configuration: missing `extensions` field.");
        return false;
    }

    if (!extensionsIt->is_object()) {
        logger->error("Invalid configuration: `extensions` must be an object of extension/category strings.");
        return false;
    }

    for (auto it = extensionsIt->begin(); it != extensionsIt->end(); ++it) {
        if (!it.value().is_string()) {
            logger->error("Invalid configuration: category for `" + it.key() + "` must be a string.");
            return false;
        }

        std::string extension = Router::normalizeExtension(it.key());
        if (extension.empty()) {
            logger->error("Invalid configuration: empty extension key in `extensions`.");
            return false;
        }

        std::string category = it.value().get<std::string>();
        if (category.empty()) {
            logger->error("Invalid configuration: category for `" + it.key() + "` cannot be empty.");
            return false;
        }
        if (!isContainedPath(category)) {
            logger->error("Invalid configuration: category `" + category + "` for `" + it.key() +
                          "` must be a relative path without `..`.");
            return false;
        }

        // 规范化后重复的键（例如 ".JPG" 和 ".jpg"）以文件中先出现的为准
        if (!parsed.extensionMap.emplace(extension, category).second) {
            logger->warn("Duplicate extension `" + extension + "` in configuration, keeping the one listed first.");
        }
    }

    if (parsed.extensionMap.empty()) {
        logger->warn("No extensions configured; every incoming file will be left in place.");
    }

    std::string keys;
    for (auto it = data.begin(); it != data.end(); ++it) {
        keys += (keys.empty() ? "" : ", ") + it.key();
    }
    logger->info("Config keys loaded: [" + keys + "]");
    logger->info("Loaded " + std::to_string(parsed.extensionMap.size()) + " extension mapping(s) into " +
                 std::to_string(parsed.categories().size()) + " categories");

    config = std::move(parsed);
    return true;
}

bool ConfigLoader::readDirectoryName(const json& data, const std::string& key, std::string& out, ILogger* logger) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_string()) {
        logger->error("Missing or invalid " + key + ": expected a string.");
        return false;
    }

    out = it->get<std::string>();
    if (out.empty()) {
        logger->error("Invalid configuration: " + key + " cannot be empty.");
        return false;
    }
    if (!isContainedPath(out)) {
        logger->error("Invalid configuration: " + key + " must be a relative path without `..`, got `" + out + "`.");
        return false;
    }
    return true;
}

bool ConfigLoader::isContainedPath(const std::string& value) {
    std::filesystem::path path(value);
    if (path.is_absolute() || path.has_root_path()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}
