#include "FileSystem.hpp"

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    // 使用symlink_status检查文件是否存在，不解析符号链接
    fs::file_status status = fs::symlink_status(path, ec);
    // 权限不足等错误按不存在处理
    return !ec && status.type() != fs::file_type::not_found;
}

bool FileSystem::createDirectories(const fs::path& path, std::error_code& ec) {
    ec.clear();

    // 如果目录已存在，直接返回成功
    fs::file_status status = fs::status(path, ec);
    if (!ec && fs::is_directory(status)) {
        return true;
    }
    ec.clear();

    fs::create_directories(path, ec);
    if (ec) {
        return false;
    }

    // 路径存在但不是目录时 create_directories 不会报错
    if (!fs::is_directory(path, ec)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::not_a_directory);
        }
        return false;
    }
    return true;
}

bool FileSystem::copyFile(const fs::path& source, const fs::path& destination, std::error_code& ec) {
    ec.clear();

    // 先读取源文件的修改时间，源文件不存在时这里就会失败
    fs::file_time_type sourceTime = fs::last_write_time(source, ec);
    if (ec) {
        return false;
    }

    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return false;
    }

    // 修改时间无法保留时（例如目标文件系统不支持）不影响复制结果
    std::error_code timeErr;
    fs::last_write_time(destination, sourceTime, timeErr);
    return true;
}

bool FileSystem::moveFile(const fs::path& source, const fs::path& destination, std::error_code& ec) {
    ec.clear();

    fs::rename(source, destination, ec);
    if (!ec) {
        return true;
    }

    if (ec != std::errc::cross_device_link) {
        return false;
    }

    // 跨设备移动：复制后删除源文件
    if (!copyFile(source, destination, ec)) {
        return false;
    }

    fs::remove(source, ec);
    if (ec) {
        // 删除失败时回收已复制的目标，避免同一文件出现两份
        std::error_code cleanupErr;
        fs::remove(destination, cleanupErr);
        return false;
    }
    return true;
}

std::vector<fs::path> FileSystem::listEntries(const fs::path& directory, std::error_code& ec) {
    std::vector<fs::path> entries;
    ec.clear();

    fs::directory_iterator iter(directory, ec);
    if (ec) {
        return entries;
    }

    const fs::directory_iterator end;
    while (iter != end) {
        entries.push_back(iter->path());
        iter.increment(ec);
        if (ec) {
            break;
        }
    }
    return entries;
}
