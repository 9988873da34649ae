#include "FileSystemMonitor.hpp"
#include "FileSystem.hpp"
#include "ILogger.hpp"
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <set>
#include <stdexcept>
#include <unordered_map>

#include <sys/inotify.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>       // 用于 errno
#include <cstring>      // 用于 strerror

namespace {

// Linux平台的文件系统监控器实现
class InotifyFileSystemMonitor : public FileSystemMonitor {
private:
    int inotifyFd;
    int wakePipe[2];    // stop() 写入 wakePipe[1] 唤醒阻塞在 poll 上的监控线程
    std::unordered_map<int, std::string> wdToDirectory;
    std::mutex wdMutex;

    // 监控线程函数
    void monitorThreadFunc() {
        alignas(inotify_event) char buffer[4096];

        while (running) {
            pollfd fds[2];
            fds[0].fd = inotifyFd;
            fds[0].events = POLLIN;
            fds[0].revents = 0;
            fds[1].fd = wakePipe[0];
            fds[1].events = POLLIN;
            fds[1].revents = 0;

            // 超时只是兜底，正常情况下由唤醒管道结束等待
            int ret = poll(fds, 2, 500);
            if (ret < 0) {
                if (errno != EINTR && running) {
                    logger->error("Error in poll: " + std::string(strerror(errno)));
                }
                continue;
            }
            if (ret == 0 || (fds[1].revents & POLLIN)) {
                continue;
            }
            if (!(fds[0].revents & POLLIN)) {
                continue;
            }

            ssize_t length = read(inotifyFd, buffer, sizeof(buffer));
            if (length < 0) {
                if (errno != EAGAIN && errno != EINTR && running) {
                    logger->error("Error reading inotify events: " + std::string(strerror(errno)));
                }
                continue;
            } else if (length == 0) {
                // 文件描述符被关闭，退出循环
                break;
            }

            ssize_t i = 0;
            while (i < length && running) {
                const inotify_event* event = reinterpret_cast<const inotify_event*>(&buffer[i]);
                i += static_cast<ssize_t>(sizeof(inotify_event) + event->len);
                handleEvent(event);
            }
        }
    }

    void handleEvent(const inotify_event* event) {
        if (event->mask & IN_Q_OVERFLOW) {
            logger->warn("inotify event queue overflowed, some new files may be missed");
            return;
        }

        // 获取对应的目录路径
        std::string directory;
        {
            std::lock_guard<std::mutex> lock(wdMutex);
            auto it = wdToDirectory.find(event->wd);
            if (it == wdToDirectory.end()) {
                return;
            }
            directory = it->second;

            // 被监控目录本身被删除或卸载
            if (event->mask & IN_IGNORED) {
                wdToDirectory.erase(it);
                logger->warn("Watch on " + directory + " was removed by the system");
                return;
            }
        }

        // 从其他目录移入的文件与新建文件同样处理
        if (!(event->mask & (IN_CREATE | IN_MOVED_TO)) || event->len == 0) {
            return;
        }

        IncomingEvent incoming;
        incoming.filePath = (std::filesystem::path(directory) / event->name).string();
        incoming.isDirectory = (event->mask & IN_ISDIR) != 0;

        if (eventCallback) {
            eventCallback(incoming);
        }
    }

public:
    explicit InotifyFileSystemMonitor(ILogger* log) : FileSystemMonitor(log) {
        inotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (inotifyFd < 0) {
            throw std::runtime_error("Failed to initialize inotify: " + std::string(strerror(errno)));
        }
        if (pipe2(wakePipe, O_NONBLOCK | O_CLOEXEC) < 0) {
            int err = errno;
            close(inotifyFd);
            throw std::runtime_error("Failed to create wake-up pipe: " + std::string(strerror(err)));
        }
    }

    ~InotifyFileSystemMonitor() override {
        stop();
        close(wakePipe[0]);
        close(wakePipe[1]);
        close(inotifyFd);
    }

    bool addWatchDirectory(const std::string& directory) override {
        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec)) {
            logger->error("Cannot watch " + directory + ": not a directory");
            return false;
        }

        // 只关心新建和移入事件，且不递归
        int wd = inotify_add_watch(inotifyFd, directory.c_str(), IN_CREATE | IN_MOVED_TO | IN_ONLYDIR);
        if (wd < 0) {
            logger->error("inotify_add_watch failed for " + directory + ": " + std::string(strerror(errno)));
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(wdMutex);
            wdToDirectory[wd] = directory;
        }

        return true;
    }

    bool removeWatchDirectory(const std::string& directory) override {
        std::lock_guard<std::mutex> lock(wdMutex);

        for (auto it = wdToDirectory.begin(); it != wdToDirectory.end(); ++it) {
            if (it->second == directory) {
                inotify_rm_watch(inotifyFd, it->first);
                wdToDirectory.erase(it);
                return true;
            }
        }

        return false;
    }

    bool start() override {
        if (running) {
            return true;
        }

        {
            std::lock_guard<std::mutex> lock(wdMutex);
            if (wdToDirectory.empty()) {
                logger->error("No directory to watch");
                return false;
            }
        }

        running = true;
        monitorThread = std::thread(&InotifyFileSystemMonitor::monitorThreadFunc, this);
        return true;
    }

    void stop() override {
        if (!running) {
            return;
        }

        running = false;

        if (monitorThread.joinable()) {
            // 唤醒监控线程；写入失败时依靠 poll 超时退出
            if (write(wakePipe[1], "x", 1) < 0 && errno != EAGAIN) {
                logger->debug("Failed to wake monitor thread: " + std::string(strerror(errno)));
            }
            monitorThread.join();
        }

        // 清空唤醒管道，保证下次 start 后不会立即被唤醒
        char drain[16];
        while (read(wakePipe[0], drain, sizeof(drain)) > 0) {
        }

        // 移除所有监控，目录删除的 IN_IGNORED 也不会再被处理
        {
            std::lock_guard<std::mutex> lock(wdMutex);
            for (auto& pair : wdToDirectory) {
                inotify_rm_watch(inotifyFd, pair.first);
            }
            wdToDirectory.clear();
        }
    }
};

// 轮询实现：周期扫描目录，把上一次快照中没有的条目当作新建
class PollingFileSystemMonitor : public FileSystemMonitor {
private:
    std::chrono::milliseconds interval;
    std::unordered_map<std::string, std::set<std::string>> snapshots;
    std::mutex snapshotMutex;
    std::mutex wakeMutex;
    std::condition_variable wakeCV;

    std::set<std::string> takeSnapshot(const std::string& directory) {
        std::set<std::string> names;
        std::error_code ec;
        for (const auto& entry : FileSystem::listEntries(directory, ec)) {
            names.insert(entry.filename().string());
        }
        if (ec) {
            logger->debug("Cannot scan " + directory + ": " + ec.message());
        }
        return names;
    }

    void monitorThreadFunc() {
        while (running) {
            {
                std::unique_lock<std::mutex> lock(wakeMutex);
                wakeCV.wait_for(lock, interval, [this]() { return !running; });
            }
            if (!running) {
                break;
            }

            std::vector<IncomingEvent> events;
            {
                std::lock_guard<std::mutex> lock(snapshotMutex);
                for (auto& pair : snapshots) {
                    std::set<std::string> current = takeSnapshot(pair.first);
                    for (const auto& name : current) {
                        if (pair.second.count(name) == 0) {
                            std::filesystem::path path = std::filesystem::path(pair.first) / name;
                            std::error_code ec;
                            events.push_back({path.string(), std::filesystem::is_directory(path, ec)});
                        }
                    }
                    pair.second = std::move(current);
                }
            }

            // 回调在锁外执行，避免回调里调用 add/remove 造成死锁
            for (const auto& event : events) {
                if (!running) {
                    break;
                }
                if (eventCallback) {
                    eventCallback(event);
                }
            }
        }
    }

public:
    PollingFileSystemMonitor(ILogger* log, std::chrono::milliseconds pollInterval)
        : FileSystemMonitor(log), interval(pollInterval) {
        if (interval.count() <= 0) {
            interval = std::chrono::milliseconds(1000);
        }
    }

    ~PollingFileSystemMonitor() override {
        stop();
    }

    bool addWatchDirectory(const std::string& directory) override {
        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec)) {
            logger->error("Cannot watch " + directory + ": not a directory");
            return false;
        }

        // 添加时的已有内容不算新建
        std::set<std::string> initial = takeSnapshot(directory);
        std::lock_guard<std::mutex> lock(snapshotMutex);
        snapshots[directory] = std::move(initial);
        return true;
    }

    bool removeWatchDirectory(const std::string& directory) override {
        std::lock_guard<std::mutex> lock(snapshotMutex);
        return snapshots.erase(directory) > 0;
    }

    bool start() override {
        if (running) {
            return true;
        }

        {
            std::lock_guard<std::mutex> lock(snapshotMutex);
            if (snapshots.empty()) {
                logger->error("No directory to watch");
                return false;
            }
        }

        running = true;
        monitorThread = std::thread(&PollingFileSystemMonitor::monitorThreadFunc, this);
        return true;
    }

    void stop() override {
        if (!running) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(wakeMutex);
            running = false;
        }
        wakeCV.notify_all();

        if (monitorThread.joinable()) {
            monitorThread.join();
        }

        std::lock_guard<std::mutex> lock(snapshotMutex);
        snapshots.clear();
    }
};

} // namespace

// 工厂函数实现
std::unique_ptr<FileSystemMonitor> createFileSystemMonitor(MonitorBackend backend,
                                                           ILogger* logger,
                                                           std::chrono::milliseconds pollInterval) {
    if (backend == MonitorBackend::POLLING) {
        return std::make_unique<PollingFileSystemMonitor>(logger, pollInterval);
    }
    return std::make_unique<InotifyFileSystemMonitor>(logger);
}
