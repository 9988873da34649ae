#include <iostream>
#include <string>
#include <vector>
#include <limits>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include "core/MonitorController.hpp"
#include "core/SorterConfig.hpp"
#include "utils/ConsoleLogger.hpp"

// 命令行选项
struct AppOptions {
    std::string configPath;                   // 为空时使用可执行文件旁的 config.json
    std::string baseDir;                      // 启动时直接选择的基础目录
    bool polling = false;                     // 使用轮询代替 inotify
    int pollIntervalMs = 1000;                // 轮询间隔（毫秒）
    std::string logFile = "file_monitor.log"; // 日志文件，"-" 表示不写文件
    bool autoStart = false;                   // 选择目录后立即开始监控
    bool verbose = false;                     // 输出DEBUG日志
};

enum class ParseResult {
    RUN,
    HELP,
    INVALID
};

// 用户界面抽象接口
class IUserInterface {
public:
    virtual ~IUserInterface() = default;

    // 运行界面
    virtual void run() = 0;

    // 选择基础目录
    virtual void selectBaseDirectory() = 0;

    // 开始监控
    virtual void startMonitoring() = 0;

    // 停止监控
    virtual void stopMonitoring() = 0;

    // 显示当前状态
    virtual void showStatus() = 0;

    // 显示消息
    virtual void showMessage(const std::string& message) = 0;

    // 显示错误
    virtual void showError(const std::string& message) = 0;
};

static void showHelp() {
    std::cout << "=== File Sorter Help Information ===\n";
    std::cout << "Usage: FileSorter [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>    Configuration file (default: config.json beside the executable)\n";
    std::cout << "  --base <path>      Select the base directory on startup\n";
    std::cout << "  --start            Start monitoring right after selecting the base directory\n";
    std::cout << "  --polling          Scan the incoming directory periodically instead of using inotify\n";
    std::cout << "  --interval <ms>    Polling interval in milliseconds (default: 1000)\n";
    std::cout << "  --log-file <path>  Append log records to this file (default: file_monitor.log, '-' disables)\n";
    std::cout << "  --verbose          Show debug log records\n";
    std::cout << "  -h, --help         Show this help information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  FileSorter --base ~/Inbox --start       Sort files dropped into ~/Inbox/<incoming_directory>\n";
    std::cout << "  FileSorter --config ./my.json --polling Use a custom configuration with the polling monitor\n";
}

// 解析命令行参数
static ParseResult parseArguments(int argc, char** argv, AppOptions& options) {
    std::vector<std::string> args(argv + 1, argv + argc);

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-h" || args[i] == "--help") {
            return ParseResult::HELP;
        } else if (args[i] == "--config" && i + 1 < args.size()) {
            options.configPath = args[++i];
        } else if (args[i] == "--base" && i + 1 < args.size()) {
            options.baseDir = args[++i];
        } else if (args[i] == "--start") {
            options.autoStart = true;
        } else if (args[i] == "--polling") {
            options.polling = true;
        } else if (args[i] == "--interval" && i + 1 < args.size()) {
            try {
                options.pollIntervalMs = std::stoi(args[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid polling interval: " << args[i] << "\n";
                return ParseResult::INVALID;
            }
            if (options.pollIntervalMs <= 0) {
                std::cerr << "Polling interval must be positive.\n";
                return ParseResult::INVALID;
            }
        } else if (args[i] == "--log-file" && i + 1 < args.size()) {
            options.logFile = args[++i];
        } else if (args[i] == "--verbose") {
            options.verbose = true;
        } else {
            std::cerr << "Unknown option: " << args[i] << "\n";
            return ParseResult::INVALID;
        }
    }
    return ParseResult::RUN;
}

// 可执行文件所在目录，取不到时使用当前目录
static std::filesystem::path executableDirectory() {
    std::error_code ec;
    std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return std::filesystem::current_path(ec);
    }
    return exe.parent_path();
}

// 命令行界面实现 - 作为IUserInterface的具体实现
class CommandLineInterface : public IUserInterface {
private:
    MonitorController& controller;

public:
    explicit CommandLineInterface(MonitorController& controller)
        : controller(controller) {}

    void run() override {
        int choice = -1;
        do {
            displayMenu();
            std::cout << "Please choose your operation [0-5]: ";

            // 输入验证，输入结束时按退出处理
            while (!(std::cin >> choice)) {
                if (std::cin.eof()) {
                    choice = 0;
                    break;
                }
                std::cin.clear();
                std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
                std::cout << "Invalid input, please enter a number [0-5]: ";
            }

            handleUserChoice(choice);
        } while (choice != 0);
    }

    void selectBaseDirectory() override {
        std::string newPath;
        std::cout << "Enter base directory path (Current: " << currentBaseDirectory() << "): ";
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::getline(std::cin, newPath);
        if (newPath.empty()) {
            showMessage("Base directory unchanged");
            return;
        }
        if (controller.selectDirectory(newPath)) {
            showMessage("Base directory set to: " + controller.getBaseDirectory().string());
        } else {
            showError("Could not use " + newPath + " as base directory");
        }
    }

    void startMonitoring() override {
        if (controller.start()) {
            showMessage("Monitoring " + (controller.getBaseDirectory() / controller.getConfig().incomingDirectory).string());
        } else {
            showError("Monitoring was not started");
        }
    }

    void stopMonitoring() override {
        if (!controller.isRunning()) {
            showMessage("Monitoring is not running");
            return;
        }
        controller.stop();
        showMessage("Monitoring stopped");
    }

    void showStatus() override {
        const SorterConfig& config = controller.getConfig();
        std::cout << "=== Status ===\n";
        std::cout << "Base directory : " << currentBaseDirectory() << "\n";
        std::cout << "Monitor        : " << toString(controller.getState())
                  << " (" << toString(controller.getBackend()) << ")\n";
        std::cout << "Incoming       : " << config.incomingDirectory << "\n";
        std::cout << "Sorted         : " << config.sortedDirectory << "\n";
        std::cout << "Archive        : " << config.archiveDirectory << "\n";
        std::cout << "Extensions     :\n";
        for (const auto& entry : config.extensionMap) {
            std::cout << "  " << entry.first << " -> " << entry.second << "\n";
        }
    }

    void showMessage(const std::string& message) override {
        std::cout << "[Info] " << message << "\n";
    }

    void showError(const std::string& message) override {
        std::cout << "[Error] " << message << "\n";
    }

private:
    std::string currentBaseDirectory() const {
        return controller.hasBaseDirectory() ? controller.getBaseDirectory().string() : "No directory selected";
    }

    // Display interactive menu
    void displayMenu() {
        std::cout << "\n=== Live File Sorting Monitor ===\n";
        std::cout << "[1] Select Base Directory (Current: " << currentBaseDirectory() << ")\n";
        std::cout << "[2] Start Monitoring\n";
        std::cout << "[3] Stop Monitoring\n";
        std::cout << "[4] Show Status (" << toString(controller.getState()) << ")\n";
        std::cout << "[5] Show Help\n";
        std::cout << "[0] Exit Program\n";
    }

    // Handle user selection
    void handleUserChoice(int choice) {
        switch (choice) {
            case 1:
                selectBaseDirectory();
                break;
            case 2:
                startMonitoring();
                break;
            case 3:
                stopMonitoring();
                break;
            case 4:
                showStatus();
                break;
            case 5:
                showHelp();
                break;
            case 0:
                std::cout << "Thank you for using File Sorter, goodbye!\n";
                break;
            default:
                std::cout << "Invalid selection, please try again.\n";
        }
    }
};

int main(int argc, char* argv[]) {
    AppOptions options;
    ParseResult parsed = parseArguments(argc, argv, options);
    if (parsed == ParseResult::HELP) {
        showHelp();
        return EXIT_SUCCESS;
    }
    if (parsed == ParseResult::INVALID) {
        showHelp();
        return EXIT_FAILURE;
    }

    ConsoleLogger logger(options.verbose ? LogLevel::DEBUG : LogLevel::INFO);
    if (options.logFile != "-" && !logger.setLogFile(options.logFile)) {
        logger.warn("Continuing without a log file");
    }

    if (options.configPath.empty()) {
        options.configPath = (executableDirectory() / "config.json").string();
    }

    // 配置错误是致命的，监控开始前直接退出
    SorterConfig config;
    if (!ConfigLoader::load(options.configPath, config, &logger)) {
        logger.error("Failed to load configuration. Exiting.");
        return EXIT_FAILURE;
    }

    MonitorController controller(config, &logger,
                                 options.polling ? MonitorBackend::POLLING : MonitorBackend::NATIVE,
                                 std::chrono::milliseconds(options.pollIntervalMs));
    CommandLineInterface cli(controller);

    if (!options.baseDir.empty()) {
        if (!controller.selectDirectory(options.baseDir)) {
            logger.error("Cannot use base directory " + options.baseDir);
            return EXIT_FAILURE;
        }
        if (options.autoStart && !controller.start()) {
            return EXIT_FAILURE;
        }
    } else if (options.autoStart) {
        logger.warn("--start ignored: no base directory given with --base");
    }

    // 启动应用
    cli.run();

    controller.stop();
    return EXIT_SUCCESS;
}
