#include "Logger.hpp"

#include <cstdlib>
#include <filesystem>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

spdlog::level::level_enum level_from_env()
{
    if (const char* value = std::getenv("DUALPANE_TREE_LOG_LEVEL")) {
        return spdlog::level::from_str(value);
    }
    return spdlog::level::info;
}
}

const std::vector<std::string>& Logger::logger_names()
{
    static const std::vector<std::string> names = {"core_logger", "tree_logger"};
    return names;
}

std::string Logger::get_log_directory()
{
    if (const char* override_root = std::getenv("DUALPANE_TREE_CONFIG_DIR")) {
        return (std::filesystem::path(override_root) / "DualPaneTree" / "logs").string();
    }
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / ".cache" / "DualPaneTree" / "logs").string();
    }
    return "logs";
}

void Logger::setup_loggers()
{
    const std::filesystem::path log_dir = get_log_directory();
    std::filesystem::create_directories(log_dir);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (log_dir / "dualpane_tree.log").string(), kMaxLogFileSize, kMaxLogFiles);

    const auto level = level_from_env();
    for (const auto& name : logger_names()) {
        if (spdlog::get(name)) {
            continue;
        }
        auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
