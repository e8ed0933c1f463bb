#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
}


void Logger::setup_loggers(bool verbose)
{
    const std::string log_dir = get_log_directory();
    std::filesystem::create_directories(log_dir);

    std::shared_ptr<spdlog::sinks::sink> console_sink;
    if (verbose) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::debug);
    }

    for (const char* name : {"core_logger", "chat_logger"}) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            get_log_file_path(log_dir, name), kMaxLogFileSize, kMaxLogFiles));
        if (console_sink) {
            sinks.push_back(console_sink);
        }

        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


std::string Logger::get_log_directory()
{
    if (const char* override_dir = std::getenv("PARLEY_LOG_DIR")) {
        return override_dir;
    }
#ifdef _WIN32
    if (const char* app_data = std::getenv("APPDATA")) {
        return (std::filesystem::path(app_data) / "Parley" / "logs").string();
    }
#endif
    if (const char* cache_home = std::getenv("XDG_CACHE_HOME")) {
        return (std::filesystem::path(cache_home) / "Parley" / "logs").string();
    }
    return (std::filesystem::path(Utils::get_home_directory()) / ".cache" / "Parley" / "logs").string();
}


std::string Logger::get_log_file_path(const std::string& log_dir, const std::string& log_name)
{
    return (std::filesystem::path(log_dir) / (log_name + ".log")).string();
}
