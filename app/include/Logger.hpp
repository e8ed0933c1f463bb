#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

/**
 * Named spdlog loggers shared across the application.
 *
 * "core_logger" covers providers, settings and startup; "chat_logger" covers
 * the conversation loop. Both write to rotating files so the console stays
 * reserved for the chat itself.
 */
class Logger {
public:
    static void setup_loggers(bool verbose = false);

    /**
     * @return The named logger, or nullptr when setup_loggers() has not run
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::string get_log_directory();

private:
    static std::string get_log_file_path(const std::string& log_dir, const std::string& log_name);
};

#endif // LOGGER_HPP
