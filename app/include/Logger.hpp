#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

class Logger {
public:
    /**
     * @brief Create the named loggers used by the engine.
     *
     * Loggers write to a colored console sink and to a rotating file inside
     * get_log_directory(). Throws spdlog::spdlog_ex when a sink cannot be
     * created.
     */
    static void setup_loggers();

    /**
     * @brief Look up a logger created by setup_loggers().
     * @return The logger, or nullptr when logging was never set up.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::string get_log_directory();
    static const std::vector<std::string>& logger_names();
};

#endif
