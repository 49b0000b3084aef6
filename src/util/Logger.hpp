/**
 * @file Logger.hpp
 * @brief Process-wide logger for acquisition runs
 *
 * Writes timestamped, component-tagged lines to a rotating log file in the
 * user's data directory and, optionally, mirrors them to stderr. An
 * acquisition can additionally attach a session file so that every line
 * produced during one run is kept next to the evidence it describes.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @class Logger
 * @brief Thread-safe singleton logger
 *
 * Usage:
 * @code
 * util::Logger::instance().initialize(log_dir, "fuji-acquire");
 * LOG_INFO("DiskInspector", std::format("Describing {}", path.string()));
 * @endcode
 *
 * Logging before initialize() is legal; lines then only reach stderr when
 * console output is enabled.
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Open {log_dir}/{app_name}.log for appending
     * @param log_dir Directory for log files (created if missing)
     * @param app_name Base name of the log file
     * @param min_level Lines below this level are dropped
     * @param max_file_size_bytes Size at which the file rotates to .1.log
     * @return true if the log file is open
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO,
                    std::size_t max_file_size_bytes = 10 * 1024 * 1024) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    /**
     * @brief Mirror subsequent lines into an additional file
     * @param path Session log file (truncated on open)
     * @return true if the file could be opened
     */
    auto begin_session(const std::filesystem::path& path) -> bool;

    /**
     * @brief Stop mirroring into the session file
     */
    void end_session();

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Enable/disable echoing lines to stderr
     */
    void set_console_output(bool enable);

    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    void shutdown();

    /**
     * @brief Render one log line (without trailing newline)
     */
    [[nodiscard]] static auto format_line(LogLevel level, std::string_view component,
                                          std::string_view message) -> std::string;

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] static auto timestamp() -> std::string;
    [[nodiscard]] static auto level_tag(LogLevel level) -> std::string_view;

    void rotate_if_needed();
    auto open_file() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::ofstream session_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    std::size_t max_file_size_bytes_ = 0;
    std::size_t current_file_size_ = 0;
    bool initialized_ = false;
    bool console_output_ = false;
};

#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
