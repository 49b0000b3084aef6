/**
 * @file Logger.cpp
 * @brief Process-wide logger implementation
 */

#include "util/Logger.hpp"

#include <chrono>
#include <ctime>
#include <format>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace util {

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

auto Logger::initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                        LogLevel min_level, std::size_t max_file_size_bytes) -> bool {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    log_dir_ = log_dir;
    app_name_ = app_name;
    min_level_ = min_level;
    max_file_size_bytes_ = max_file_size_bytes;
    initialized_ = false;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << "Logger: cannot create " << log_dir_ << ": " << ec.message() << std::endl;
        return false;
    }

    if (!open_file()) {
        return false;
    }

    initialized_ = true;
    auto line = format_line(LogLevel::INFO, "Logger", std::format("Logging to {}", log_dir_.string()));
    file_ << line << '\n';
    file_.flush();
    current_file_size_ += line.size() + 1;
    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::open_file() -> bool {
    const auto path = log_dir_ / (app_name_ + ".log");
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Logger: cannot open " << path << std::endl;
        return false;
    }

    std::error_code ec;
    current_file_size_ = std::filesystem::file_size(path, ec);
    if (ec) {
        current_file_size_ = 0;
    }
    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < min_level_) {
        return;
    }

    const auto line = format_line(level, component, message);

    if (initialized_ && file_.is_open()) {
        rotate_if_needed();
        file_ << line << '\n';
        file_.flush();
        current_file_size_ += line.size() + 1;
    }

    if (session_.is_open()) {
        session_ << line << '\n';
        session_.flush();
    }

    if (console_output_) {
        std::cerr << line << '\n';
    }
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::WARNING, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::ERROR, component, message);
}

auto Logger::begin_session(const std::filesystem::path& path) -> bool {
    std::lock_guard lock(mutex_);
    if (session_.is_open()) {
        session_.close();
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    session_.open(path, std::ios::trunc);
    return session_.is_open();
}

void Logger::end_session() {
    std::lock_guard lock(mutex_);
    if (session_.is_open()) {
        session_.close();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    console_output_ = enable;
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return {};
    }
    return log_dir_ / (app_name_ + ".log");
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);
    if (session_.is_open()) {
        session_.close();
    }
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    initialized_ = false;
}

auto Logger::format_line(LogLevel level, std::string_view component, std::string_view message)
    -> std::string {
    return std::format("{} [{}] [{}] {}", timestamp(), level_tag(level), component, message);
}

auto Logger::timestamp() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count() << 'Z';
    return oss.str();
}

auto Logger::level_tag(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

void Logger::rotate_if_needed() {
    if (max_file_size_bytes_ == 0 || current_file_size_ < max_file_size_bytes_) {
        return;
    }

    file_.close();

    // Single generation: {app}.log -> {app}.1.log
    const auto current = log_dir_ / (app_name_ + ".log");
    const auto rotated = log_dir_ / (app_name_ + ".1.log");
    std::error_code ec;
    std::filesystem::remove(rotated, ec);
    std::filesystem::rename(current, rotated, ec);

    if (open_file()) {
        file_ << format_line(LogLevel::INFO, "Logger", "Log file rotated") << '\n';
    }
}

}  // namespace util
