#include "fastxls/utils/Logger.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>
#include <fmt/chrono.h>

#ifdef _WIN32
#include <windows.h>
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace fastxls {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path,
                        Level level,
                        bool enable_console,
                        size_t max_file_size,
                        size_t max_files,
                        WriteMode write_mode) {
    if (initialized_.load() || shutting_down_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // 双重检查
    if (initialized_.load() || shutting_down_.load()) {
        return;
    }

    current_level_.store(level);
    enable_console_.store(enable_console);
    log_file_path_ = log_file_path;
    max_file_size_ = max_file_size;
    max_files_ = max_files == 0 ? 1 : max_files;
    write_mode_ = write_mode;

    // 创建日志目录；失败时只保留控制台输出
    std::error_code ec;
    std::filesystem::path log_dir = std::filesystem::path(log_file_path_).parent_path();
    if (!log_dir.empty()) {
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            std::cerr << "Logger cannot create log directory " << log_dir.string()
                      << ": " << ec.message() << std::endl;
        }
    }

    std::ios::openmode open_mode = (write_mode_ == WriteMode::APPEND)
                                       ? (std::ios::out | std::ios::app)
                                       : (std::ios::out | std::ios::trunc);
    file_stream_.open(log_file_path_, open_mode);
    current_file_size_ = 0;
    if (file_stream_.is_open() && write_mode_ == WriteMode::APPEND) {
        file_stream_.seekp(0, std::ios::end);
        current_file_size_ = static_cast<size_t>(file_stream_.tellp());
    }

#ifdef _WIN32
    if (enable_console) {
        SetConsoleOutputCP(CP_UTF8);
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        if (hOut != INVALID_HANDLE_VALUE) {
            DWORD dwMode = 0;
            if (GetConsoleMode(hOut, &dwMode)) {
                SetConsoleMode(hOut, dwMode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
            }
        }
    }
#endif

    initialized_.store(true);

    if (should_log(Level::INFO)) {
        std::string msg = format_message(Level::INFO,
            fmt::format("Logger initialized. Log file: {}, Mode: {}",
                        log_file_path_, (write_mode_ == WriteMode::APPEND ? "APPEND" : "TRUNCATE")));
        if (enable_console_.load()) {
            log_to_console(Level::INFO, msg);
        }
        log_to_file(msg);
    }
}

void Logger::setLevel(Level level) {
    current_level_.store(level);
}

Logger::Level Logger::getLevel() const {
    return current_level_.load();
}

bool Logger::should_log(Level level) const {
    return static_cast<int>(level) >= static_cast<int>(current_level_.load()) &&
           !shutting_down_.load();
}

void Logger::write(Level level, const std::string& message) {
    if (!should_log(level)) return;

    if (!initialized_.load()) {
        initialize();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) return;

    std::string formatted_message = format_message(level, message);
    if (enable_console_.load()) {
        log_to_console(level, formatted_message);
    }
    log_to_file(formatted_message);

    // 告警及以上立即落盘
    if (level >= Level::WARN) {
        flush_unlocked();
    }
}

void Logger::log_to_console(Level level, const std::string& message) {
    const char* color_code = "\033[0m";
    switch (level) {
        case Level::TRACE:    color_code = "\033[37m"; break;
        case Level::DEBUG:    color_code = "\033[36m"; break;
        case Level::INFO:     color_code = "\033[32m"; break;
        case Level::WARN:     color_code = "\033[33m"; break;
        case Level::ERROR:    color_code = "\033[31m"; break;
        case Level::CRITICAL: color_code = "\033[35m"; break;
        default: break;
    }
    std::cout << color_code << message << "\033[0m" << '\n';
}

void Logger::log_to_file(const std::string& message) {
    if (!file_stream_.is_open()) {
        return;
    }
    rotate_file_if_needed();
    file_stream_ << message << '\n';
    current_file_size_ += message.length() + 1;
}

void Logger::rotate_file_if_needed() {
    if (current_file_size_ < max_file_size_) {
        return;
    }

    file_stream_.close();

    std::error_code ec;
    for (size_t i = max_files_ - 1; i > 0; --i) {
        std::string old_file = get_rotated_filename(i - 1);
        if (i - 1 == 0 || !std::filesystem::exists(old_file, ec)) {
            continue;
        }
        std::filesystem::rename(old_file, get_rotated_filename(i), ec);
    }
    if (std::filesystem::exists(log_file_path_, ec)) {
        std::filesystem::rename(log_file_path_, get_rotated_filename(1), ec);
    }

    file_stream_.open(log_file_path_, std::ios::out | std::ios::trunc);
    current_file_size_ = 0;
}

std::string Logger::get_rotated_filename(size_t index) const {
    if (index == 0) {
        return log_file_path_;
    }
    return fmt::format("{}.{}", log_file_path_, index);
}

std::string Logger::format_message(Level level, const std::string& message) const {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return fmt::format("[{}] [{}] [{}] {}", get_timestamp(), level_to_string(level), oss.str(), message);
}

const char* Logger::level_to_string(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO ";
        case Level::WARN:     return "WARN ";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRIT ";
        default:              return "UNKN ";
    }
}

std::string Logger::get_timestamp() const {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now())));
}

void Logger::flush_unlocked() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    std::cout.flush();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    flush_unlocked();
}

void Logger::shutdown() {
    shutting_down_.store(true);

    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }

    if (initialized_.load()) {
        if (file_stream_.is_open()) {
            file_stream_.flush();
            file_stream_.close();
        }
        initialized_.store(false);
    }
    // 允许测试夹具在 TearDown 之后重新初始化
    shutting_down_.store(false);
}

Logger::~Logger() {
    shutdown();
}

} // namespace fastxls
