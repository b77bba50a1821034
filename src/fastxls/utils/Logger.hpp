#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <algorithm>
#include <atomic>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace fastxls {

/**
 * @brief 全局日志器
 *
 * 控制台 + 滚动文件两路输出，格式化统一走 {fmt}。
 * 库内部不直接调用，使用 ModuleLoggers.hpp 中的模块宏。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "logs/fastxls.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;

    void trace(const std::string& message)    { write(Level::TRACE, message); }
    void debug(const std::string& message)    { write(Level::DEBUG, message); }
    void info(const std::string& message)     { write(Level::INFO, message); }
    void warn(const std::string& message)     { write(Level::WARN, message); }
    void error(const std::string& message)    { write(Level::ERROR, message); }
    void critical(const std::string& message) { write(Level::CRITICAL, message); }

    /**
     * @brief 格式化后写入；格式串与参数不匹配时退化为原样输出格式串
     */
    template<typename... Args>
    inline void log(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        try {
            write(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error&) {
            write(level, fmt_str);
        }
    }

    void flush();
    void shutdown();

    // 带源码位置信息的便捷接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        if constexpr (sizeof...(Args) == 0) {
            write(level, fmt_with_ctx);
        } else {
            log(level, fmt_with_ctx, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void write(Level level, const std::string& message);
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;
    void flush_unlocked();

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define FASTXLS_FUNC __FUNCTION__
#else
#  define FASTXLS_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define FASTXLS_LOG_TRACE(fmt, ...)    ::fastxls::Logger::getInstance().logCtx(::fastxls::Logger::Level::TRACE,    __FILE__, __LINE__, FASTXLS_FUNC, fmt, ##__VA_ARGS__)
#define FASTXLS_LOG_DEBUG(fmt, ...)    ::fastxls::Logger::getInstance().logCtx(::fastxls::Logger::Level::DEBUG,    __FILE__, __LINE__, FASTXLS_FUNC, fmt, ##__VA_ARGS__)
#define FASTXLS_LOG_INFO(fmt, ...)     ::fastxls::Logger::getInstance().logCtx(::fastxls::Logger::Level::INFO,     __FILE__, __LINE__, FASTXLS_FUNC, fmt, ##__VA_ARGS__)
#define FASTXLS_LOG_WARN(fmt, ...)     ::fastxls::Logger::getInstance().logCtx(::fastxls::Logger::Level::WARN,     __FILE__, __LINE__, FASTXLS_FUNC, fmt, ##__VA_ARGS__)
#define FASTXLS_LOG_ERROR(fmt, ...)    ::fastxls::Logger::getInstance().logCtx(::fastxls::Logger::Level::ERROR,    __FILE__, __LINE__, FASTXLS_FUNC, fmt, ##__VA_ARGS__)
#define FASTXLS_LOG_CRITICAL(fmt, ...) ::fastxls::Logger::getInstance().logCtx(::fastxls::Logger::Level::CRITICAL, __FILE__, __LINE__, FASTXLS_FUNC, fmt, ##__VA_ARGS__)

} // namespace fastxls
