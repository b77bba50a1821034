#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace fastxls {
namespace core {

/**
 * @brief FastXLS统一错误码
 *
 * 底层（复合文档、记录编解码、有界表）通过 Expected 返回错误码，
 * 用户层 API 转换为对应的异常类型抛出。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,
    InvalidState = 4,
    CapacityExceeded = 5,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileWriteError = 23,
    FileReadError = 24,

    // 工作簿/格式错误 (40-59)
    InvalidWorksheet = 41,
    InvalidFormat = 43,
    InvalidFormula = 44,
    UnsupportedVersion = 45,

    // 记录流错误 (60-79)
    SizeMismatch = 62
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

}} // namespace fastxls::core
