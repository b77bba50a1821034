/**
 * @file Exception.hpp
 * @brief FastXLS异常类定义
 */

#ifndef FASTXLS_EXCEPTION_HPP
#define FASTXLS_EXCEPTION_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace fastxls {
namespace core {

/**
 * @brief FastXLS基础异常类
 */
class FastXLSException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    FastXLSException(const std::string& message,
                     ErrorCode code = ErrorCode::InternalError,
                     const char* file = nullptr,
                     int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取错误代码字符串
     */
    std::string getErrorCodeString() const;

    /**
     * @brief 获取详细错误信息（错误码、源码位置、上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    /**
     * @brief 添加上下文信息
     */
    void addContext(const std::string& context);

    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public FastXLSException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 格式相关异常：签名不符、扇区链损坏、记录截断
 */
class FormatException : public FastXLSException {
public:
    FormatException(const std::string& message,
                    const char* file = nullptr, int line = 0);

protected:
    FormatException(const std::string& message, ErrorCode code,
                    const char* file, int line);
};

/**
 * @brief 旧版本格式异常（BIFF2 ~ BIFF5）
 */
class OldFormatException : public FormatException {
public:
    /**
     * @param generation 检测到的格式代际，例如 "BIFF5"
     */
    explicit OldFormatException(const std::string& generation,
                                const char* file = nullptr, int line = 0);

    const std::string& getGeneration() const { return generation_; }

private:
    std::string generation_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public FastXLSException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name,
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 当前状态下不允许的操作
 */
class InvalidStateException : public FastXLSException {
public:
    InvalidStateException(const std::string& message,
                          const char* file = nullptr, int line = 0);

protected:
    InvalidStateException(const std::string& message, ErrorCode code,
                          const char* file, int line);
};

/**
 * @brief 记录声明长度与实际序列化长度不一致
 */
class SizeMismatchException : public InvalidStateException {
public:
    SizeMismatchException(const std::string& message,
                          uint16_t sid, size_t declared_size, size_t actual_size,
                          const char* file = nullptr, int line = 0);

    uint16_t getSid() const noexcept { return sid_; }
    size_t getDeclaredSize() const noexcept { return declared_size_; }
    size_t getActualSize() const noexcept { return actual_size_; }

private:
    uint16_t sid_;
    size_t declared_size_;
    size_t actual_size_;
};

/**
 * @brief 有界资源表已满
 */
class CapacityExceededException : public FastXLSException {
public:
    CapacityExceededException(const std::string& message, size_t limit,
                              const char* file = nullptr, int line = 0);

    size_t getLimit() const noexcept { return limit_; }

private:
    size_t limit_;
};

/**
 * @brief 工作表相关异常
 */
class WorksheetException : public FastXLSException {
public:
    WorksheetException(const std::string& message,
                       const std::string& worksheet_name,
                       ErrorCode code = ErrorCode::InvalidWorksheet,
                       const char* file = nullptr, int line = 0);

    const std::string& getWorksheetName() const { return worksheet_name_; }

private:
    std::string worksheet_name_;
};

/**
 * @brief 公式文本解析异常
 */
class FormulaException : public FastXLSException {
public:
    FormulaException(const std::string& message,
                     const std::string& formula,
                     const char* file = nullptr, int line = 0);

    const std::string& getFormula() const { return formula_; }

private:
    std::string formula_;
};

} // namespace core
} // namespace fastxls

// 便捷宏定义：异常构造参数在前，源码位置自动追加
#define FASTXLS_THROW(ExceptionType, ...) \
    throw ExceptionType(__VA_ARGS__, __FILE__, __LINE__)

#define FASTXLS_THROW_IF(condition, ExceptionType, ...) \
    do { if (condition) { FASTXLS_THROW(ExceptionType, __VA_ARGS__); } } while(0)

#endif // FASTXLS_EXCEPTION_HPP
