/**
 * @file Exception.cpp
 * @brief FastXLS异常类实现
 */

#include "fastxls/core/Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace fastxls {
namespace core {

// FastXLSException 实现
FastXLSException::FastXLSException(const std::string& message,
                                   ErrorCode code,
                                   const char* file,
                                   int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string FastXLSException::getErrorCodeString() const {
    switch (error_code_) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::CapacityExceeded: return "CapacityExceeded";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileAccessDenied: return "FileAccessDenied";
        case ErrorCode::FileWriteError: return "FileWriteError";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::InvalidWorksheet: return "InvalidWorksheet";
        case ErrorCode::InvalidFormat: return "InvalidFormat";
        case ErrorCode::InvalidFormula: return "InvalidFormula";
        case ErrorCode::UnsupportedVersion: return "UnsupportedVersion";
        case ErrorCode::SizeMismatch: return "SizeMismatch";
    }
    return "Unknown";
}

std::string FastXLSException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void FastXLSException::addContext(const std::string& context) {
    context_.push_back(context);
}

// FileException 实现
FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : FastXLSException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

// FormatException 实现
FormatException::FormatException(const std::string& message, const char* file, int line)
    : FastXLSException(message, ErrorCode::InvalidFormat, file, line) {
}

FormatException::FormatException(const std::string& message, ErrorCode code,
                                 const char* file, int line)
    : FastXLSException(message, code, file, line) {
}

// OldFormatException 实现
OldFormatException::OldFormatException(const std::string& generation, const char* file, int line)
    : FormatException(fmt::format("The supplied data appears to be in the {} format. "
                                  "FastXLS only supports the BIFF8 format (Excel 97 and later)",
                                  generation),
                      ErrorCode::UnsupportedVersion, file, line)
    , generation_(generation) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : FastXLSException(fmt::format("{} (parameter: {})", message, parameter_name),
                       ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// InvalidStateException 实现
InvalidStateException::InvalidStateException(const std::string& message, const char* file, int line)
    : FastXLSException(message, ErrorCode::InvalidState, file, line) {
}

InvalidStateException::InvalidStateException(const std::string& message, ErrorCode code,
                                             const char* file, int line)
    : FastXLSException(message, code, file, line) {
}

// SizeMismatchException 实现
SizeMismatchException::SizeMismatchException(const std::string& message,
                                             uint16_t sid, size_t declared_size, size_t actual_size,
                                             const char* file, int line)
    : InvalidStateException(message, ErrorCode::SizeMismatch, file, line)
    , sid_(sid)
    , declared_size_(declared_size)
    , actual_size_(actual_size) {
}

// CapacityExceededException 实现
CapacityExceededException::CapacityExceededException(const std::string& message, size_t limit,
                                                     const char* file, int line)
    : FastXLSException(message, ErrorCode::CapacityExceeded, file, line)
    , limit_(limit) {
}

// WorksheetException 实现
WorksheetException::WorksheetException(const std::string& message,
                                       const std::string& worksheet_name,
                                       ErrorCode code, const char* file, int line)
    : FastXLSException(fmt::format("{} (worksheet: {})", message, worksheet_name), code, file, line)
    , worksheet_name_(worksheet_name) {
}

// FormulaException 实现
FormulaException::FormulaException(const std::string& message, const std::string& formula,
                                   const char* file, int line)
    : FastXLSException(fmt::format("{} (formula: {})", message, formula),
                       ErrorCode::InvalidFormula, file, line)
    , formula_(formula) {
}

} // namespace core
} // namespace fastxls
