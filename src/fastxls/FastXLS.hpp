#pragma once

// FastXLS库 - BIFF8 (.xls) 工作簿读写与结构维护

// 标准库依赖
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

// 公共类型定义
#include "fastxls/core/Exception.hpp"
#include "fastxls/core/Path.hpp"
#include "fastxls/core/WorkbookTypes.hpp"

// 公共接口
#include "fastxls/core/Name.hpp"
#include "fastxls/core/Workbook.hpp"
#include "fastxls/core/Worksheet.hpp"

// 版本信息
#define FASTXLS_VERSION_MAJOR 1
#define FASTXLS_VERSION_MINOR 0
#define FASTXLS_VERSION_PATCH 0
#define FASTXLS_VERSION_STRING "1.0.0"

// 平台检测
#ifdef _WIN32
    #define FASTXLS_WINDOWS
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#elif defined(__linux__)
    #define FASTXLS_LINUX
#elif defined(__APPLE__)
    #define FASTXLS_MACOS
#endif

// 导出宏定义
#ifdef FASTXLS_WINDOWS
    #ifdef FASTXLS_SHARED
        #ifdef FASTXLS_EXPORTS
            #define FASTXLS_API __declspec(dllexport)
        #else
            #define FASTXLS_API __declspec(dllimport)
        #endif
    #else
        #define FASTXLS_API
    #endif
#else
    #define FASTXLS_API
#endif

namespace fastxls {

inline std::string getVersion() {
    return FASTXLS_VERSION_STRING;
}

/**
 * @brief 初始化FastXLS库
 * @param log_file_path 日志文件路径
 * @param enable_console 是否启用控制台日志
 * @return 初始化是否成功
 */
FASTXLS_API bool initialize(const std::string& log_file_path = "logs/fastxls.log",
                            bool enable_console = true);

/**
 * @brief 清理FastXLS库资源
 */
FASTXLS_API void cleanup();

/**
 * @brief 新建内存工作簿
 */
FASTXLS_API std::unique_ptr<core::Workbook> createWorkbook(const core::WorkbookOptions& options = {});

/**
 * @brief 打开 .xls 文件
 * @param mode ReadWrite 时可以调用 Workbook::writeInPlace()
 */
FASTXLS_API std::unique_ptr<core::Workbook> openWorkbook(const std::string& filename,
                                                         core::OpenMode mode = core::OpenMode::ReadOnly);

} // namespace fastxls
