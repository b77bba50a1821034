#include "FastXLS.hpp"

#include "fastxls/utils/Logger.hpp"
#include <iostream>

namespace fastxls {

// 初始化和清理函数实现

FASTXLS_API bool initialize(const std::string& log_file_path, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, Logger::Level::INFO, enable_console);
        FASTXLS_LOG_INFO("FastXLS library initialized successfully");
        FASTXLS_LOG_INFO("Version: {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统不可用，输出到标准错误
        if (enable_console) {
            std::cerr << "Failed to initialize FastXLS: " << e.what() << std::endl;
        }
        return false;
    }
}

FASTXLS_API void cleanup() {
    FASTXLS_LOG_INFO("FastXLS library cleanup completed");
    Logger::getInstance().shutdown();
}

FASTXLS_API std::unique_ptr<core::Workbook> createWorkbook(const core::WorkbookOptions& options) {
    return core::Workbook::create(options);
}

FASTXLS_API std::unique_ptr<core::Workbook> openWorkbook(const std::string& filename, core::OpenMode mode) {
    return core::Workbook::open(core::Path(filename), mode);
}

} // namespace fastxls
