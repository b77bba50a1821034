#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "fastxls/core/Constants.hpp"

namespace fastxls {
namespace core {

/**
 * @file WorkbookTypes.hpp
 * @brief 工作簿相关的类型定义
 */

/**
 * @brief 文件打开模式
 */
enum class OpenMode {
    ReadOnly,   // 只读，只能整体写出到新目标
    ReadWrite   // 可随机读写，支持原地写回
};

/**
 * @brief 工作簿数据来源，决定能否原地写回
 */
enum class WorkbookSource {
    NEW_WORKBOOK,      // 内存中新建
    BYTE_STREAM,       // 来自字节缓冲区或输入流
    FILE_READ_ONLY,    // 只读打开的文件
    FILE_READ_WRITE    // 读写打开的文件
};

inline const char* toString(WorkbookSource source) {
    switch (source) {
        case WorkbookSource::NEW_WORKBOOK:    return "new workbook";
        case WorkbookSource::BYTE_STREAM:     return "stream";
        case WorkbookSource::FILE_READ_ONLY:  return "read-only file";
        case WorkbookSource::FILE_READ_WRITE: return "read-write file";
    }
    return "unknown";
}

/**
 * @brief 工作簿选项配置结构体
 */
struct WorkbookOptions {
    std::string default_sheet_prefix = "Sheet";          // createSheet() 无参时的名称前缀
    size_t max_cell_styles = Constants::kMaxCellStyles;  // 单元格样式表容量
    bool drop_stale_offset_records = true;               // 加载时丢弃 INDEX/DBCELL/EXTSST
    uint16_t container_major_version = 3;                // 新建复合文档的主版本（3 或 4）
};

}} // namespace fastxls::core
