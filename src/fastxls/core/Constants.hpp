#pragma once

#include <cstddef>
#include <cstdint>

namespace fastxls {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // 工作表名称最大长度
    static constexpr size_t kMaxSheetNameLength = 31;

    // 单元格样式（XF）表容量：21 个内置 + 4009 个用户样式
    static constexpr size_t kBuiltinCellStyles = 21;
    static constexpr size_t kMaxCellStyles = 4030;

    // BIFF8 行列上限
    static constexpr uint32_t kMaxRows = 65536;
    static constexpr uint16_t kMaxColumns = 256;

    // 工作簿流在复合文档中的名称
    static constexpr const char* kWorkbookStreamName = "Workbook";
    static constexpr const char* kBiff5StreamName = "Book";
};

} // namespace core
} // namespace fastxls
