#pragma once

#include "fastxls/formula/Ptg.hpp"

#include <string>

namespace fastxls {
namespace formula {

/**
 * @brief A1 地址格式工具类
 *
 * 提供 A1 样式地址与行列索引之间的转换，支持：
 * - 单元格：A1, $B$2, IV65536
 * - 工作表名引号规则：'first sheet'!A1, Sheet1!A1
 */
class CellAddress {
public:
    /**
     * @brief 将列索引转换为列字母 (0->A, 25->Z, 26->AA)
     */
    static std::string columnToLetters(int index);

    /**
     * @brief 将列字母转换为索引，非法时返回 -1
     */
    static int lettersToColumn(const std::string& letters);

    /**
     * @brief 格式化单元格引用，绝对部分加 '$'
     *
     * @example
     * format({0, 0, true, true})   // "A1"
     * format({2, 0, false, false}) // "$A$3"
     */
    static std::string format(const CellRef& ref);

    /**
     * @brief 格式化区域引用 "A1:B2"
     */
    static std::string formatArea(const CellRef& first, const CellRef& last);

    /**
     * @brief 解析 "[$]列[$]行"，不合法时返回 false
     */
    static bool parse(const std::string& text, CellRef& out);

    /**
     * @brief 需要时给工作表名加引号，内部的单引号写成两个
     */
    static std::string quoteSheetName(const std::string& sheet_name);

private:
    static bool needsQuoting(const std::string& sheet_name);
};

} // namespace formula
} // namespace fastxls
