#pragma once

#include "fastxls/formula/Formula.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fastxls {
namespace formula {

/**
 * @brief 公式文本与记号互转时需要的工作簿信息
 *
 * 由结构模型实现：三维引用通过外部工作表索引间接指向工作表。
 */
class FormulaContext {
public:
    virtual ~FormulaContext() = default;

    /**
     * @brief 外部工作表索引对应的工作表名
     * @return 工作表已删除或索引无效时返回 std::nullopt
     */
    virtual std::optional<std::string> sheetNameForExternIndex(uint16_t extern_index) const = 0;

    /**
     * @brief 指向该工作表的外部工作表索引，没有时新建
     * @return 工作表不存在时返回 -1
     */
    virtual int externIndexForSheet(const std::string& sheet_name) = 0;

    /**
     * @brief 名称文本，index 从 1 开始
     */
    virtual std::string nameText(uint16_t index) const = 0;

    /**
     * @brief 按名称文本查找，返回从 1 开始的索引；不存在时返回 0
     */
    virtual uint16_t nameIndexForText(const std::string& text) const = 0;
};

enum class FormulaType {
    Cell,        // 单元格公式，运算数取值类别
    NamedRange   // 名称定义，引用取引用类别，允许顶层并集
};

/**
 * @brief 公式文本解析
 *
 * 支持单元格/区域引用（可带工作表名）、数值、字符串、TRUE/FALSE、
 * 四则运算与乘方、比较、'&'、括号、名称以及常用函数。
 */
class FormulaParser {
public:
    /**
     * @throws FormulaException 语法错误、未知工作表、未知名称或函数
     */
    static Formula parse(const std::string& text, FormulaContext& context, FormulaType type);
};

/**
 * @brief 把记号序列还原为公式文本（不带前导 '='）
 */
class FormulaRenderer {
public:
    /**
     * @throws FormulaException 记号序列无法还原（原始字节保存的公式、共享公式）
     */
    static std::string render(const Formula& formula, const FormulaContext& context);
};

} // namespace formula
} // namespace fastxls
