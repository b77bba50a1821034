#pragma once

#include "fastxls/record/Record.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace fastxls {
namespace model {

/// 工作表的稳定标识，排序、删除其他工作表时不变
using SheetId = uint32_t;

/**
 * @brief 一个工作表子流（BOF ... EOF）的记录序列
 *
 * 记录按原顺序保存，只对结构管理需要的记录提供访问：
 * WINDOW2（选中/活动标志）、DIMENSIONS、公式/数值/文本单元格、绘图数据。
 */
class SheetBlock {
public:
    SheetBlock() = default;
    explicit SheetBlock(std::vector<record::Record> records);

    /**
     * @brief 新建空工作表：BOF、DIMENSIONS、WINDOW2、EOF
     */
    static SheetBlock createEmpty();

    std::vector<record::Record>& records() { return records_; }
    const std::vector<record::Record>& records() const { return records_; }

    record::Window2Record* window2();
    const record::Window2Record* window2() const;

    record::DimensionsRecord* dimensions();

    /**
     * @brief 删除 INDEX / DBCELL 等记录绝对位置的记录
     * @return 删除的记录数
     */
    size_t dropStaleOffsetRecords();

    // 单元格

    void setFormula(uint16_t row, uint16_t col, formula::Formula formula);
    void setNumber(uint16_t row, uint16_t col, double value);
    void setString(uint16_t row, uint16_t col, const std::string& value);

    const record::FormulaRecord* findFormula(uint16_t row, uint16_t col) const;
    const record::NumberRecord* findNumber(uint16_t row, uint16_t col) const;
    const record::LabelRecord* findLabel(uint16_t row, uint16_t col) const;

    /**
     * @brief 删除 (row, col) 处本类能识别的单元格记录
     * @return 是否存在
     */
    bool removeCell(uint16_t row, uint16_t col);

    /**
     * @brief 对每条公式记录调用 fn
     */
    void forEachFormula(const std::function<void(formula::Formula&)>& fn);

    // 绘图

    /**
     * @brief 本表绘图数据引用的图片编号（BSE 序号，从 1 开始），每个形状一次
     */
    std::vector<uint32_t> pictureIds() const;

    /**
     * @brief 插入外部协作者生成的记录（位于 EOF 之前）
     */
    void insertBeforeEof(record::Record record);

private:
    size_t cellInsertPosition(uint16_t row, uint16_t col) const;
    void placeCell(uint16_t row, uint16_t col, record::Record cell);
    int findCellIndex(uint16_t row, uint16_t col) const;
    size_t eofIndex() const;

    std::vector<record::Record> records_;
};

/**
 * @brief 工作簿中的一张工作表
 */
struct Sheet {
    SheetId id = 0;
    std::string name;
    uint8_t visibility = 0;
    uint8_t sheet_type = 0;
    SheetBlock block;
};

} // namespace model
} // namespace fastxls
