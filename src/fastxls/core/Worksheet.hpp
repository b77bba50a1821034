#pragma once

#include "fastxls/model/SheetBlock.hpp"
#include "fastxls/record/Records.hpp"

#include <memory>
#include <string>

namespace fastxls {

namespace model {
class InternalWorkbook;
}

namespace core {

/**
 * @brief 工作表句柄
 *
 * 只保存工作表的稳定标识，每次操作时从工作簿模型中重新定位，
 * 因此排序、重命名其他工作表后句柄依然有效。
 */
class Worksheet {
public:
    Worksheet(std::weak_ptr<model::InternalWorkbook> workbook, model::SheetId id);

    model::SheetId getSheetId() const { return id_; }

    std::string getName() const;

    /**
     * @brief 当前序号
     * @throws InvalidStateException 工作表已被删除或工作簿已关闭
     */
    size_t getIndex() const;

    bool isActive() const;
    bool isSelected() const;

    // ========== 单元格 ==========

    /**
     * @brief 写入公式单元格
     * @param formula 不带前导 '=' 的公式文本
     * @throws FormulaException 公式文本无法解析
     */
    void setCellFormula(int row, int col, const std::string& formula);

    /**
     * @brief 公式文本，单元格不是公式时返回空字符串
     */
    std::string getCellFormula(int row, int col) const;

    void setCellNumber(int row, int col, double value);

    /**
     * @throws ParameterException 单元格不是数值
     */
    double getCellNumber(int row, int col) const;

    void setCellString(int row, int col, const std::string& value);

    /**
     * @throws ParameterException 单元格不是字符串
     */
    std::string getCellString(int row, int col) const;

    bool removeCell(int row, int col);

    /**
     * @brief 在 EOF 之前插入外部协作者生成的记录
     */
    void insertExternalRecord(std::shared_ptr<const record::IExternalRecord> record);

private:
    model::InternalWorkbook& workbook() const;
    model::Sheet& sheet() const;
    void validateCell(int row, int col) const;

    std::weak_ptr<model::InternalWorkbook> workbook_;
    model::SheetId id_;
};

} // namespace core
} // namespace fastxls
