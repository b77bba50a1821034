#include "fastxls/core/Worksheet.hpp"
#include "fastxls/core/Constants.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/formula/CellAddress.hpp"
#include "fastxls/formula/FormulaText.hpp"
#include "fastxls/model/InternalWorkbook.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace fastxls {
namespace core {

namespace {

std::string cellName(int row, int col) {
    formula::CellRef ref;
    ref.row = static_cast<uint16_t>(row);
    ref.col = static_cast<uint16_t>(col);
    return formula::CellAddress::format(ref);
}

} // namespace

Worksheet::Worksheet(std::weak_ptr<model::InternalWorkbook> workbook, model::SheetId id)
    : workbook_(std::move(workbook)), id_(id) {
}

model::InternalWorkbook& Worksheet::workbook() const {
    std::shared_ptr<model::InternalWorkbook> wb = workbook_.lock();
    if (!wb) {
        FASTXLS_THROW(InvalidStateException, "Workbook owning this worksheet has been closed");
    }
    // 模型由 Workbook 持有，句柄只在其生命周期内访问
    return *wb;
}

model::Sheet& Worksheet::sheet() const {
    model::InternalWorkbook& wb = workbook();
    const int index = wb.getSheetIndex(id_);
    if (index < 0) {
        FASTXLS_THROW(InvalidStateException, "Worksheet has been removed from the workbook");
    }
    return wb.getSheetAt(static_cast<size_t>(index));
}

void Worksheet::validateCell(int row, int col) const {
    if (row < 0 || static_cast<uint32_t>(row) >= Constants::kMaxRows) {
        FASTXLS_THROW(ParameterException,
                      fmt::format("Row index {} is out of range (0..{})", row, Constants::kMaxRows - 1), "row");
    }
    if (col < 0 || col >= Constants::kMaxColumns) {
        FASTXLS_THROW(ParameterException,
                      fmt::format("Column index {} is out of range (0..{})", col, Constants::kMaxColumns - 1),
                      "col");
    }
}

std::string Worksheet::getName() const {
    return sheet().name;
}

size_t Worksheet::getIndex() const {
    sheet();
    return static_cast<size_t>(workbook().getSheetIndex(id_));
}

bool Worksheet::isActive() const {
    return workbook().isSheetActive(getIndex());
}

bool Worksheet::isSelected() const {
    return workbook().isSheetSelected(getIndex());
}

// ========== 单元格 ==========

void Worksheet::setCellFormula(int row, int col, const std::string& formula) {
    validateCell(row, col);
    model::Sheet& target = sheet();
    // 解析可能新增外部引用项，先解析再写入
    formula::Formula parsed = workbook().parseFormula(formula, formula::FormulaType::Cell);
    target.block.setFormula(static_cast<uint16_t>(row), static_cast<uint16_t>(col), std::move(parsed));
}

std::string Worksheet::getCellFormula(int row, int col) const {
    validateCell(row, col);
    const record::FormulaRecord* cell =
        sheet().block.findFormula(static_cast<uint16_t>(row), static_cast<uint16_t>(col));
    if (!cell) {
        return {};
    }
    return workbook().renderFormula(cell->formula);
}

void Worksheet::setCellNumber(int row, int col, double value) {
    validateCell(row, col);
    sheet().block.setNumber(static_cast<uint16_t>(row), static_cast<uint16_t>(col), value);
}

double Worksheet::getCellNumber(int row, int col) const {
    validateCell(row, col);
    const record::NumberRecord* cell =
        sheet().block.findNumber(static_cast<uint16_t>(row), static_cast<uint16_t>(col));
    if (!cell) {
        FASTXLS_THROW(ParameterException,
                      fmt::format("Cell {} does not contain a number", cellName(row, col)),
                      "row");
    }
    return cell->value;
}

void Worksheet::setCellString(int row, int col, const std::string& value) {
    validateCell(row, col);
    sheet().block.setString(static_cast<uint16_t>(row), static_cast<uint16_t>(col), value);
}

std::string Worksheet::getCellString(int row, int col) const {
    validateCell(row, col);
    const record::LabelRecord* cell =
        sheet().block.findLabel(static_cast<uint16_t>(row), static_cast<uint16_t>(col));
    if (!cell) {
        FASTXLS_THROW(ParameterException,
                      fmt::format("Cell {} does not contain a string", cellName(row, col)),
                      "row");
    }
    return cell->value;
}

bool Worksheet::removeCell(int row, int col) {
    validateCell(row, col);
    return sheet().block.removeCell(static_cast<uint16_t>(row), static_cast<uint16_t>(col));
}

void Worksheet::insertExternalRecord(std::shared_ptr<const record::IExternalRecord> record) {
    if (!record) {
        FASTXLS_THROW(ParameterException, "External record must not be null", "record");
    }
    model::Sheet& target = sheet();
    CORE_DEBUG("Inserting external record 0x{:04X} ({} bytes declared) into sheet '{}'",
               record->sid(), record->dataSize(), target.name);
    target.block.insertBeforeEof(record::ExternalRecord{std::move(record)});
}

} // namespace core
} // namespace fastxls
