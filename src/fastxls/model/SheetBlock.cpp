#include "fastxls/model/SheetBlock.hpp"
#include "fastxls/model/PictureStore.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace fastxls {
namespace model {

namespace {

using record::Record;

// 由本类之外的记录类型表示、但同样位于单元格区的记录
constexpr uint16_t kSidBlank = 0x0201;
constexpr uint16_t kSidMulBlank = 0x00BE;
constexpr uint16_t kSidRk = 0x027E;
constexpr uint16_t kSidMulRk = 0x00BD;
constexpr uint16_t kSidLabelSst = 0x00FD;
constexpr uint16_t kSidBoolErr = 0x0205;
constexpr uint16_t kSidRString = 0x00D6;
constexpr uint16_t kSidRow = 0x0208;
constexpr uint16_t kSidArray = 0x0221;
constexpr uint16_t kSidShrFmla = 0x04BC;
constexpr uint16_t kSidTable = 0x0236;

bool isSingleCellSid(uint16_t s) {
    return s == kSidBlank || s == kSidRk || s == kSidLabelSst || s == kSidBoolErr || s == kSidRString;
}

bool isCellAreaSid(uint16_t s) {
    return isSingleCellSid(s) || s == kSidMulBlank || s == kSidMulRk || s == kSidRow ||
           s == kSidArray || s == kSidShrFmla || s == kSidTable || s == record::sid::STRING ||
           s == record::sid::FORMULA || s == record::sid::NUMBER || s == record::sid::LABEL;
}

/**
 * @brief 单元格记录的坐标；多单元格记录取首列
 */
std::optional<std::pair<uint16_t, uint16_t>> cellPosition(const Record& r) {
    if (const auto* f = record::recordAs<record::FormulaRecord>(r)) return std::make_pair(f->row, f->col);
    if (const auto* n = record::recordAs<record::NumberRecord>(r)) return std::make_pair(n->row, n->col);
    if (const auto* l = record::recordAs<record::LabelRecord>(r)) return std::make_pair(l->row, l->col);
    if (const auto* u = record::recordAs<record::UnknownRecord>(r)) {
        if ((isSingleCellSid(u->record_sid) || u->record_sid == kSidMulBlank || u->record_sid == kSidMulRk) &&
            u->data.size() >= 4) {
            return std::make_pair(utils::readU16LE(u->data.data()), utils::readU16LE(u->data.data() + 2));
        }
    }
    return std::nullopt;
}

bool isStringRecord(const Record& r) {
    const auto* u = record::recordAs<record::UnknownRecord>(r);
    return u && u->record_sid == record::sid::STRING;
}

} // namespace

SheetBlock::SheetBlock(std::vector<record::Record> records) : records_(std::move(records)) {
}

SheetBlock SheetBlock::createEmpty() {
    std::vector<Record> records;
    records.emplace_back(record::BOFRecord::create(record::BOFRecord::Worksheet));
    records.emplace_back(record::DimensionsRecord{});
    records.emplace_back(record::Window2Record::create());
    records.emplace_back(record::EOFRecord{});
    return SheetBlock(std::move(records));
}

record::Window2Record* SheetBlock::window2() {
    for (Record& r : records_) {
        if (auto* w = record::recordAs<record::Window2Record>(r)) {
            return w;
        }
    }
    return nullptr;
}

const record::Window2Record* SheetBlock::window2() const {
    for (const Record& r : records_) {
        if (const auto* w = record::recordAs<record::Window2Record>(r)) {
            return w;
        }
    }
    return nullptr;
}

record::DimensionsRecord* SheetBlock::dimensions() {
    for (Record& r : records_) {
        if (auto* d = record::recordAs<record::DimensionsRecord>(r)) {
            return d;
        }
    }
    return nullptr;
}

size_t SheetBlock::dropStaleOffsetRecords() {
    const size_t before = records_.size();
    records_.erase(std::remove_if(records_.begin(), records_.end(), [](const Record& r) {
        const uint16_t s = record::sidOf(r);
        return s == record::sid::INDEX || s == record::sid::DBCELL;
    }), records_.end());
    return before - records_.size();
}

int SheetBlock::findCellIndex(uint16_t row, uint16_t col) const {
    for (size_t i = 0; i < records_.size(); ++i) {
        const Record& r = records_[i];
        const uint16_t s = record::sidOf(r);
        if (s == kSidMulBlank || s == kSidMulRk) {
            continue;
        }
        auto pos = cellPosition(r);
        if (pos && pos->first == row && pos->second == col) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

size_t SheetBlock::eofIndex() const {
    for (size_t i = records_.size(); i > 0; --i) {
        if (record::recordAs<record::EOFRecord>(records_[i - 1])) {
            return i - 1;
        }
    }
    return records_.size();
}

size_t SheetBlock::cellInsertPosition(uint16_t row, uint16_t col) const {
    int last_cell_area = -1;
    int dimensions_index = -1;
    int window2_index = -1;
    for (size_t i = 0; i < records_.size(); ++i) {
        const Record& r = records_[i];
        const uint16_t s = record::sidOf(r);
        if (s == record::sid::DIMENSIONS && dimensions_index < 0) {
            dimensions_index = static_cast<int>(i);
        } else if (s == record::sid::WINDOW2 && window2_index < 0) {
            window2_index = static_cast<int>(i);
        }
        if (!isCellAreaSid(s)) {
            continue;
        }
        auto pos = cellPosition(r);
        if (pos && (pos->first > row || (pos->first == row && pos->second > col))) {
            return i;
        }
        last_cell_area = static_cast<int>(i);
    }
    if (last_cell_area >= 0) {
        return static_cast<size_t>(last_cell_area) + 1;
    }
    if (dimensions_index >= 0) {
        return static_cast<size_t>(dimensions_index) + 1;
    }
    if (window2_index >= 0) {
        return static_cast<size_t>(window2_index);
    }
    return eofIndex();
}

void SheetBlock::placeCell(uint16_t row, uint16_t col, record::Record cell) {
    const int existing = findCellIndex(row, col);
    if (existing >= 0) {
        const size_t index = static_cast<size_t>(existing);
        // 旧公式的字符串结果记录随公式一起失效
        if (index + 1 < records_.size() && isStringRecord(records_[index + 1])) {
            records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(index) + 1);
        }
        records_[index] = std::move(cell);
    } else {
        const size_t index = cellInsertPosition(row, col);
        records_.insert(records_.begin() + static_cast<std::ptrdiff_t>(index), std::move(cell));
    }
    if (record::DimensionsRecord* dim = dimensions()) {
        dim->include(row, col);
    }
}

void SheetBlock::setFormula(uint16_t row, uint16_t col, formula::Formula formula) {
    record::FormulaRecord cell;
    cell.row = row;
    cell.col = col;
    cell.formula = std::move(formula);
    placeCell(row, col, std::move(cell));
}

void SheetBlock::setNumber(uint16_t row, uint16_t col, double value) {
    record::NumberRecord cell;
    cell.row = row;
    cell.col = col;
    cell.value = value;
    placeCell(row, col, cell);
}

void SheetBlock::setString(uint16_t row, uint16_t col, const std::string& value) {
    record::LabelRecord cell;
    cell.row = row;
    cell.col = col;
    cell.value = value;
    placeCell(row, col, std::move(cell));
}

const record::FormulaRecord* SheetBlock::findFormula(uint16_t row, uint16_t col) const {
    const int index = findCellIndex(row, col);
    return index < 0 ? nullptr : record::recordAs<record::FormulaRecord>(records_[static_cast<size_t>(index)]);
}

const record::NumberRecord* SheetBlock::findNumber(uint16_t row, uint16_t col) const {
    const int index = findCellIndex(row, col);
    return index < 0 ? nullptr : record::recordAs<record::NumberRecord>(records_[static_cast<size_t>(index)]);
}

const record::LabelRecord* SheetBlock::findLabel(uint16_t row, uint16_t col) const {
    const int index = findCellIndex(row, col);
    return index < 0 ? nullptr : record::recordAs<record::LabelRecord>(records_[static_cast<size_t>(index)]);
}

bool SheetBlock::removeCell(uint16_t row, uint16_t col) {
    const int found = findCellIndex(row, col);
    if (found < 0) {
        return false;
    }
    const auto index = static_cast<std::ptrdiff_t>(found);
    if (static_cast<size_t>(found) + 1 < records_.size() && isStringRecord(records_[static_cast<size_t>(found) + 1])) {
        records_.erase(records_.begin() + index + 1);
    }
    records_.erase(records_.begin() + index);
    return true;
}

void SheetBlock::forEachFormula(const std::function<void(formula::Formula&)>& fn) {
    for (Record& r : records_) {
        if (auto* cell = record::recordAs<record::FormulaRecord>(r)) {
            fn(cell->formula);
        }
    }
}

std::vector<uint32_t> SheetBlock::pictureIds() const {
    // 一个 Escher 容器常被 OBJ 等记录分隔在多条 MSODRAWING 中，先拼接再遍历
    std::vector<uint8_t> escher;
    for (const Record& r : records_) {
        if (const auto* drawing = record::recordAs<record::DrawingRecord>(r)) {
            escher.insert(escher.end(), drawing->data.begin(), drawing->data.end());
        }
    }
    if (escher.empty()) {
        return {};
    }
    return PictureStore::collectPictureIds(escher);
}

void SheetBlock::insertBeforeEof(record::Record record) {
    const size_t index = eofIndex();
    records_.insert(records_.begin() + static_cast<std::ptrdiff_t>(index), std::move(record));
}

} // namespace model
} // namespace fastxls
