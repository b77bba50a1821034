#include "fastxls/model/XFTable.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace fastxls {
namespace model {

using record::XFRecord;

XFTable::XFTable(size_t capacity) : capacity_(capacity) {
}

void XFTable::load(std::vector<record::XFRecord> records) {
    if (records.size() > capacity_) {
        MODEL_WARN("Workbook holds {} cell styles, more than the limit of {}", records.size(), capacity_);
    }
    records_ = std::move(records);
}

const record::XFRecord& XFTable::at(size_t index) const {
    if (index >= records_.size()) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("Cell style index {} is out of range (0..{})", index, records_.size()),
                      "index");
    }
    return records_[index];
}

core::Result<int> XFTable::tryAdd(const record::XFRecord& xf) {
    if (full()) {
        return core::makeError(core::ErrorCode::CapacityExceeded,
                               fmt::format("Cell style table is full ({} entries)", capacity_));
    }
    records_.push_back(xf);
    return static_cast<int>(records_.size() - 1);
}

std::vector<record::XFRecord> XFTable::builtIn() {
    constexpr uint16_t kStyleXf = 0xFFF5;   // 样式 XF，锁定，无父样式
    constexpr uint16_t kCellXf = 0x0001;    // 单元格 XF，锁定，父样式 0
    constexpr uint8_t kAlignGeneral = 0x20;

    std::vector<XFRecord> xfs;
    xfs.reserve(21);

    // 0: Normal 样式
    xfs.push_back(XFRecord::make(0, 0, kStyleXf, kAlignGeneral, 0x00));
    // 1 ~ 14: 大纲级别样式
    for (uint16_t i = 1; i <= 14; ++i) {
        const uint16_t font = (i <= 2) ? 1 : (i <= 4) ? 2 : 0;
        xfs.push_back(XFRecord::make(font, 0, kStyleXf, kAlignGeneral, 0xF4));
    }
    // 15: 默认单元格格式
    xfs.push_back(XFRecord::make(0, 0, kCellXf, kAlignGeneral, 0x00));
    // 16 ~ 20: 千分位、货币、百分比样式
    const uint16_t formats[] = {0x2B, 0x29, 0x2C, 0x2A, 0x09};
    for (uint16_t format : formats) {
        xfs.push_back(XFRecord::make(1, format, kStyleXf, kAlignGeneral, 0xF8));
    }
    return xfs;
}

} // namespace model
} // namespace fastxls
