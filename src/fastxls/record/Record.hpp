#pragma once

#include "fastxls/record/Records.hpp"

#include <variant>

namespace fastxls {
namespace record {

/**
 * @brief 封闭的记录类型集合
 *
 * 新增一种类型化记录时只需加入此列表并在 RecordCodec 中注册解析函数，
 * std::visit 保证所有访问点都处理到它。
 */
using Record = std::variant<
    BOFRecord,
    EOFRecord,
    Window1Record,
    BoundSheetRecord,
    Window2Record,
    DimensionsRecord,
    SupBookRecord,
    ExternSheetRecord,
    NameRecord,
    XFRecord,
    FormulaRecord,
    NumberRecord,
    LabelRecord,
    DrawingGroupRecord,
    DrawingRecord,
    WriteProtectRecord,
    FileSharingRecord,
    WriteAccessRecord,
    UnknownRecord,
    ExternalRecord>;

inline uint16_t sidOf(const Record& record) {
    return std::visit([](const auto& r) { return r.sid(); }, record);
}

/**
 * @brief 声明的负载长度（不含记录头和 CONTINUE 头）
 */
inline size_t dataSizeOf(const Record& record) {
    return std::visit([](const auto& r) { return r.dataSize(); }, record);
}

inline void serializePayload(const Record& record, utils::ByteWriter& out) {
    std::visit([&out](const auto& r) { r.serialize(out); }, record);
}

/**
 * @brief 按类型取记录，不匹配时返回 nullptr
 */
template<typename T>
T* recordAs(Record& record) {
    return std::get_if<T>(&record);
}

template<typename T>
const T* recordAs(const Record& record) {
    return std::get_if<T>(&record);
}

} // namespace record
} // namespace fastxls
