#pragma once

#include "fastxls/model/SheetBlock.hpp"
#include "fastxls/record/Record.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace fastxls {
namespace model {

/**
 * @brief 外部引用表：SUPBOOK 块和 EXTERNSHEET
 *
 * 公式中的三维引用通过外部工作表索引（extern index）指向工作表。
 * 指向本工作簿的项保存 SheetId 而不是序号，写出 EXTERNSHEET 时才换算成
 * 当前序号，因此工作表排序后引用含义不变；工作表被删除的项写出为 0xFFFF。
 */
class LinkTable {
public:
    LinkTable() = default;

    /**
     * @brief 从全局子流中的 SUPBOOK ... EXTERNSHEET 记录重建
     * @param records SUPBOOK 及其后的 EXTERNNAME / XCT / CRN，最后是 EXTERNSHEET
     * @param sheet_ids 当前按序号排列的工作表标识
     */
    static LinkTable load(std::vector<record::Record> records, const std::vector<SheetId>& sheet_ids);

    bool empty() const { return supbooks_.empty(); }
    size_t externCount() const { return entries_.size(); }

    /**
     * @brief 指向单张工作表的外部工作表索引，没有时新建（必要时先新建本工作簿 SUPBOOK）
     */
    uint16_t findOrCreateExternIndex(SheetId sheet, size_t sheet_count);

    /**
     * @brief 外部工作表索引指向的本工作簿工作表
     * @return 外部工作簿、已删除或越界时返回 std::nullopt
     */
    std::optional<SheetId> sheetForExternIndex(uint16_t extern_index) const;

    /**
     * @brief 索引是否指向已删除的工作表
     */
    bool isDeleted(uint16_t extern_index) const;

    /**
     * @brief 标记指向 sheet 的项为已删除
     * @return 受影响的项数
     */
    size_t markSheetDeleted(SheetId sheet);

    /**
     * @brief 生成 SUPBOOK 块和 EXTERNSHEET 记录
     * @param sheet_ids 当前按序号排列的工作表标识
     */
    std::vector<record::Record> emit(const std::vector<SheetId>& sheet_ids) const;

private:
    enum class Kind {
        Sheet,     // 本工作簿的工作表（或连续范围）
        Deleted,   // 工作表已删除
        Raw        // 外部工作簿或特殊值，原样写回
    };

    struct Entry {
        uint16_t supbook_index = 0;
        Kind kind = Kind::Raw;
        SheetId first = 0;
        SheetId last = 0;
        uint16_t raw_first = 0;
        uint16_t raw_last = 0;
    };

    /// 每个 SUPBOOK 及其后附属记录
    struct SupBookBlock {
        record::SupBookRecord supbook;
        std::vector<record::Record> tail;
    };

    std::vector<SupBookBlock> supbooks_;
    std::vector<Entry> entries_;
    int internal_supbook_ = -1;
};

} // namespace model
} // namespace fastxls
