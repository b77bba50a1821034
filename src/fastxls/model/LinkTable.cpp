#include "fastxls/model/LinkTable.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace fastxls {
namespace model {

using record::ExternSheetRecord;
using record::Record;
using record::SupBookRecord;

LinkTable LinkTable::load(std::vector<record::Record> records, const std::vector<SheetId>& sheet_ids) {
    LinkTable table;
    const ExternSheetRecord* extern_sheet = nullptr;

    for (Record& r : records) {
        if (auto* supbook = record::recordAs<SupBookRecord>(r)) {
            if (supbook->isInternal() && table.internal_supbook_ < 0) {
                table.internal_supbook_ = static_cast<int>(table.supbooks_.size());
            }
            table.supbooks_.push_back(SupBookBlock{*supbook, {}});
        } else if (const auto* es = record::recordAs<ExternSheetRecord>(r)) {
            extern_sheet = es;
        } else if (!table.supbooks_.empty()) {
            table.supbooks_.back().tail.push_back(std::move(r));
        } else {
            MODEL_WARN("Dropping record 0x{:04X} found before the first SUPBOOK", record::sidOf(r));
        }
    }

    if (!extern_sheet) {
        return table;
    }

    for (const ExternSheetRecord::Ref& ref : extern_sheet->refs) {
        Entry entry;
        entry.supbook_index = ref.supbook_index;
        entry.raw_first = ref.first_sheet;
        entry.raw_last = ref.last_sheet;
        if (static_cast<int>(ref.supbook_index) == table.internal_supbook_) {
            if (ref.first_sheet == ExternSheetRecord::kDeletedSheet ||
                ref.last_sheet == ExternSheetRecord::kDeletedSheet) {
                entry.kind = Kind::Deleted;
            } else if (ref.first_sheet < sheet_ids.size() && ref.last_sheet < sheet_ids.size()) {
                entry.kind = Kind::Sheet;
                entry.first = sheet_ids[ref.first_sheet];
                entry.last = sheet_ids[ref.last_sheet];
            } else {
                entry.kind = Kind::Raw;
            }
        }
        table.entries_.push_back(entry);
    }

    MODEL_DEBUG("Loaded link table: {} SUPBOOK(s), {} extern sheet entries", table.supbooks_.size(),
                table.entries_.size());
    return table;
}

uint16_t LinkTable::findOrCreateExternIndex(SheetId sheet, size_t sheet_count) {
    for (size_t i = 0; i < entries_.size(); ++i) {
        const Entry& e = entries_[i];
        if (e.kind == Kind::Sheet && e.first == sheet && e.last == sheet) {
            return static_cast<uint16_t>(i);
        }
    }

    if (internal_supbook_ < 0) {
        internal_supbook_ = static_cast<int>(supbooks_.size());
        supbooks_.push_back(SupBookBlock{SupBookRecord::createInternal(static_cast<uint16_t>(sheet_count)), {}});
        MODEL_DEBUG("Created internal SUPBOOK at index {}", internal_supbook_);
    }
    if (entries_.size() >= 0xFFFF) {
        FASTXLS_THROW(core::CapacityExceededException, "Too many extern sheet references", size_t{0xFFFF});
    }

    Entry entry;
    entry.supbook_index = static_cast<uint16_t>(internal_supbook_);
    entry.kind = Kind::Sheet;
    entry.first = sheet;
    entry.last = sheet;
    entries_.push_back(entry);
    return static_cast<uint16_t>(entries_.size() - 1);
}

std::optional<SheetId> LinkTable::sheetForExternIndex(uint16_t extern_index) const {
    if (extern_index >= entries_.size()) {
        return std::nullopt;
    }
    const Entry& e = entries_[extern_index];
    if (e.kind != Kind::Sheet) {
        return std::nullopt;
    }
    return e.first;
}

bool LinkTable::isDeleted(uint16_t extern_index) const {
    return extern_index < entries_.size() && entries_[extern_index].kind == Kind::Deleted;
}

size_t LinkTable::markSheetDeleted(SheetId sheet) {
    size_t count = 0;
    for (Entry& e : entries_) {
        if (e.kind == Kind::Sheet && (e.first == sheet || e.last == sheet)) {
            e.kind = Kind::Deleted;
            ++count;
        }
    }
    return count;
}

std::vector<record::Record> LinkTable::emit(const std::vector<SheetId>& sheet_ids) const {
    std::vector<Record> out;
    if (supbooks_.empty()) {
        return out;
    }

    auto ordinalOf = [&sheet_ids](SheetId id) -> uint16_t {
        auto it = std::find(sheet_ids.begin(), sheet_ids.end(), id);
        return it == sheet_ids.end() ? ExternSheetRecord::kDeletedSheet
                                     : static_cast<uint16_t>(it - sheet_ids.begin());
    };

    for (size_t i = 0; i < supbooks_.size(); ++i) {
        SupBookRecord supbook = supbooks_[i].supbook;
        if (static_cast<int>(i) == internal_supbook_) {
            supbook.sheet_count = static_cast<uint16_t>(sheet_ids.size());
        }
        out.emplace_back(std::move(supbook));
        out.insert(out.end(), supbooks_[i].tail.begin(), supbooks_[i].tail.end());
    }

    ExternSheetRecord extern_sheet;
    extern_sheet.refs.reserve(entries_.size());
    for (const Entry& e : entries_) {
        ExternSheetRecord::Ref ref;
        ref.supbook_index = e.supbook_index;
        switch (e.kind) {
            case Kind::Sheet:
                ref.first_sheet = ordinalOf(e.first);
                ref.last_sheet = ordinalOf(e.last);
                // 调整顺序后区间端点可能颠倒，按升序写出
                if (ref.first_sheet > ref.last_sheet) {
                    std::swap(ref.first_sheet, ref.last_sheet);
                }
                break;
            case Kind::Deleted:
                ref.first_sheet = ExternSheetRecord::kDeletedSheet;
                ref.last_sheet = ExternSheetRecord::kDeletedSheet;
                break;
            case Kind::Raw:
                ref.first_sheet = e.raw_first;
                ref.last_sheet = e.raw_last;
                break;
        }
        extern_sheet.refs.push_back(ref);
    }
    out.emplace_back(std::move(extern_sheet));
    return out;
}

} // namespace model
} // namespace fastxls
