#include "fastxls/model/InternalWorkbook.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/model/PictureStore.hpp"
#include "fastxls/record/BiffString.hpp"
#include "fastxls/record/RecordCodec.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"
#include "fastxls/utils/Unicode.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/format.h>
#include <limits>
#include <set>

namespace fastxls {
namespace model {

using record::Record;

namespace {

constexpr size_t kNotFound = std::numeric_limits<size_t>::max();

// 工作簿全局子流中只按原样保存的记录
constexpr uint16_t kSidInterfaceHdr = 0x00E1;
constexpr uint16_t kSidMms = 0x00C1;
constexpr uint16_t kSidCodepage = 0x0042;
constexpr uint16_t kSidDsf = 0x0161;
constexpr uint16_t kSidTabId = 0x013D;
constexpr uint16_t kSidBackup = 0x0040;
constexpr uint16_t kSidHideObj = 0x008D;
constexpr uint16_t kSidDate1904 = 0x0022;
constexpr uint16_t kSidPrecision = 0x000E;
constexpr uint16_t kSidBookBool = 0x00DA;
constexpr uint16_t kSidFont = 0x0031;
constexpr uint16_t kSidStyle = 0x0293;
constexpr uint16_t kSidUsesElfs = 0x0160;
constexpr uint16_t kSidXct = 0x0059;
constexpr uint16_t kSidCrn = 0x005A;

constexpr uint16_t kCodepageUtf16 = 0x04B0;

Record u16Record(uint16_t sid, uint16_t value) {
    utils::ByteWriter w;
    w.writeU16(value);
    return record::UnknownRecord::make(sid, w.take());
}

Record fontRecord() {
    utils::ByteWriter w;
    w.writeU16(200);      // 字高，1/20 磅
    w.writeU16(0);        // 属性
    w.writeU16(0x7FFF);   // 颜色：自动
    w.writeU16(400);      // 粗细：常规
    w.writeU16(0);        // 上下标
    w.writeU8(0);         // 下划线
    w.writeU8(0);         // 字体族
    w.writeU8(0);         // 字符集
    w.writeU8(0);
    record::writeShortUnicodeString(w, "Arial");
    return record::UnknownRecord::make(kSidFont, w.take());
}

bool isLinkTableTail(uint16_t sid) {
    return sid == record::sid::EXTERNNAME || sid == kSidXct || sid == kSidCrn;
}

} // namespace

InternalWorkbook::InternalWorkbook(const core::WorkbookOptions& options)
    : options_(options), xfs_(options.max_cell_styles) {
}

InternalWorkbook::~InternalWorkbook() = default;

// ========== 创建与加载 ==========

std::unique_ptr<InternalWorkbook> InternalWorkbook::createEmpty(const core::WorkbookOptions& options) {
    std::unique_ptr<InternalWorkbook> wb(new InternalWorkbook(options));
    auto& g = wb->globals_;

    g.emplace_back(Record(record::BOFRecord::create(record::BOFRecord::Workbook)));
    g.emplace_back(u16Record(kSidInterfaceHdr, kCodepageUtf16));
    g.emplace_back(u16Record(kSidMms, 0));
    g.emplace_back(Record(record::UnknownRecord::make(record::sid::INTERFACEEND, {})));
    g.emplace_back(Record(record::WriteAccessRecord{}));
    g.emplace_back(u16Record(kSidCodepage, kCodepageUtf16));
    g.emplace_back(u16Record(kSidDsf, 0));
    g.emplace_back(Record(record::UnknownRecord::make(kSidTabId, {})));
    g.emplace_back(GlobalsSlot::Window1);
    g.emplace_back(u16Record(kSidBackup, 0));
    g.emplace_back(u16Record(kSidHideObj, 0));
    g.emplace_back(u16Record(kSidDate1904, 0));
    g.emplace_back(u16Record(kSidPrecision, 1));
    g.emplace_back(u16Record(kSidBookBool, 0));
    for (int i = 0; i < 4; ++i) {
        g.emplace_back(fontRecord());
    }
    g.emplace_back(GlobalsSlot::XFs);
    {
        // 内置 Normal 样式，指向 XF 0
        utils::ByteWriter w;
        w.writeU16(0x8000);
        w.writeU8(0);
        w.writeU8(0xFF);
        g.emplace_back(Record(record::UnknownRecord::make(kSidStyle, w.take())));
    }
    g.emplace_back(u16Record(kSidUsesElfs, 1));
    g.emplace_back(GlobalsSlot::BoundSheets);
    {
        utils::ByteWriter w;
        w.writeU16(1);
        w.writeU16(1);
        g.emplace_back(Record(record::UnknownRecord::make(record::sid::COUNTRY, w.take())));
    }
    {
        utils::ByteWriter w;
        w.writeU32(0);
        w.writeU32(0);
        g.emplace_back(Record(record::UnknownRecord::make(record::sid::SST, w.take())));
    }
    g.emplace_back(Record(record::EOFRecord{}));

    wb->xfs_.load(XFTable::builtIn());
    CORE_DEBUG("Created empty workbook model ({} built-in cell styles)", wb->xfs_.size());
    return wb;
}

std::unique_ptr<InternalWorkbook> InternalWorkbook::load(std::vector<record::Record> records,
                                                         const core::WorkbookOptions& options) {
    if (records.empty()) {
        FASTXLS_THROW(core::FormatException, "Workbook stream contains no records");
    }
    const auto* bof = record::recordAs<record::BOFRecord>(records.front());
    if (!bof) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("Workbook stream starts with record 0x{:04X} instead of BOF",
                                  record::sidOf(records.front())));
    }
    if (bof->version < record::BOFRecord::kBiff8Version) {
        FASTXLS_THROW(core::OldFormatException, "BIFF5");
    }
    if (bof->type != record::BOFRecord::Workbook) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("First substream has type 0x{:04X}, expected workbook globals", bof->type));
    }

    // 按 BOF/EOF 嵌套切分子流
    std::vector<std::vector<Record>> substreams;
    std::vector<Record> current;
    int depth = 0;
    size_t skipped = 0;
    for (Record& r : records) {
        const uint16_t s = record::sidOf(r);
        if (depth == 0 && s != record::sid::BOF) {
            ++skipped;
            continue;
        }
        if (s == record::sid::BOF) {
            ++depth;
        } else if (s == record::sid::EOF_) {
            --depth;
        }
        current.push_back(std::move(r));
        if (depth == 0) {
            substreams.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        MODEL_WARN("Last substream has no matching EOF, closing it");
        current.emplace_back(record::EOFRecord{});
        substreams.push_back(std::move(current));
    }
    if (skipped > 0) {
        MODEL_WARN("Skipped {} records found between substreams", skipped);
    }

    std::unique_ptr<InternalWorkbook> wb(new InternalWorkbook(options));

    std::vector<record::BoundSheetRecord> bound_sheets;
    std::vector<Record> link_records;
    std::vector<record::NameRecord> name_records;
    wb->loadGlobals(std::move(substreams.front()), bound_sheets, link_records, name_records);

    const size_t block_count = substreams.size() - 1;
    if (block_count < bound_sheets.size()) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("Workbook declares {} sheets but contains only {} sheet substreams",
                                  bound_sheets.size(), block_count));
    }
    if (block_count > bound_sheets.size()) {
        MODEL_WARN("Dropping {} sheet substreams without a BOUNDSHEET entry", block_count - bound_sheets.size());
    }

    std::vector<SheetId> ids;
    std::set<size_t> selected;
    size_t dropped = 0;
    for (size_t i = 0; i < bound_sheets.size(); ++i) {
        Sheet sheet;
        sheet.id = wb->next_sheet_id_++;
        sheet.name = bound_sheets[i].name;
        sheet.visibility = bound_sheets[i].visibility;
        sheet.sheet_type = bound_sheets[i].sheet_type;
        sheet.block = SheetBlock(std::move(substreams[i + 1]));
        if (options.drop_stale_offset_records) {
            dropped += sheet.block.dropStaleOffsetRecords();
        }
        if (const record::Window2Record* w2 = sheet.block.window2()) {
            if (w2->isSelected()) {
                selected.insert(i);
            }
        }
        ids.push_back(sheet.id);
        wb->sheets_.push_back(std::move(sheet));
    }
    if (dropped > 0) {
        MODEL_DEBUG("Dropped {} INDEX/DBCELL records from sheet substreams", dropped);
    }

    wb->selection_.reset(wb->sheets_.size(), static_cast<size_t>(wb->window1_.active_tab),
                         std::move(selected), wb->window1_.first_visible_tab);

    wb->link_table_ = LinkTable::load(std::move(link_records), ids);

    for (record::NameRecord& nr : name_records) {
        std::optional<SheetId> scope;
        if (nr.sheet_index > 0) {
            if (nr.sheet_index <= ids.size()) {
                scope = ids[nr.sheet_index - 1];
            } else {
                MODEL_WARN("Name '{}' is scoped to missing sheet {}, making it global",
                           NameTable::displayText(nr), nr.sheet_index);
            }
        }
        wb->names_.add(std::move(nr), scope);
    }

    wb->ensureSlot(GlobalsSlot::Window1);
    wb->ensureSlot(GlobalsSlot::XFs);
    wb->ensureSlot(GlobalsSlot::BoundSheets);

    CORE_INFO("Loaded workbook model: {} sheets, {} names, {} cell styles, {} extern sheet entries",
              wb->sheets_.size(), wb->names_.size(), wb->xfs_.size(), wb->link_table_.externCount());
    return wb;
}

void InternalWorkbook::loadGlobals(std::vector<record::Record> globals,
                                   std::vector<record::BoundSheetRecord>& bound_sheets,
                                   std::vector<record::Record>& link_records,
                                   std::vector<record::NameRecord>& name_records) {
    std::vector<record::XFRecord> xfs;
    bool in_link_table = false;
    bool have_window1 = false;
    size_t dropped = 0;

    for (Record& r : globals) {
        const uint16_t s = record::sidOf(r);

        if (s == record::sid::SUPBOOK || (in_link_table && (isLinkTableTail(s) || s == record::sid::EXTERNSHEET))) {
            if (!hasSlot(GlobalsSlot::LinkTable)) {
                globals_.emplace_back(GlobalsSlot::LinkTable);
            }
            in_link_table = s != record::sid::EXTERNSHEET;
            link_records.push_back(std::move(r));
            continue;
        }
        in_link_table = false;

        if (auto* bs = record::recordAs<record::BoundSheetRecord>(r)) {
            if (!hasSlot(GlobalsSlot::BoundSheets)) {
                globals_.emplace_back(GlobalsSlot::BoundSheets);
            }
            bound_sheets.push_back(std::move(*bs));
        } else if (auto* nr = record::recordAs<record::NameRecord>(r)) {
            if (!hasSlot(GlobalsSlot::Names)) {
                globals_.emplace_back(GlobalsSlot::Names);
            }
            name_records.push_back(std::move(*nr));
        } else if (auto* xf = record::recordAs<record::XFRecord>(r)) {
            if (!hasSlot(GlobalsSlot::XFs)) {
                globals_.emplace_back(GlobalsSlot::XFs);
            }
            xfs.push_back(*xf);
        } else if (auto* w1 = record::recordAs<record::Window1Record>(r); w1 && !have_window1) {
            window1_ = *w1;
            have_window1 = true;
            globals_.emplace_back(GlobalsSlot::Window1);
        } else if (options_.drop_stale_offset_records && (s == record::sid::EXTSST || s == record::sid::INDEX)) {
            ++dropped;
        } else {
            if (s == record::sid::NAME) {
                MODEL_WARN("NAME record could not be parsed, keeping it verbatim; name indices may shift");
            }
            globals_.emplace_back(std::move(r));
        }
    }

    xfs_.load(std::move(xfs));
    if (dropped > 0) {
        MODEL_DEBUG("Dropped {} EXTSST/INDEX records from workbook globals", dropped);
    }
}

// ========== 全局子流插槽 ==========

bool InternalWorkbook::hasSlot(GlobalsSlot slot) const {
    return std::any_of(globals_.begin(), globals_.end(), [slot](const GlobalsItem& item) {
        const auto* s = std::get_if<GlobalsSlot>(&item);
        return s && *s == slot;
    });
}

size_t InternalWorkbook::findGlobal(uint16_t sid) const {
    for (size_t i = 0; i < globals_.size(); ++i) {
        if (const auto* r = std::get_if<Record>(&globals_[i])) {
            if (record::sidOf(*r) == sid) {
                return i;
            }
        }
    }
    return kNotFound;
}

void InternalWorkbook::ensureSlot(GlobalsSlot slot) {
    if (hasSlot(slot)) {
        return;
    }

    auto slotIndex = [this](GlobalsSlot wanted) -> size_t {
        for (size_t i = 0; i < globals_.size(); ++i) {
            const auto* s = std::get_if<GlobalsSlot>(&globals_[i]);
            if (s && *s == wanted) {
                return i;
            }
        }
        return kNotFound;
    };
    // 最后一条记录是 EOF
    const size_t before_eof = globals_.empty() ? 0 : globals_.size() - 1;

    size_t position = before_eof;
    switch (slot) {
        case GlobalsSlot::LinkTable: {
            const size_t country = findGlobal(record::sid::COUNTRY);
            const size_t bound = slotIndex(GlobalsSlot::BoundSheets);
            if (country != kNotFound) {
                position = country + 1;
            } else if (bound != kNotFound) {
                position = bound + 1;
            }
            break;
        }
        case GlobalsSlot::Names:
            ensureSlot(GlobalsSlot::LinkTable);
            position = slotIndex(GlobalsSlot::LinkTable) + 1;
            break;
        case GlobalsSlot::BoundSheets: {
            const size_t country = findGlobal(record::sid::COUNTRY);
            const size_t link = slotIndex(GlobalsSlot::LinkTable);
            if (country != kNotFound) {
                position = country;
            } else if (link != kNotFound) {
                position = link;
            }
            break;
        }
        case GlobalsSlot::XFs:
        case GlobalsSlot::Window1: {
            const size_t bound = slotIndex(GlobalsSlot::BoundSheets);
            if (bound != kNotFound) {
                position = bound;
            }
            break;
        }
    }
    globals_.insert(globals_.begin() + static_cast<std::ptrdiff_t>(position), slot);
}

// ========== 工作表 ==========

void InternalWorkbook::validateSheetIndex(size_t index) const {
    if (index >= sheets_.size()) {
        const std::string range = sheets_.empty() ? std::string("(no sheets)")
                                                  : fmt::format("(0..{})", sheets_.size() - 1);
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("Sheet index ({}) is out of range {}", index, range), "index");
    }
}

void InternalWorkbook::validateSheetName(const std::string& name, int except_index) const {
    const size_t length = record::biffCharCount(name);
    if (length < 1 || length > core::Constants::kMaxSheetNameLength) {
        FASTXLS_THROW(core::WorksheetException,
                      fmt::format("sheetName '{}' is invalid - character count MUST be greater than or equal "
                                  "to 1 and less than or equal to 31", name),
                      name, core::ErrorCode::InvalidWorksheet);
    }
    for (size_t i = 0; i < name.size(); ++i) {
        const char c = name[i];
        if (std::strchr("/\\?*[]:", c) != nullptr && c != '\0') {
            FASTXLS_THROW(core::WorksheetException,
                          fmt::format("Invalid char ({}) found at index ({}) in sheet name '{}'", c, i, name),
                          name, core::ErrorCode::InvalidWorksheet);
        }
    }
    if (name.front() == '\'' || name.back() == '\'') {
        FASTXLS_THROW(core::WorksheetException,
                      fmt::format("Invalid sheetname '{}': cannot start or end with an apostrophe", name),
                      name, core::ErrorCode::InvalidWorksheet);
    }
    for (size_t i = 0; i < sheets_.size(); ++i) {
        if (static_cast<int>(i) != except_index && utils::equalsIgnoreCase(sheets_[i].name, name)) {
            FASTXLS_THROW(core::WorksheetException,
                          fmt::format("The workbook already contains a sheet named '{}'", name),
                          name, core::ErrorCode::InvalidWorksheet);
        }
    }
}

std::string InternalWorkbook::uniqueSheetName(const std::string& source_name) const {
    int unique_index = 2;
    std::string base_name = source_name;

    // 已带 "(n)" 后缀时从 n+1 开始
    const size_t bracket = source_name.rfind('(');
    if (bracket != std::string::npos && bracket > 0 && source_name.back() == ')') {
        std::string suffix = source_name.substr(bracket + 1, source_name.size() - bracket - 2);
        suffix.erase(0, suffix.find_first_not_of(' '));
        suffix.erase(suffix.find_last_not_of(' ') + 1);
        if (!suffix.empty() && suffix.size() < 9 &&
            std::all_of(suffix.begin(), suffix.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            unique_index = std::stoi(suffix) + 1;
            base_name = source_name.substr(0, bracket);
            base_name.erase(base_name.find_last_not_of(' ') + 1);
        }
    }

    for (;;) {
        const std::string index = std::to_string(unique_index++);
        std::string name;
        if (base_name.size() + index.size() + 2 < core::Constants::kMaxSheetNameLength) {
            name = base_name + " (" + index + ")";
        } else {
            name = base_name.substr(0, core::Constants::kMaxSheetNameLength - index.size() - 2) + "(" + index + ")";
        }
        if (getSheetIndex(name) < 0) {
            return name;
        }
    }
}

std::vector<SheetId> InternalWorkbook::sheetOrder() const {
    std::vector<SheetId> ids;
    ids.reserve(sheets_.size());
    for (const Sheet& sheet : sheets_) {
        ids.push_back(sheet.id);
    }
    return ids;
}

Sheet& InternalWorkbook::createSheet(const std::string& name) {
    validateSheetName(name, -1);

    Sheet sheet;
    sheet.id = next_sheet_id_++;
    sheet.name = name;
    sheet.block = SheetBlock::createEmpty();
    sheets_.push_back(std::move(sheet));
    selection_.onSheetAppended(sheets_.size());

    MODEL_DEBUG("Created sheet '{}' (id {}, index {})", name, sheets_.back().id, sheets_.size() - 1);
    return sheets_.back();
}

Sheet& InternalWorkbook::cloneSheet(size_t index) {
    validateSheetIndex(index);

    Sheet clone;
    clone.id = next_sheet_id_++;
    clone.name = uniqueSheetName(sheets_[index].name);
    clone.visibility = sheets_[index].visibility;
    clone.sheet_type = sheets_[index].sheet_type;
    clone.block = sheets_[index].block;
    if (record::Window2Record* w2 = clone.block.window2()) {
        w2->setSelected(false);
        w2->setActive(false);
    }
    const SheetId source_id = sheets_[index].id;
    const SheetId clone_id = clone.id;

    // 共享图片只增加引用计数
    const std::vector<uint32_t> pictures = clone.block.pictureIds();
    if (!pictures.empty()) {
        PictureStore store = pictureStore();
        for (uint32_t pib : pictures) {
            if (pib <= store.size()) {
                store.addRef(pib);
            } else {
                MODEL_WARN("Sheet '{}' references missing picture {}", clone.name, pib);
            }
        }
    }

    sheets_.push_back(std::move(clone));
    selection_.onSheetAppended(sheets_.size());

    // 复制作用于源工作表的内置名称（打印区域等），引用改指向新工作表
    std::vector<record::NameRecord> copies;
    for (const DefinedName& dn : names_.entries()) {
        if (dn.record.isBuiltIn() && dn.scope == source_id) {
            copies.push_back(dn.record);
        }
    }
    if (!copies.empty()) {
        ensureSlot(GlobalsSlot::LinkTable);
        const uint16_t source_ix = link_table_.findOrCreateExternIndex(source_id, sheets_.size());
        const uint16_t clone_ix = link_table_.findOrCreateExternIndex(clone_id, sheets_.size());
        for (record::NameRecord& copy : copies) {
            copy.definition.replaceExternIndex(source_ix, clone_ix);
            names_.add(std::move(copy), clone_id);
        }
    }

    MODEL_DEBUG("Cloned sheet {} as '{}' ({} picture references, {} built-in names)",
                index, sheets_.back().name, pictures.size(), copies.size());
    return sheets_.back();
}

void InternalWorkbook::removeSheetAt(size_t index) {
    validateSheetIndex(index);

    const SheetId removed_id = sheets_[index].id;
    const std::string removed_name = sheets_[index].name;

    const std::vector<uint32_t> pictures = sheets_[index].block.pictureIds();
    if (!pictures.empty()) {
        PictureStore store = pictureStore();
        for (uint32_t pib : pictures) {
            if (pib <= store.size()) {
                store.release(pib);
            }
        }
    }

    sheets_.erase(sheets_.begin() + static_cast<std::ptrdiff_t>(index));

    if (link_table_.markSheetDeleted(removed_id) > 0) {
        degradeDeletedReferences();
    }

    // 作用于被删工作表的名称保留并改为工作簿级
    for (DefinedName& dn : names_.entries()) {
        if (dn.scope == removed_id) {
            dn.scope.reset();
            if (names_.contains(NameTable::displayText(dn.record), std::nullopt, dn.id)) {
                MODEL_WARN("Name '{}' of deleted sheet '{}' now duplicates a workbook-level name",
                           NameTable::displayText(dn.record), removed_name);
            }
        }
    }

    selection_.onSheetRemoved(index, sheets_.size());
    MODEL_DEBUG("Removed sheet '{}' at index {}, {} sheets left", removed_name, index, sheets_.size());
}

void InternalWorkbook::degradeDeletedReferences() {
    auto is_deleted = [this](uint16_t extern_index) { return link_table_.isDeleted(extern_index); };
    size_t count = 0;
    for (DefinedName& dn : names_.entries()) {
        count += dn.record.definition.degradeReferences(is_deleted);
    }
    for (Sheet& sheet : sheets_) {
        sheet.block.forEachFormula([&](formula::Formula& f) { count += f.degradeReferences(is_deleted); });
    }
    if (count > 0) {
        MODEL_DEBUG("Degraded {} references to deleted sheets into #REF! tokens", count);
    }
}

void InternalWorkbook::setSheetOrder(const std::string& name, size_t position) {
    const int old_index = getSheetIndex(name);
    if (old_index < 0) {
        FASTXLS_THROW(core::ParameterException, fmt::format("Sheet '{}' does not exist", name), "name");
    }
    validateSheetIndex(position);

    const auto from = static_cast<size_t>(old_index);
    if (from == position) {
        return;
    }
    Sheet moving = std::move(sheets_[from]);
    sheets_.erase(sheets_.begin() + static_cast<std::ptrdiff_t>(from));
    sheets_.insert(sheets_.begin() + static_cast<std::ptrdiff_t>(position), std::move(moving));
    selection_.onSheetMoved(from, position);

    MODEL_DEBUG("Moved sheet '{}' from {} to {}", name, from, position);
}

void InternalWorkbook::setSheetName(size_t index, const std::string& name) {
    validateSheetIndex(index);
    validateSheetName(name, static_cast<int>(index));
    MODEL_DEBUG("Renamed sheet '{}' to '{}'", sheets_[index].name, name);
    sheets_[index].name = name;
}

Sheet& InternalWorkbook::getSheetAt(size_t index) {
    validateSheetIndex(index);
    return sheets_[index];
}

const Sheet& InternalWorkbook::getSheetAt(size_t index) const {
    validateSheetIndex(index);
    return sheets_[index];
}

int InternalWorkbook::getSheetIndex(const std::string& name) const {
    for (size_t i = 0; i < sheets_.size(); ++i) {
        if (utils::equalsIgnoreCase(sheets_[i].name, name)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int InternalWorkbook::getSheetIndex(SheetId id) const {
    for (size_t i = 0; i < sheets_.size(); ++i) {
        if (sheets_[i].id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

// ========== 选中与活动 ==========

void InternalWorkbook::setActiveSheet(size_t index) {
    validateSheetIndex(index);
    selection_.setActive(index);
}

int InternalWorkbook::getActiveSheetIndex() const {
    const auto active = selection_.activeTab();
    return active ? static_cast<int>(*active) : -1;
}

void InternalWorkbook::setSelectedTab(size_t index) {
    validateSheetIndex(index);
    selection_.setSelected(index);
}

void InternalWorkbook::setSelectedTabs(const std::vector<size_t>& indices) {
    for (size_t index : indices) {
        validateSheetIndex(index);
    }
    selection_.setSelectedTabs(std::set<size_t>(indices.begin(), indices.end()));
}

std::vector<size_t> InternalWorkbook::getSelectedTabs() const {
    const auto& selected = selection_.selectedTabs();
    return std::vector<size_t>(selected.begin(), selected.end());
}

bool InternalWorkbook::isSheetSelected(size_t index) const {
    validateSheetIndex(index);
    return selection_.isSelected(index);
}

bool InternalWorkbook::isSheetActive(size_t index) const {
    validateSheetIndex(index);
    return selection_.isActive(index);
}

void InternalWorkbook::setFirstVisibleTab(size_t index) {
    validateSheetIndex(index);
    selection_.setFirstVisible(index);
}

// ========== 定义名称 ==========

DefinedName& InternalWorkbook::createName() {
    ensureSlot(GlobalsSlot::Names);
    DefinedName& dn = names_.add();
    MODEL_DEBUG("Created defined name #{} (index {})", dn.id, names_.size() - 1);
    return dn;
}

DefinedName& InternalWorkbook::getNameAt(size_t index) {
    return names_.at(index);
}

DefinedName* InternalWorkbook::findName(NameId id) {
    return names_.findById(id);
}

const DefinedName* InternalWorkbook::findName(NameId id) const {
    return names_.findById(id);
}

void InternalWorkbook::removeName(size_t index) {
    const std::string text = NameTable::displayText(names_.at(index).record);
    names_.removeAt(index);

    // 公式中的名称记号按 NAME 记录顺序编号（从 1 开始）
    const auto removed = static_cast<uint16_t>(index + 1);
    size_t count = 0;
    for (DefinedName& dn : names_.entries()) {
        count += dn.record.definition.removeNameIndex(removed);
    }
    for (Sheet& sheet : sheets_) {
        sheet.block.forEachFormula([&](formula::Formula& f) { count += f.removeNameIndex(removed); });
    }
    MODEL_DEBUG("Removed defined name '{}' at index {}, rewrote {} name tokens", text, index, count);
}

void InternalWorkbook::setNameText(NameId id, const std::string& text) {
    DefinedName* dn = names_.findById(id);
    if (!dn) {
        FASTXLS_THROW(core::InvalidStateException, "Defined name has been removed from the workbook");
    }
    if (!NameTable::isValidName(text)) {
        FASTXLS_THROW(core::ParameterException, fmt::format("Invalid defined name: '{}'", text), "name");
    }
    if (names_.contains(text, dn->scope, id)) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("The {} already contains this name: {}", dn->scope ? "sheet" : "workbook", text),
                      "name");
    }
    dn->record.name = text;
    dn->record.options = static_cast<uint16_t>(dn->record.options & ~record::NameRecord::kBuiltInFlag);
}

void InternalWorkbook::setNameScope(NameId id, int sheet_index) {
    DefinedName* dn = names_.findById(id);
    if (!dn) {
        FASTXLS_THROW(core::InvalidStateException, "Defined name has been removed from the workbook");
    }
    std::optional<SheetId> scope;
    if (sheet_index >= 0) {
        validateSheetIndex(static_cast<size_t>(sheet_index));
        scope = sheets_[static_cast<size_t>(sheet_index)].id;
    } else if (sheet_index != -1) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("Sheet index ({}) is out of range", sheet_index), "sheet_index");
    }
    const std::string text = NameTable::displayText(dn->record);
    if (!text.empty() && names_.contains(text, scope, id)) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("The {} already contains this name: {}", scope ? "sheet" : "workbook", text),
                      "sheet_index");
    }
    dn->scope = scope;
}

int InternalWorkbook::getNameScope(NameId id) const {
    const DefinedName* dn = names_.findById(id);
    if (!dn || !dn->scope) {
        return -1;
    }
    return getSheetIndex(*dn->scope);
}

void InternalWorkbook::setNameFormula(NameId id, const std::string& text) {
    DefinedName* dn = names_.findById(id);
    if (!dn) {
        FASTXLS_THROW(core::InvalidStateException, "Defined name has been removed from the workbook");
    }
    formula::Formula parsed = parseFormula(text, formula::FormulaType::NamedRange);
    // 解析可能新增外部引用项，但不会增删名称，dn 仍然有效
    dn->record.definition = std::move(parsed);
    dn->record.definition_extra.clear();
}

std::string InternalWorkbook::getNameFormula(NameId id) const {
    const DefinedName* dn = names_.findById(id);
    if (!dn) {
        FASTXLS_THROW(core::InvalidStateException, "Defined name has been removed from the workbook");
    }
    return renderFormula(dn->record.definition);
}

// ========== 公式 ==========

formula::Formula InternalWorkbook::parseFormula(const std::string& text, formula::FormulaType type) {
    return formula::FormulaParser::parse(text, *this, type);
}

std::string InternalWorkbook::renderFormula(const formula::Formula& formula) const {
    return formula::FormulaRenderer::render(formula, *this);
}

std::optional<std::string> InternalWorkbook::sheetNameForExternIndex(uint16_t extern_index) const {
    const std::optional<SheetId> id = link_table_.sheetForExternIndex(extern_index);
    if (!id) {
        return std::nullopt;
    }
    const int index = getSheetIndex(*id);
    if (index < 0) {
        return std::nullopt;
    }
    return sheets_[static_cast<size_t>(index)].name;
}

int InternalWorkbook::externIndexForSheet(const std::string& sheet_name) {
    const int index = getSheetIndex(sheet_name);
    if (index < 0) {
        return -1;
    }
    ensureSlot(GlobalsSlot::LinkTable);
    return link_table_.findOrCreateExternIndex(sheets_[static_cast<size_t>(index)].id, sheets_.size());
}

std::string InternalWorkbook::nameText(uint16_t index) const {
    if (index == 0 || index > names_.size()) {
        return "#NAME?";
    }
    return NameTable::displayText(names_.entries()[index - 1].record);
}

uint16_t InternalWorkbook::nameIndexForText(const std::string& text) const {
    const int index = names_.indexOf(text);
    return index < 0 ? 0 : static_cast<uint16_t>(index + 1);
}

// ========== 样式与图片 ==========

core::Result<int> InternalWorkbook::tryAddCellStyle() {
    // 与默认单元格格式（XF 15）相同的属性
    return xfs_.tryAdd(record::XFRecord::make(0, 0, 0x0001, 0x20, 0x00));
}

PictureStore InternalWorkbook::pictureStore() {
    std::vector<record::DrawingGroupRecord*> groups;
    for (GlobalsItem& item : globals_) {
        if (auto* r = std::get_if<Record>(&item)) {
            if (auto* group = record::recordAs<record::DrawingGroupRecord>(*r)) {
                groups.push_back(group);
            }
        }
    }
    return PictureStore(std::move(groups));
}

size_t InternalWorkbook::getNumPictures() {
    return pictureStore().size();
}

uint32_t InternalWorkbook::getPictureRefCount(uint32_t pib) {
    return pictureStore().refCount(pib);
}

// ========== 写保护 ==========

void InternalWorkbook::writeProtect(const std::string& password, const std::string& user_name) {
    if (record::unicodeStringSize(user_name) > record::WriteAccessRecord::kDataSize) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("User name '{}' is too long for the WRITEACCESS record", user_name), "user_name");
    }

    if (findGlobal(record::sid::WRITEPROT) == kNotFound) {
        const size_t bof = findGlobal(record::sid::BOF);
        globals_.insert(globals_.begin() + static_cast<std::ptrdiff_t>(bof == kNotFound ? 0 : bof + 1),
                        Record(record::WriteProtectRecord{}));
    }

    size_t access = findGlobal(record::sid::WRITEACCESS);
    if (access == kNotFound) {
        const size_t interface_end = findGlobal(record::sid::INTERFACEEND);
        access = interface_end == kNotFound ? findGlobal(record::sid::WRITEPROT) + 1 : interface_end + 1;
        globals_.insert(globals_.begin() + static_cast<std::ptrdiff_t>(access), Record(record::WriteAccessRecord{}));
    }
    auto* wa = std::get_if<record::WriteAccessRecord>(&std::get<Record>(globals_[access]));
    if (!wa) {
        globals_[access] = Record(record::WriteAccessRecord{});
        wa = std::get_if<record::WriteAccessRecord>(&std::get<Record>(globals_[access]));
    }
    wa->user_name = user_name;

    size_t sharing = findGlobal(record::sid::FILESHARING);
    if (sharing == kNotFound) {
        sharing = access + 1;
        globals_.insert(globals_.begin() + static_cast<std::ptrdiff_t>(sharing), Record(record::FileSharingRecord{}));
    }
    auto* fs = std::get_if<record::FileSharingRecord>(&std::get<Record>(globals_[sharing]));
    if (!fs) {
        // 已有的 FILESHARING 未能解析，替换为新记录
        globals_[sharing] = Record(record::FileSharingRecord{});
        fs = std::get_if<record::FileSharingRecord>(&std::get<Record>(globals_[sharing]));
    }
    fs->read_only = 1;
    fs->password_hash = record::xorPasswordVerifier(password);
    fs->user_name = user_name;

    CORE_INFO("Workbook write-protected by '{}'", user_name);
}

void InternalWorkbook::unwriteProtect() {
    globals_.erase(std::remove_if(globals_.begin(), globals_.end(), [](const GlobalsItem& item) {
        const auto* r = std::get_if<Record>(&item);
        if (!r) {
            return false;
        }
        const uint16_t s = record::sidOf(*r);
        return s == record::sid::FILESHARING || s == record::sid::WRITEPROT;
    }), globals_.end());
}

bool InternalWorkbook::isWriteProtected() const {
    const size_t sharing = findGlobal(record::sid::FILESHARING);
    if (sharing == kNotFound) {
        return false;
    }
    const auto* fs = std::get_if<record::FileSharingRecord>(&std::get<Record>(globals_[sharing]));
    return fs && fs->read_only == 1;
}

// ========== 写出 ==========

void InternalWorkbook::applySelectionToRecords() {
    for (size_t i = 0; i < sheets_.size(); ++i) {
        if (record::Window2Record* w2 = sheets_[i].block.window2()) {
            w2->setSelected(selection_.isSelected(i));
            w2->setActive(selection_.isActive(i));
        }
    }
    window1_.active_tab = static_cast<uint16_t>(selection_.activeTab().value_or(0));
    window1_.first_visible_tab = static_cast<uint16_t>(selection_.firstVisibleTab());
    window1_.selected_tab_count = static_cast<uint16_t>(selection_.selectedTabs().size());
}

std::vector<record::Record> InternalWorkbook::emitGlobals() const {
    const std::vector<SheetId> order = sheetOrder();
    std::vector<Record> out;
    out.reserve(globals_.size() + sheets_.size() + names_.size() + xfs_.size());

    for (const GlobalsItem& item : globals_) {
        if (const auto* r = std::get_if<Record>(&item)) {
            if (record::sidOf(*r) == kSidTabId) {
                // TABID 按当前工作表顺序重新编号
                utils::ByteWriter w;
                for (size_t i = 0; i < sheets_.size(); ++i) {
                    w.writeU16(static_cast<uint16_t>(i));
                }
                out.emplace_back(record::UnknownRecord::make(kSidTabId, w.take()));
            } else {
                out.push_back(*r);
            }
            continue;
        }

        switch (std::get<GlobalsSlot>(item)) {
            case GlobalsSlot::BoundSheets:
                for (const Sheet& sheet : sheets_) {
                    record::BoundSheetRecord bs;
                    bs.visibility = sheet.visibility;
                    bs.sheet_type = sheet.sheet_type;
                    bs.name = sheet.name;
                    out.emplace_back(std::move(bs));
                }
                break;
            case GlobalsSlot::LinkTable: {
                std::vector<Record> link = link_table_.emit(order);
                out.insert(out.end(), std::make_move_iterator(link.begin()), std::make_move_iterator(link.end()));
                break;
            }
            case GlobalsSlot::Names:
                for (const DefinedName& dn : names_.entries()) {
                    record::NameRecord nr = dn.record;
                    nr.sheet_index = 0;
                    if (dn.scope) {
                        const int index = getSheetIndex(*dn.scope);
                        nr.sheet_index = index < 0 ? 0 : static_cast<uint16_t>(index + 1);
                    }
                    out.emplace_back(std::move(nr));
                }
                break;
            case GlobalsSlot::XFs:
                for (const record::XFRecord& xf : xfs_.records()) {
                    out.emplace_back(xf);
                }
                break;
            case GlobalsSlot::Window1:
                out.emplace_back(window1_);
                break;
        }
    }
    return out;
}

std::vector<uint8_t> InternalWorkbook::serialize() {
    applySelectionToRecords();
    std::vector<Record> globals = emitGlobals();

    // 预先计算各子流大小，得到 BOUNDSHEET 中的 BOF 位置
    const size_t globals_size = record::RecordCodec::encodedSize(globals);
    std::vector<size_t> sheet_sizes;
    sheet_sizes.reserve(sheets_.size());
    size_t total = globals_size;
    for (const Sheet& sheet : sheets_) {
        sheet_sizes.push_back(record::RecordCodec::encodedSize(sheet.block.records()));
        total += sheet_sizes.back();
    }

    size_t position = globals_size;
    size_t sheet_index = 0;
    for (Record& r : globals) {
        if (auto* bs = record::recordAs<record::BoundSheetRecord>(r)) {
            bs->position = static_cast<uint32_t>(position);
            position += sheet_sizes[sheet_index++];
        }
    }

    utils::ByteWriter out(total);
    record::RecordCodec::encodeInto(globals, out);

    for (size_t i = 0; i < sheets_.size(); ++i) {
        size_t written = 0;
        try {
            written = record::RecordCodec::encodeInto(sheets_[i].block.records(), out);
        } catch (const core::SizeMismatchException& e) {
            MODEL_ERROR("Sheet {} ('{}') failed to serialize: {}", i, sheets_[i].name, e.what());
            FASTXLS_THROW(core::SizeMismatchException,
                          fmt::format("Actual serialized sheet size differs from pre-calculated size ({}) "
                                      "for sheet ({}): {}", sheet_sizes[i], i, e.what()),
                          e.getSid(), sheet_sizes[i], sheet_sizes[i] - e.getDeclaredSize() + e.getActualSize());
        }
        if (written != sheet_sizes[i]) {
            FASTXLS_THROW(core::SizeMismatchException,
                          fmt::format("Actual serialized sheet size ({}) differs from pre-calculated size ({}) "
                                      "for sheet ({})", written, sheet_sizes[i], i),
                          record::sid::BOF, sheet_sizes[i], written);
        }
    }

    if (out.size() != total) {
        FASTXLS_THROW(core::SizeMismatchException,
                      fmt::format("Workbook stream is {} bytes, expected {}", out.size(), total),
                      record::sid::BOF, total, out.size());
    }

    MODEL_DEBUG("Serialized workbook stream: {} bytes ({} globals, {} sheets)", total, globals_size, sheets_.size());
    return out.take();
}

} // namespace model
} // namespace fastxls
