#pragma once

#include "fastxls/formula/Formula.hpp"
#include "fastxls/utils/LittleEndian.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fastxls {
namespace record {

/**
 * @file Records.hpp
 * @brief 类型化的 BIFF8 记录
 *
 * 每种记录提供统一接口：
 * - sid()              记录类型
 * - dataSize()         声明的负载长度（不含 4 字节记录头）
 * - serialize(out)     写出负载
 * - static parse(in)   从完整负载解析（CONTINUE 已合并）
 *
 * 只对结构管理需要修改的记录建模，其余记录由 UnknownRecord 原样保留。
 */

namespace sid {
constexpr uint16_t FORMULA = 0x0006;
constexpr uint16_t EOF_ = 0x000A;
constexpr uint16_t EXTERNSHEET = 0x0017;
constexpr uint16_t NAME = 0x0018;
constexpr uint16_t EXTERNNAME = 0x0023;
constexpr uint16_t CONTINUE = 0x003C;
constexpr uint16_t WINDOW1 = 0x003D;
constexpr uint16_t FILESHARING = 0x005B;
constexpr uint16_t WRITEACCESS = 0x005C;
constexpr uint16_t BOUNDSHEET = 0x0085;
constexpr uint16_t WRITEPROT = 0x0086;
constexpr uint16_t COUNTRY = 0x008C;
constexpr uint16_t DBCELL = 0x00D7;
constexpr uint16_t XF = 0x00E0;
constexpr uint16_t INTERFACEEND = 0x00E2;
constexpr uint16_t MSODRAWINGGROUP = 0x00EB;
constexpr uint16_t MSODRAWING = 0x00EC;
constexpr uint16_t SST = 0x00FC;
constexpr uint16_t EXTSST = 0x00FF;
constexpr uint16_t SUPBOOK = 0x01AE;
constexpr uint16_t DIMENSIONS = 0x0200;
constexpr uint16_t NUMBER = 0x0203;
constexpr uint16_t LABEL = 0x0204;
constexpr uint16_t STRING = 0x0207;
constexpr uint16_t INDEX = 0x020B;
constexpr uint16_t WINDOW2 = 0x023E;
constexpr uint16_t BOF = 0x0809;
} // namespace sid

/// 单条物理记录负载上限，超出部分写入 CONTINUE
constexpr size_t kMaxRecordDataSize = 8224;

/**
 * @brief BOF：子流开始
 */
struct BOFRecord {
    static constexpr uint16_t kSid = sid::BOF;
    static constexpr uint16_t kBiff8Version = 0x0600;
    static constexpr uint16_t kBiff5Version = 0x0500;

    enum Type : uint16_t {
        Workbook = 0x0005,
        VBModule = 0x0006,
        Worksheet = 0x0010,
        Chart = 0x0020,
        Macro = 0x0040,
        Workspace = 0x0100
    };

    uint16_t version = kBiff8Version;
    uint16_t type = Worksheet;
    std::vector<uint8_t> tail;  // build、year、history flags、lowest version

    static BOFRecord create(uint16_t type);

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return 4 + tail.size(); }
    void serialize(utils::ByteWriter& out) const;
    static BOFRecord parse(utils::ByteReader& in);
};

struct EOFRecord {
    static constexpr uint16_t kSid = sid::EOF_;

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return 0; }
    void serialize(utils::ByteWriter&) const {}
    static EOFRecord parse(utils::ByteReader&) { return {}; }
};

/**
 * @brief WINDOW1：工作簿窗口，保存活动标签、首个可见标签和选中标签数
 */
struct Window1Record {
    static constexpr uint16_t kSid = sid::WINDOW1;
    static constexpr uint16_t kHidden = 0x0001;

    int16_t h_pos = 0x0168;
    int16_t v_pos = 0x010E;
    uint16_t width = 0x3A5C;
    uint16_t height = 0x23BE;
    uint16_t options = 0x0038;
    uint16_t active_tab = 0;
    uint16_t first_visible_tab = 0;
    uint16_t selected_tab_count = 1;
    uint16_t tab_width_ratio = 0x0258;

    bool isHidden() const { return (options & kHidden) != 0; }
    void setHidden(bool hidden) {
        options = static_cast<uint16_t>(hidden ? (options | kHidden) : (options & ~kHidden));
    }

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return 18; }
    void serialize(utils::ByteWriter& out) const;
    static Window1Record parse(utils::ByteReader& in);
};

/**
 * @brief BOUNDSHEET：工作表名称及其 BOF 在流中的绝对位置
 */
struct BoundSheetRecord {
    static constexpr uint16_t kSid = sid::BOUNDSHEET;

    uint32_t position = 0;
    uint8_t visibility = 0;   // 0 可见，1 隐藏，2 深度隐藏
    uint8_t sheet_type = 0;   // 0 工作表
    std::string name;

    uint16_t sid() const { return kSid; }
    size_t dataSize() const;
    void serialize(utils::ByteWriter& out) const;
    static BoundSheetRecord parse(utils::ByteReader& in);
};

/**
 * @brief WINDOW2：工作表窗口，bit9 选中，bit10 活动（显示中）
 */
struct Window2Record {
    static constexpr uint16_t kSid = sid::WINDOW2;
    static constexpr uint16_t kSelected = 0x0200;
    static constexpr uint16_t kActive = 0x0400;

    uint16_t options = 0x06B6;
    uint16_t top_row = 0;
    uint16_t left_col = 0;
    std::vector<uint8_t> tail;  // 网格线颜色、缩放比例；图表子流中可能缺失

    static Window2Record create();

    bool isSelected() const { return (options & kSelected) != 0; }
    bool isActive() const { return (options & kActive) != 0; }
    void setSelected(bool on) { setFlag(kSelected, on); }
    void setActive(bool on) { setFlag(kActive, on); }

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return 6 + tail.size(); }
    void serialize(utils::ByteWriter& out) const;
    static Window2Record parse(utils::ByteReader& in);

private:
    void setFlag(uint16_t flag, bool on) {
        options = static_cast<uint16_t>(on ? (options | flag) : (options & ~flag));
    }
};

/**
 * @brief DIMENSIONS：已用区域，末行末列为开区间
 */
struct DimensionsRecord {
    static constexpr uint16_t kSid = sid::DIMENSIONS;

    uint32_t first_row = 0;
    uint32_t last_row = 0;
    uint16_t first_col = 0;
    uint16_t last_col = 0;

    bool isEmpty() const { return last_row <= first_row || last_col <= first_col; }

    /**
     * @brief 扩展已用区域以包含 (row, col)
     */
    void include(uint32_t row, uint16_t col);

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return 14; }
    void serialize(utils::ByteWriter& out) const;
    static DimensionsRecord parse(utils::ByteReader& in);
};

/**
 * @brief SUPBOOK：外部引用的工作簿（本工作簿、加载项或外部文件）
 */
struct SupBookRecord {
    static constexpr uint16_t kSid = sid::SUPBOOK;
    static constexpr uint16_t kInternalMarker = 0x0401;
    static constexpr uint16_t kAddInMarker = 0x3A01;

    uint16_t sheet_count = 0;
    std::vector<uint8_t> body;  // 内部引用时为 2 字节标记；外部文件为路径和工作表名

    static SupBookRecord createInternal(uint16_t sheet_count);

    bool isInternal() const;

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return 2 + body.size(); }
    void serialize(utils::ByteWriter& out) const;
    static SupBookRecord parse(utils::ByteReader& in);
};

/**
 * @brief EXTERNSHEET：外部工作表索引表
 */
struct ExternSheetRecord {
    static constexpr uint16_t kSid = sid::EXTERNSHEET;
    /// 工作表已被删除
    static constexpr uint16_t kDeletedSheet = 0xFFFF;

    struct Ref {
        uint16_t supbook_index = 0;
        uint16_t first_sheet = 0;
        uint16_t last_sheet = 0;
    };

    std::vector<Ref> refs;

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return 2 + refs.size() * 6; }
    void serialize(utils::ByteWriter& out) const;
    static ExternSheetRecord parse(utils::ByteReader& in);
};

/**
 * @brief NAME：定义名称
 *
 * sheet_index 为 0 表示工作簿级，否则为从 1 开始的工作表序号。
 * 内置名称（Print_Area 等）的名称文本只有一个字符，即内置代码。
 */
struct NameRecord {
    static constexpr uint16_t kSid = sid::NAME;
    static constexpr uint16_t kHiddenFlag = 0x0001;
    static constexpr uint16_t kBuiltInFlag = 0x0020;

    enum BuiltIn : uint8_t {
        ConsolidateArea = 0x00, AutoOpen = 0x01, AutoClose = 0x02, Extract = 0x03,
        Database = 0x04, Criteria = 0x05, PrintArea = 0x06, PrintTitles = 0x07,
        Recorder = 0x08, DataForm = 0x09, AutoActivate = 0x0A, AutoDeactivate = 0x0B,
        SheetTitle = 0x0C, FilterDatabase = 0x0D
    };

    uint16_t options = 0;
    uint8_t keyboard_shortcut = 0;
    uint16_t extern_sheet_plus1 = 0;
    uint16_t sheet_index = 0;
    std::string name;
    formula::Formula definition;
    std::vector<uint8_t> definition_extra;  // 数组常量等附加数据
    std::string custom_menu;
    std::string description;
    std::string help_topic;
    std::string status_bar;

    static NameRecord createBuiltIn(uint8_t code, uint16_t sheet_index);

    bool isBuiltIn() const { return (options & kBuiltInFlag) != 0; }
    uint8_t builtInCode() const { return name.empty() ? 0 : static_cast<uint8_t>(name[0]); }

    uint16_t sid() const { return kSid; }
    size_t dataSize() const;
    void serialize(utils::ByteWriter& out) const;
    static NameRecord parse(utils::ByteReader& in);
};

/**
 * @brief XF：单元格 / 样式格式，20 字节
 */
struct XFRecord {
    static constexpr uint16_t kSid = sid::XF;
    static constexpr uint16_t kStyleFlag = 0x0004;

    std::array<uint8_t, 20> data{};

    static XFRecord make(uint16_t font_index, uint16_t format_index, uint16_t type_protection,
                         uint8_t alignment, uint8_t used_attributes);

    uint16_t fontIndex() const { return utils::readU16LE(data.data()); }
    uint16_t formatIndex() const { return utils::readU16LE(data.data() + 2); }
    bool isStyle() const { return (utils::readU16LE(data.data() + 4) & kStyleFlag) != 0; }

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return data.size(); }
    void serialize(utils::ByteWriter& out) const;
    static XFRecord parse(utils::ByteReader& in);
};

/**
 * @brief FORMULA：公式单元格
 */
struct FormulaRecord {
    static constexpr uint16_t kSid = sid::FORMULA;
    static constexpr uint16_t kAlwaysCalc = 0x0001;
    static constexpr uint16_t kSharedFormula = 0x0008;

    uint16_t row = 0;
    uint16_t col = 0;
    uint16_t xf_index = 0x0F;
    uint64_t cached_result = 0;  // 原样保存的 8 字节计算结果
    uint16_t options = kAlwaysCalc;
    uint32_t reserved = 0;
    formula::Formula formula;
    std::vector<uint8_t> formula_extra;

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return 22 + formula.encodedSize() + formula_extra.size(); }
    void serialize(utils::ByteWriter& out) const;
    static FormulaRecord parse(utils::ByteReader& in);
};

struct NumberRecord {
    static constexpr uint16_t kSid = sid::NUMBER;

    uint16_t row = 0;
    uint16_t col = 0;
    uint16_t xf_index = 0x0F;
    double value = 0.0;

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return 14; }
    void serialize(utils::ByteWriter& out) const;
    static NumberRecord parse(utils::ByteReader& in);
};

struct LabelRecord {
    static constexpr uint16_t kSid = sid::LABEL;

    uint16_t row = 0;
    uint16_t col = 0;
    uint16_t xf_index = 0x0F;
    std::string value;

    uint16_t sid() const { return kSid; }
    size_t dataSize() const;
    void serialize(utils::ByteWriter& out) const;
    static LabelRecord parse(utils::ByteReader& in);
};

/**
 * @brief MSODRAWINGGROUP：工作簿级绘图数据（含 BLIP 存储），常跨越多个 CONTINUE
 */
struct DrawingGroupRecord {
    static constexpr uint16_t kSid = sid::MSODRAWINGGROUP;

    std::vector<uint8_t> data;
    std::vector<uint16_t> fragments;  // 读入时的分片长度，写出时沿用

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return data.size(); }
    void serialize(utils::ByteWriter& out) const { out.writeBytes(data); }
    static DrawingGroupRecord parse(utils::ByteReader& in);
};

/**
 * @brief MSODRAWING：工作表绘图数据
 */
struct DrawingRecord {
    static constexpr uint16_t kSid = sid::MSODRAWING;

    std::vector<uint8_t> data;
    std::vector<uint16_t> fragments;

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return data.size(); }
    void serialize(utils::ByteWriter& out) const { out.writeBytes(data); }
    static DrawingRecord parse(utils::ByteReader& in);
};

struct WriteProtectRecord {
    static constexpr uint16_t kSid = sid::WRITEPROT;

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return 0; }
    void serialize(utils::ByteWriter&) const {}
    static WriteProtectRecord parse(utils::ByteReader&) { return {}; }
};

/**
 * @brief FILESHARING：只读建议、写保护密码校验值、保护者
 */
struct FileSharingRecord {
    static constexpr uint16_t kSid = sid::FILESHARING;

    uint16_t read_only = 0;
    uint16_t password_hash = 0;
    std::string user_name;

    uint16_t sid() const { return kSid; }
    size_t dataSize() const;
    void serialize(utils::ByteWriter& out) const;
    static FileSharingRecord parse(utils::ByteReader& in);
};

/**
 * @brief WRITEACCESS：最后保存者，空格补齐到 112 字节
 */
struct WriteAccessRecord {
    static constexpr uint16_t kSid = sid::WRITEACCESS;
    static constexpr size_t kDataSize = 112;

    std::string user_name;

    uint16_t sid() const { return kSid; }
    size_t dataSize() const { return kDataSize; }
    void serialize(utils::ByteWriter& out) const;
    static WriteAccessRecord parse(utils::ByteReader& in);
};

/**
 * @brief 未建模的记录，按原始负载和分片边界无损保存
 */
struct UnknownRecord {
    uint16_t record_sid = 0;
    std::vector<uint8_t> data;
    std::vector<uint16_t> fragments;

    static UnknownRecord make(uint16_t sid, std::vector<uint8_t> payload);

    uint16_t sid() const { return record_sid; }
    size_t dataSize() const { return data.size(); }
    void serialize(utils::ByteWriter& out) const { out.writeBytes(data); }
};

/**
 * @brief 由外部协作者（图表等）生成的记录
 *
 * 记录内容不由本库管理，编码时同样要求 dataSize() 与 serialize() 一致。
 */
class IExternalRecord {
public:
    virtual ~IExternalRecord() = default;

    virtual uint16_t sid() const = 0;
    virtual size_t dataSize() const = 0;
    virtual void serialize(utils::ByteWriter& out) const = 0;
};

struct ExternalRecord {
    std::shared_ptr<const IExternalRecord> impl;

    uint16_t sid() const { return impl->sid(); }
    size_t dataSize() const { return impl->dataSize(); }
    void serialize(utils::ByteWriter& out) const { impl->serialize(out); }
};

/**
 * @brief 写保护密码的 16 位 XOR 校验值
 */
uint16_t xorPasswordVerifier(const std::string& password);

} // namespace record
} // namespace fastxls
