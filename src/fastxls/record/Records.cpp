#include "fastxls/record/Records.hpp"
#include "fastxls/record/BiffString.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/Unicode.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace fastxls {
namespace record {

namespace {

// 名称附加文本按单字节压缩形式存储，没有选项字节
std::string readCompressed(utils::ByteReader& in, size_t count) {
    std::vector<uint8_t> bytes = in.readBytes(count);
    return std::string(bytes.begin(), bytes.end());
}

void writeCompressed(utils::ByteWriter& out, const std::string& text) {
    out.writeBytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

uint8_t lengthByte(const std::string& text, const char* field) {
    if (text.size() > 0xFF) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("Name text field is {} bytes, limit is 255", text.size()), field);
    }
    return static_cast<uint8_t>(text.size());
}

} // namespace

// ========== BOF ==========

BOFRecord BOFRecord::create(uint16_t type) {
    BOFRecord bof;
    bof.type = type;
    utils::ByteWriter tail;
    tail.writeU16(0x10D3);       // build
    tail.writeU16(0x07CC);       // year
    tail.writeU32(0x00000041);   // history flags
    tail.writeU32(0x00000006);   // lowest BIFF version
    bof.tail = tail.take();
    return bof;
}

void BOFRecord::serialize(utils::ByteWriter& out) const {
    out.writeU16(version);
    out.writeU16(type);
    out.writeBytes(tail);
}

BOFRecord BOFRecord::parse(utils::ByteReader& in) {
    BOFRecord bof;
    bof.version = in.readU16();
    bof.type = in.readU16();
    bof.tail = in.readRemaining();
    return bof;
}

// ========== WINDOW1 ==========

void Window1Record::serialize(utils::ByteWriter& out) const {
    out.writeI16(h_pos);
    out.writeI16(v_pos);
    out.writeU16(width);
    out.writeU16(height);
    out.writeU16(options);
    out.writeU16(active_tab);
    out.writeU16(first_visible_tab);
    out.writeU16(selected_tab_count);
    out.writeU16(tab_width_ratio);
}

Window1Record Window1Record::parse(utils::ByteReader& in) {
    Window1Record w;
    w.h_pos = in.readI16();
    w.v_pos = in.readI16();
    w.width = in.readU16();
    w.height = in.readU16();
    w.options = in.readU16();
    w.active_tab = in.readU16();
    w.first_visible_tab = in.readU16();
    w.selected_tab_count = in.readU16();
    w.tab_width_ratio = in.readU16();
    return w;
}

// ========== BOUNDSHEET ==========

size_t BoundSheetRecord::dataSize() const {
    return 6 + shortUnicodeStringSize(name);
}

void BoundSheetRecord::serialize(utils::ByteWriter& out) const {
    out.writeU32(position);
    out.writeU8(visibility);
    out.writeU8(sheet_type);
    writeShortUnicodeString(out, name);
}

BoundSheetRecord BoundSheetRecord::parse(utils::ByteReader& in) {
    BoundSheetRecord bs;
    bs.position = in.readU32();
    bs.visibility = in.readU8();
    bs.sheet_type = in.readU8();
    bs.name = readShortUnicodeString(in);
    return bs;
}

// ========== WINDOW2 ==========

Window2Record Window2Record::create() {
    Window2Record w;
    utils::ByteWriter tail;
    tail.writeU32(0x00000040);  // 网格线颜色
    tail.writeU16(0);           // 分页预览缩放
    tail.writeU16(0);           // 普通视图缩放
    tail.writeU32(0);
    w.tail = tail.take();
    return w;
}

void Window2Record::serialize(utils::ByteWriter& out) const {
    out.writeU16(options);
    out.writeU16(top_row);
    out.writeU16(left_col);
    out.writeBytes(tail);
}

Window2Record Window2Record::parse(utils::ByteReader& in) {
    Window2Record w;
    w.options = in.readU16();
    w.top_row = in.readU16();
    w.left_col = in.readU16();
    w.tail = in.readRemaining();
    return w;
}

// ========== DIMENSIONS ==========

void DimensionsRecord::include(uint32_t row, uint16_t col) {
    if (isEmpty()) {
        first_row = row;
        last_row = row + 1;
        first_col = col;
        last_col = static_cast<uint16_t>(col + 1);
        return;
    }
    first_row = std::min(first_row, row);
    last_row = std::max(last_row, row + 1);
    first_col = std::min(first_col, col);
    last_col = std::max<uint16_t>(last_col, static_cast<uint16_t>(col + 1));
}

void DimensionsRecord::serialize(utils::ByteWriter& out) const {
    out.writeU32(first_row);
    out.writeU32(last_row);
    out.writeU16(first_col);
    out.writeU16(last_col);
    out.writeU16(0);
}

DimensionsRecord DimensionsRecord::parse(utils::ByteReader& in) {
    DimensionsRecord d;
    d.first_row = in.readU32();
    d.last_row = in.readU32();
    d.first_col = in.readU16();
    d.last_col = in.readU16();
    in.skip(2);
    return d;
}

// ========== SUPBOOK ==========

SupBookRecord SupBookRecord::createInternal(uint16_t sheet_count) {
    SupBookRecord sb;
    sb.sheet_count = sheet_count;
    sb.body = {static_cast<uint8_t>(kInternalMarker & 0xFF), static_cast<uint8_t>(kInternalMarker >> 8)};
    return sb;
}

bool SupBookRecord::isInternal() const {
    return body.size() == 2 && utils::readU16LE(body.data()) == kInternalMarker;
}

void SupBookRecord::serialize(utils::ByteWriter& out) const {
    out.writeU16(sheet_count);
    out.writeBytes(body);
}

SupBookRecord SupBookRecord::parse(utils::ByteReader& in) {
    SupBookRecord sb;
    sb.sheet_count = in.readU16();
    sb.body = in.readRemaining();
    return sb;
}

// ========== EXTERNSHEET ==========

void ExternSheetRecord::serialize(utils::ByteWriter& out) const {
    out.writeU16(static_cast<uint16_t>(refs.size()));
    for (const Ref& ref : refs) {
        out.writeU16(ref.supbook_index);
        out.writeU16(ref.first_sheet);
        out.writeU16(ref.last_sheet);
    }
}

ExternSheetRecord ExternSheetRecord::parse(utils::ByteReader& in) {
    ExternSheetRecord es;
    uint16_t count = in.readU16();
    es.refs.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        Ref ref;
        ref.supbook_index = in.readU16();
        ref.first_sheet = in.readU16();
        ref.last_sheet = in.readU16();
        es.refs.push_back(ref);
    }
    return es;
}

// ========== NAME ==========

NameRecord NameRecord::createBuiltIn(uint8_t code, uint16_t sheet_index) {
    NameRecord nr;
    nr.options = kBuiltInFlag;
    nr.sheet_index = sheet_index;
    nr.name = std::string(1, static_cast<char>(code));
    return nr;
}

size_t NameRecord::dataSize() const {
    size_t name_size = isBuiltIn() ? 2 : unicodeCharsSize(name);
    return 14 + name_size + definition.encodedSize() + definition_extra.size() +
           custom_menu.size() + description.size() + help_topic.size() + status_bar.size();
}

void NameRecord::serialize(utils::ByteWriter& out) const {
    out.writeU16(options);
    out.writeU8(keyboard_shortcut);
    if (isBuiltIn()) {
        out.writeU8(1);
    } else {
        size_t count = biffCharCount(name);
        if (count > 0xFF) {
            FASTXLS_THROW(core::ParameterException, "Defined name text is longer than 255 characters", "name");
        }
        out.writeU8(static_cast<uint8_t>(count));
    }
    out.writeU16(definition.encodedSize());
    out.writeU16(extern_sheet_plus1);
    out.writeU16(sheet_index);
    out.writeU8(lengthByte(custom_menu, "custom_menu"));
    out.writeU8(lengthByte(description, "description"));
    out.writeU8(lengthByte(help_topic, "help_topic"));
    out.writeU8(lengthByte(status_bar, "status_bar"));
    if (isBuiltIn()) {
        out.writeU8(0);
        out.writeU8(builtInCode());
    } else {
        writeUnicodeChars(out, name);
    }
    definition.write(out);
    out.writeBytes(definition_extra);
    writeCompressed(out, custom_menu);
    writeCompressed(out, description);
    writeCompressed(out, help_topic);
    writeCompressed(out, status_bar);
}

NameRecord NameRecord::parse(utils::ByteReader& in) {
    NameRecord nr;
    nr.options = in.readU16();
    nr.keyboard_shortcut = in.readU8();
    const uint8_t name_length = in.readU8();
    const uint16_t cce = in.readU16();
    nr.extern_sheet_plus1 = in.readU16();
    nr.sheet_index = in.readU16();
    const uint8_t menu_length = in.readU8();
    const uint8_t description_length = in.readU8();
    const uint8_t help_length = in.readU8();
    const uint8_t status_length = in.readU8();

    if (nr.isBuiltIn()) {
        const uint8_t flags = in.readU8();
        const uint16_t code = (flags & 0x01) ? in.readU16() : in.readU8();
        nr.name = std::string(1, static_cast<char>(code & 0xFF));
        if (name_length > 1) {
            in.skip((flags & 0x01) ? (name_length - 1) * 2u : name_length - 1u);
        }
    } else {
        nr.name = readUnicodeChars(in, name_length);
    }

    nr.definition = formula::Formula::read(in, cce);

    const size_t texts = static_cast<size_t>(menu_length) + description_length + help_length + status_length;
    if (in.remaining() < texts) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("NAME record too short for its {} bytes of descriptive text", texts));
    }
    nr.definition_extra = in.readBytes(in.remaining() - texts);
    nr.custom_menu = readCompressed(in, menu_length);
    nr.description = readCompressed(in, description_length);
    nr.help_topic = readCompressed(in, help_length);
    nr.status_bar = readCompressed(in, status_length);
    return nr;
}

// ========== XF ==========

XFRecord XFRecord::make(uint16_t font_index, uint16_t format_index, uint16_t type_protection,
                        uint8_t alignment, uint8_t used_attributes) {
    XFRecord xf;
    utils::writeU16LE(xf.data.data(), font_index);
    utils::writeU16LE(xf.data.data() + 2, format_index);
    utils::writeU16LE(xf.data.data() + 4, type_protection);
    xf.data[6] = alignment;
    xf.data[9] = used_attributes;
    utils::writeU16LE(xf.data.data() + 18, 0x20C0);  // 默认前景/背景调色板索引
    return xf;
}

void XFRecord::serialize(utils::ByteWriter& out) const {
    out.writeBytes(data.data(), data.size());
}

XFRecord XFRecord::parse(utils::ByteReader& in) {
    XFRecord xf;
    std::vector<uint8_t> bytes = in.readBytes(xf.data.size());
    std::copy(bytes.begin(), bytes.end(), xf.data.begin());
    return xf;
}

// ========== FORMULA / NUMBER / LABEL ==========

void FormulaRecord::serialize(utils::ByteWriter& out) const {
    out.writeU16(row);
    out.writeU16(col);
    out.writeU16(xf_index);
    out.writeU64(cached_result);
    out.writeU16(options);
    out.writeU32(reserved);
    out.writeU16(formula.encodedSize());
    formula.write(out);
    out.writeBytes(formula_extra);
}

FormulaRecord FormulaRecord::parse(utils::ByteReader& in) {
    FormulaRecord fr;
    fr.row = in.readU16();
    fr.col = in.readU16();
    fr.xf_index = in.readU16();
    fr.cached_result = in.readU64();
    fr.options = in.readU16();
    fr.reserved = in.readU32();
    const uint16_t cce = in.readU16();
    fr.formula = formula::Formula::read(in, cce);
    fr.formula_extra = in.readRemaining();
    return fr;
}

void NumberRecord::serialize(utils::ByteWriter& out) const {
    out.writeU16(row);
    out.writeU16(col);
    out.writeU16(xf_index);
    out.writeDouble(value);
}

NumberRecord NumberRecord::parse(utils::ByteReader& in) {
    NumberRecord nr;
    nr.row = in.readU16();
    nr.col = in.readU16();
    nr.xf_index = in.readU16();
    nr.value = in.readDouble();
    return nr;
}

size_t LabelRecord::dataSize() const {
    return 6 + unicodeStringSize(value);
}

void LabelRecord::serialize(utils::ByteWriter& out) const {
    out.writeU16(row);
    out.writeU16(col);
    out.writeU16(xf_index);
    writeUnicodeString(out, value);
}

LabelRecord LabelRecord::parse(utils::ByteReader& in) {
    LabelRecord lr;
    lr.row = in.readU16();
    lr.col = in.readU16();
    lr.xf_index = in.readU16();
    lr.value = readUnicodeString(in);
    return lr;
}

// ========== 绘图 ==========

DrawingGroupRecord DrawingGroupRecord::parse(utils::ByteReader& in) {
    DrawingGroupRecord r;
    r.data = in.readRemaining();
    return r;
}

DrawingRecord DrawingRecord::parse(utils::ByteReader& in) {
    DrawingRecord r;
    r.data = in.readRemaining();
    return r;
}

// ========== 写保护 ==========

size_t FileSharingRecord::dataSize() const {
    return 4 + (user_name.empty() ? 2 : unicodeStringSize(user_name));
}

void FileSharingRecord::serialize(utils::ByteWriter& out) const {
    out.writeU16(read_only);
    out.writeU16(password_hash);
    if (user_name.empty()) {
        out.writeU16(0);
    } else {
        writeUnicodeString(out, user_name);
    }
}

FileSharingRecord FileSharingRecord::parse(utils::ByteReader& in) {
    FileSharingRecord fs;
    fs.read_only = in.readU16();
    fs.password_hash = in.readU16();
    const uint16_t length = in.readU16();
    if (length > 0) {
        const uint8_t flags = in.readU8();
        std::u16string units;
        for (uint16_t i = 0; i < length; ++i) {
            units.push_back(static_cast<char16_t>((flags & 0x01) ? in.readU16() : in.readU8()));
        }
        fs.user_name = utils::utf16ToUtf8(units);
    }
    return fs;
}

void WriteAccessRecord::serialize(utils::ByteWriter& out) const {
    const size_t start = out.size();
    writeUnicodeString(out, user_name);
    const size_t written = out.size() - start;
    if (written > kDataSize) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("User name needs {} bytes, WRITEACCESS holds {}", written, kDataSize),
                      "user_name");
    }
    for (size_t i = written; i < kDataSize; ++i) {
        out.writeU8(' ');
    }
}

WriteAccessRecord WriteAccessRecord::parse(utils::ByteReader& in) {
    WriteAccessRecord wa;
    wa.user_name = readUnicodeString(in);
    if (in.remaining() > 0) {
        in.skip(in.remaining());
    }
    return wa;
}

// ========== 其他 ==========

UnknownRecord UnknownRecord::make(uint16_t sid, std::vector<uint8_t> payload) {
    UnknownRecord r;
    r.record_sid = sid;
    r.data = std::move(payload);
    return r;
}

uint16_t xorPasswordVerifier(const std::string& password) {
    if (password.empty()) {
        return 0;
    }
    // 每个字符取低字节，低字节为 0 时取高字节
    std::vector<uint8_t> bytes;
    for (char16_t c : utils::utf8ToUtf16(password)) {
        const uint8_t low = static_cast<uint8_t>(c & 0xFF);
        bytes.push_back(low != 0 ? low : static_cast<uint8_t>(c >> 8));
    }
    auto rotate = [](uint16_t v) -> uint16_t {
        return static_cast<uint16_t>(((v & 0x4000) ? 1 : 0) | ((v << 1) & 0x7FFF));
    };
    uint16_t verifier = 0;
    for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
        verifier = rotate(verifier);
        verifier ^= *it;
    }
    verifier = rotate(verifier);
    verifier ^= static_cast<uint16_t>(bytes.size());
    verifier ^= static_cast<uint16_t>(0x8000 | ('N' << 8) | 'K');
    return verifier;
}

} // namespace record
} // namespace fastxls
