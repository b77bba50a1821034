#include "fastxls/record/BiffString.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/Unicode.hpp"

#include <fmt/format.h>

namespace fastxls {
namespace record {

namespace {

constexpr uint8_t kHighByteFlag = 0x01;
constexpr uint8_t kExtStringFlag = 0x04;
constexpr uint8_t kRichStringFlag = 0x08;

std::string readChars(utils::ByteReader& reader, size_t count, uint8_t flags) {
    if (flags & (kExtStringFlag | kRichStringFlag)) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("Rich or extended string (flags 0x{:02X}) is not supported here", flags));
    }
    std::u16string units;
    units.reserve(count);
    if (flags & kHighByteFlag) {
        for (size_t i = 0; i < count; ++i) {
            units.push_back(static_cast<char16_t>(reader.readU16()));
        }
    } else {
        for (size_t i = 0; i < count; ++i) {
            units.push_back(static_cast<char16_t>(reader.readU8()));
        }
    }
    return utils::utf16ToUtf8(units);
}

void writeChars(utils::ByteWriter& writer, const std::u16string& units) {
    if (utils::isLatin1(units)) {
        writer.writeU8(0);
        for (char16_t c : units) {
            writer.writeU8(static_cast<uint8_t>(c));
        }
    } else {
        writer.writeU8(kHighByteFlag);
        for (char16_t c : units) {
            writer.writeU16(static_cast<uint16_t>(c));
        }
    }
}

size_t charsSize(const std::u16string& units) {
    return 1 + (utils::isLatin1(units) ? units.size() : units.size() * 2);
}

} // namespace

size_t biffCharCount(const std::string& text) {
    return utils::utf8ToUtf16(text).size();
}

std::string readUnicodeString(utils::ByteReader& reader) {
    uint16_t count = reader.readU16();
    uint8_t flags = reader.readU8();
    return readChars(reader, count, flags);
}

void writeUnicodeString(utils::ByteWriter& writer, const std::string& text) {
    std::u16string units = utils::utf8ToUtf16(text);
    if (units.size() > 0xFFFF) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("String of {} characters exceeds the BIFF8 limit of 65535", units.size()), "text");
    }
    writer.writeU16(static_cast<uint16_t>(units.size()));
    writeChars(writer, units);
}

size_t unicodeStringSize(const std::string& text) {
    return 2 + charsSize(utils::utf8ToUtf16(text));
}

std::string readShortUnicodeString(utils::ByteReader& reader) {
    uint8_t count = reader.readU8();
    uint8_t flags = reader.readU8();
    return readChars(reader, count, flags);
}

void writeShortUnicodeString(utils::ByteWriter& writer, const std::string& text) {
    std::u16string units = utils::utf8ToUtf16(text);
    if (units.size() > 0xFF) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("String of {} characters exceeds the short string limit of 255", units.size()),
                      "text");
    }
    writer.writeU8(static_cast<uint8_t>(units.size()));
    writeChars(writer, units);
}

size_t shortUnicodeStringSize(const std::string& text) {
    return 1 + charsSize(utils::utf8ToUtf16(text));
}

std::string readUnicodeChars(utils::ByteReader& reader, size_t char_count) {
    uint8_t flags = reader.readU8();
    return readChars(reader, char_count, flags);
}

void writeUnicodeChars(utils::ByteWriter& writer, const std::string& text) {
    writeChars(writer, utils::utf8ToUtf16(text));
}

size_t unicodeCharsSize(const std::string& text) {
    return charsSize(utils::utf8ToUtf16(text));
}

} // namespace record
} // namespace fastxls
