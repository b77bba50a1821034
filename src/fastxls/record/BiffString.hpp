#pragma once

#include "fastxls/utils/LittleEndian.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace fastxls {
namespace record {

/**
 * @file BiffString.hpp
 * @brief BIFF8 字符串编解码
 *
 * BIFF8 字符串由字符数、选项字节和字符数据组成。选项字节 bit0 为 1 时
 * 字符按 UTF-16LE 存储，否则每字符一个字节（Latin-1 压缩形式）。
 * 内存中统一使用 UTF-8。
 */

/// XLUnicodeString：16 位字符数 + 选项字节 + 字符
std::string readUnicodeString(utils::ByteReader& reader);
void writeUnicodeString(utils::ByteWriter& writer, const std::string& text);
size_t unicodeStringSize(const std::string& text);

/// ShortXLUnicodeString：8 位字符数 + 选项字节 + 字符
std::string readShortUnicodeString(utils::ByteReader& reader);
void writeShortUnicodeString(utils::ByteWriter& writer, const std::string& text);
size_t shortUnicodeStringSize(const std::string& text);

/// XLUnicodeStringNoCch：字符数由外部给出，只有选项字节 + 字符
std::string readUnicodeChars(utils::ByteReader& reader, size_t char_count);
void writeUnicodeChars(utils::ByteWriter& writer, const std::string& text);
size_t unicodeCharsSize(const std::string& text);

/**
 * @brief UTF-16 码元个数（BIFF8 中的“字符数”）
 */
size_t biffCharCount(const std::string& text);

} // namespace record
} // namespace fastxls
