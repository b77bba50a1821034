#pragma once

#include <string>

namespace fastxls {
namespace utils {

/**
 * @brief UTF-8 与 UTF-16 互转（基于 utf8cpp）
 *
 * 复合文档目录项名称和 BIFF8 字符串都以 UTF-16LE 存储
 * @throws FormatException 输入不是合法的 UTF-8 / UTF-16
 */
std::u16string utf8ToUtf16(const std::string& utf8);
std::string utf16ToUtf8(const std::u16string& utf16);

/**
 * @brief 检查是否是合法的 UTF-8
 */
bool isValidUtf8(const std::string& text);

/**
 * @brief 所有码元均不超过 0xFF，可用 BIFF8 压缩（单字节）形式存储
 */
bool isLatin1(const std::u16string& text);

/**
 * @brief ASCII 大小写不敏感比较（工作表名、定义名称）
 */
bool equalsIgnoreCase(const std::string& a, const std::string& b);

std::string toUpperAscii(std::string text);

} // namespace utils
} // namespace fastxls
