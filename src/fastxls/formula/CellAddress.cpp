#include "fastxls/formula/CellAddress.hpp"
#include "fastxls/core/Constants.hpp"

#include <cctype>

namespace fastxls {
namespace formula {

std::string CellAddress::columnToLetters(int index) {
    std::string result;
    index++;  // 转换为1基索引进行计算
    while (index > 0) {
        index--;
        result.insert(result.begin(), static_cast<char>('A' + (index % 26)));
        index /= 26;
    }
    return result;
}

int CellAddress::lettersToColumn(const std::string& letters) {
    if (letters.empty() || letters.size() > 3) {
        return -1;
    }
    int result = 0;
    for (char c : letters) {
        char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (upper < 'A' || upper > 'Z') {
            return -1;
        }
        result = result * 26 + (upper - 'A' + 1);
    }
    return result - 1;
}

std::string CellAddress::format(const CellRef& ref) {
    std::string text;
    if (!ref.col_relative) text += '$';
    text += columnToLetters(ref.col);
    if (!ref.row_relative) text += '$';
    text += std::to_string(ref.row + 1);
    return text;
}

std::string CellAddress::formatArea(const CellRef& first, const CellRef& last) {
    return format(first) + ":" + format(last);
}

bool CellAddress::parse(const std::string& text, CellRef& out) {
    size_t pos = 0;
    CellRef ref;

    ref.col_relative = true;
    if (pos < text.size() && text[pos] == '$') {
        ref.col_relative = false;
        ++pos;
    }
    size_t letters_start = pos;
    while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    int col = lettersToColumn(text.substr(letters_start, pos - letters_start));
    if (col < 0 || col >= static_cast<int>(core::Constants::kMaxColumns)) {
        return false;
    }

    ref.row_relative = true;
    if (pos < text.size() && text[pos] == '$') {
        ref.row_relative = false;
        ++pos;
    }
    size_t digits_start = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos != text.size() || digits_start == pos || pos - digits_start > 5) {
        return false;
    }
    long row = std::stol(text.substr(digits_start));
    if (row < 1 || row > static_cast<long>(core::Constants::kMaxRows)) {
        return false;
    }

    ref.row = static_cast<uint16_t>(row - 1);
    ref.col = static_cast<uint16_t>(col);
    out = ref;
    return true;
}

std::string CellAddress::quoteSheetName(const std::string& sheet_name) {
    if (!needsQuoting(sheet_name)) {
        return sheet_name;
    }
    std::string quoted = "'";
    for (char c : sheet_name) {
        quoted += c;
        if (c == '\'') {
            quoted += '\'';
        }
    }
    quoted += '\'';
    return quoted;
}

bool CellAddress::needsQuoting(const std::string& sheet_name) {
    if (sheet_name.empty() || std::isdigit(static_cast<unsigned char>(sheet_name[0]))) {
        return true;
    }
    for (char c : sheet_name) {
        unsigned char u = static_cast<unsigned char>(c);
        // 非ASCII字符按字母处理
        if (u < 0x80 && !std::isalnum(u) && c != '_' && c != '.') {
            return true;
        }
    }
    // 形如单元格地址或布尔常量的名称也必须加引号
    CellRef unused;
    if (parse(sheet_name, unused)) {
        return true;
    }
    std::string upper;
    for (char c : sheet_name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return upper == "TRUE" || upper == "FALSE";
}

} // namespace formula
} // namespace fastxls
