#pragma once

#include "fastxls/core/Expected.hpp"
#include "fastxls/utils/LittleEndian.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace fastxls {
namespace formula {

/**
 * @file Ptg.hpp
 * @brief BIFF8 公式解析记号（parsed thing）
 *
 * 公式和定义名称以逆波兰记号序列存储。这里只对结构管理需要理解的记号建模：
 * 单元格/区域引用（含三维引用与 #REF! 哨兵）、常量、运算符、函数调用和名称。
 * 其余记号使整条公式按原始字节保留（见 Formula）。
 */

/**
 * @brief 操作数类别，占记号 ID 的 bit5~6
 */
enum class PtgClass : uint8_t {
    Reference = 0x20,
    Value = 0x40,
    Array = 0x60
};

/**
 * @brief 单元格坐标及相对/绝对标志
 *
 * 列字段高两位：bit15 行相对，bit14 列相对
 */
struct CellRef {
    uint16_t row = 0;
    uint16_t col = 0;
    bool row_relative = true;
    bool col_relative = true;

    static CellRef decode(uint16_t row, uint16_t col_field) {
        CellRef ref;
        ref.row = row;
        ref.col = static_cast<uint16_t>(col_field & 0x3FFF);
        ref.row_relative = (col_field & 0x8000) != 0;
        ref.col_relative = (col_field & 0x4000) != 0;
        return ref;
    }

    uint16_t encodeColumn() const {
        return static_cast<uint16_t>((col & 0x3FFF) | (col_relative ? 0x4000 : 0) | (row_relative ? 0x8000 : 0));
    }

    bool operator==(const CellRef& other) const {
        return row == other.row && col == other.col &&
               row_relative == other.row_relative && col_relative == other.col_relative;
    }
    bool operator!=(const CellRef& other) const { return !(*this == other); }
};

// 引用记号

struct RefPtg {
    PtgClass cls = PtgClass::Reference;
    CellRef cell;
};

struct AreaPtg {
    PtgClass cls = PtgClass::Reference;
    CellRef first;
    CellRef last;
};

struct Ref3dPtg {
    PtgClass cls = PtgClass::Reference;
    uint16_t extern_index = 0;
    CellRef cell;
};

struct Area3dPtg {
    PtgClass cls = PtgClass::Reference;
    uint16_t extern_index = 0;
    CellRef first;
    CellRef last;
};

/// 指向已删除工作表的三维引用，保留原坐标以便显示
struct RefErr3dPtg {
    PtgClass cls = PtgClass::Reference;
    uint16_t extern_index = 0;
    CellRef cell;
};

struct AreaErr3dPtg {
    PtgClass cls = PtgClass::Reference;
    uint16_t extern_index = 0;
    CellRef first;
    CellRef last;
};

struct RefErrPtg {
    PtgClass cls = PtgClass::Reference;
};

struct AreaErrPtg {
    PtgClass cls = PtgClass::Reference;
};

// 常量记号

struct IntPtg {
    uint16_t value = 0;
};

struct NumPtg {
    double value = 0.0;
};

struct StrPtg {
    std::string value;
};

struct BoolPtg {
    bool value = false;
};

struct ErrPtg {
    uint8_t code = 0;
};

struct MissArgPtg {};

/**
 * @brief 无操作数字节的运算符（0x03~0x15）
 */
struct OperatorPtg {
    enum : uint8_t {
        Add = 0x03, Subtract = 0x04, Multiply = 0x05, Divide = 0x06, Power = 0x07,
        Concat = 0x08, Less = 0x09, LessEqual = 0x0A, Equal = 0x0B, GreaterEqual = 0x0C,
        Greater = 0x0D, NotEqual = 0x0E, Intersect = 0x0F, Union = 0x10, Range = 0x11,
        UnaryPlus = 0x12, UnaryMinus = 0x13, Percent = 0x14, Paren = 0x15
    };
    uint8_t id = Add;
};

// 函数与名称

struct FuncPtg {
    PtgClass cls = PtgClass::Value;
    uint16_t index = 0;
};

struct FuncVarPtg {
    PtgClass cls = PtgClass::Value;
    uint8_t arg_count = 0;   // 含 bit7 提示标志
    uint16_t index = 0;      // 含 bit15 命令等价标志
};

/// 工作簿内名称，index 从 1 开始
struct NamePtg {
    PtgClass cls = PtgClass::Reference;
    uint16_t index = 0;
};

struct NameXPtg {
    PtgClass cls = PtgClass::Reference;
    uint16_t extern_index = 0;
    uint16_t name_index = 0;
};

struct MemFuncPtg {
    PtgClass cls = PtgClass::Reference;
    uint16_t size = 0;
};

/**
 * @brief 控制记号（SUM 优化、IF/CHOOSE 跳转、空格等）
 */
struct AttrPtg {
    static constexpr uint8_t kSemiVolatile = 0x01;
    static constexpr uint8_t kIf = 0x02;
    static constexpr uint8_t kChoose = 0x04;
    static constexpr uint8_t kGoto = 0x08;
    static constexpr uint8_t kSum = 0x10;
    static constexpr uint8_t kSpace = 0x40;

    uint8_t options = 0;
    uint16_t data = 0;
    std::vector<uint16_t> jump_table;  // 仅 CHOOSE
};

/// 共享公式 / 模拟运算表引用（0x01 / 0x02）
struct ExpPtg {
    uint8_t id = 0x01;
    uint16_t row = 0;
    uint16_t col = 0;
};

using Ptg = std::variant<
    RefPtg, AreaPtg, Ref3dPtg, Area3dPtg, RefErr3dPtg, AreaErr3dPtg, RefErrPtg, AreaErrPtg,
    IntPtg, NumPtg, StrPtg, BoolPtg, ErrPtg, MissArgPtg, OperatorPtg,
    FuncPtg, FuncVarPtg, NamePtg, NameXPtg, MemFuncPtg, AttrPtg, ExpPtg>;

/**
 * @brief 读取一个记号
 * @return 不认识的记号 ID 返回 InvalidFormula 错误，调用方据此改为按原始字节保留
 */
core::Result<Ptg> readPtg(utils::ByteReader& reader);

void writePtg(const Ptg& ptg, utils::ByteWriter& writer);

/**
 * @brief 记号编码后的字节数
 */
size_t ptgSize(const Ptg& ptg);

/**
 * @brief 按编码结果比较两个记号
 */
bool ptgEquals(const Ptg& a, const Ptg& b);

} // namespace formula
} // namespace fastxls
