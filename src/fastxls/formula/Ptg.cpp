#include "fastxls/formula/Ptg.hpp"
#include "fastxls/record/BiffString.hpp"

#include <fmt/format.h>
#include <type_traits>

namespace fastxls {
namespace formula {

namespace {

// 带操作数类别的记号基础 ID（低 5 位）
constexpr uint8_t kFunc = 0x01;
constexpr uint8_t kFuncVar = 0x02;
constexpr uint8_t kName = 0x03;
constexpr uint8_t kRef = 0x04;
constexpr uint8_t kArea = 0x05;
constexpr uint8_t kMemFunc = 0x09;
constexpr uint8_t kRefErr = 0x0A;
constexpr uint8_t kAreaErr = 0x0B;
constexpr uint8_t kNameX = 0x19;
constexpr uint8_t kRef3d = 0x1A;
constexpr uint8_t kArea3d = 0x1B;
constexpr uint8_t kRefErr3d = 0x1C;
constexpr uint8_t kAreaErr3d = 0x1D;

// 无类别记号
constexpr uint8_t kExp = 0x01;
constexpr uint8_t kTbl = 0x02;
constexpr uint8_t kMissArg = 0x16;
constexpr uint8_t kStr = 0x17;
constexpr uint8_t kAttr = 0x19;
constexpr uint8_t kErr = 0x1C;
constexpr uint8_t kBool = 0x1D;
constexpr uint8_t kInt = 0x1E;
constexpr uint8_t kNum = 0x1F;

uint8_t classedId(uint8_t base, PtgClass cls) {
    return static_cast<uint8_t>(base | static_cast<uint8_t>(cls));
}

CellRef readCell(utils::ByteReader& reader) {
    uint16_t row = reader.readU16();
    uint16_t col = reader.readU16();
    return CellRef::decode(row, col);
}

void readArea(utils::ByteReader& reader, CellRef& first, CellRef& last) {
    uint16_t first_row = reader.readU16();
    uint16_t last_row = reader.readU16();
    uint16_t first_col = reader.readU16();
    uint16_t last_col = reader.readU16();
    first = CellRef::decode(first_row, first_col);
    last = CellRef::decode(last_row, last_col);
}

void writeCell(utils::ByteWriter& writer, const CellRef& cell) {
    writer.writeU16(cell.row);
    writer.writeU16(cell.encodeColumn());
}

void writeArea(utils::ByteWriter& writer, const CellRef& first, const CellRef& last) {
    writer.writeU16(first.row);
    writer.writeU16(last.row);
    writer.writeU16(first.encodeColumn());
    writer.writeU16(last.encodeColumn());
}

core::Result<Ptg> readClassed(uint8_t id, utils::ByteReader& reader) {
    const auto cls = static_cast<PtgClass>(id & 0x60);
    switch (id & 0x1F) {
        case kFunc: {
            FuncPtg p{cls, reader.readU16()};
            return Ptg(p);
        }
        case kFuncVar: {
            FuncVarPtg p;
            p.cls = cls;
            p.arg_count = reader.readU8();
            p.index = reader.readU16();
            return Ptg(p);
        }
        case kName: {
            NamePtg p{cls, reader.readU16()};
            reader.skip(2);
            return Ptg(p);
        }
        case kRef: {
            RefPtg p{cls, readCell(reader)};
            return Ptg(p);
        }
        case kArea: {
            AreaPtg p;
            p.cls = cls;
            readArea(reader, p.first, p.last);
            return Ptg(p);
        }
        case kMemFunc: {
            MemFuncPtg p{cls, reader.readU16()};
            return Ptg(p);
        }
        case kRefErr: {
            reader.skip(4);
            return Ptg(RefErrPtg{cls});
        }
        case kAreaErr: {
            reader.skip(8);
            return Ptg(AreaErrPtg{cls});
        }
        case kNameX: {
            NameXPtg p;
            p.cls = cls;
            p.extern_index = reader.readU16();
            p.name_index = reader.readU16();
            reader.skip(2);
            return Ptg(p);
        }
        case kRef3d: {
            Ref3dPtg p;
            p.cls = cls;
            p.extern_index = reader.readU16();
            p.cell = readCell(reader);
            return Ptg(p);
        }
        case kArea3d: {
            Area3dPtg p;
            p.cls = cls;
            p.extern_index = reader.readU16();
            readArea(reader, p.first, p.last);
            return Ptg(p);
        }
        case kRefErr3d: {
            RefErr3dPtg p;
            p.cls = cls;
            p.extern_index = reader.readU16();
            p.cell = readCell(reader);
            return Ptg(p);
        }
        case kAreaErr3d: {
            AreaErr3dPtg p;
            p.cls = cls;
            p.extern_index = reader.readU16();
            readArea(reader, p.first, p.last);
            return Ptg(p);
        }
        default:
            return core::makeError(core::ErrorCode::InvalidFormula,
                                   fmt::format("Unsupported formula token 0x{:02X}", id));
    }
}

} // namespace

core::Result<Ptg> readPtg(utils::ByteReader& reader) {
    const uint8_t id = reader.readU8();
    if (id >= 0x20) {
        return readClassed(id, reader);
    }
    if (id >= OperatorPtg::Add && id <= OperatorPtg::Paren) {
        OperatorPtg p;
        p.id = id;
        return Ptg(p);
    }
    switch (id) {
        case kExp:
        case kTbl: {
            ExpPtg p;
            p.id = id;
            p.row = reader.readU16();
            p.col = reader.readU16();
            return Ptg(p);
        }
        case kMissArg:
            return Ptg(MissArgPtg{});
        case kStr: {
            StrPtg p;
            p.value = record::readShortUnicodeString(reader);
            return Ptg(std::move(p));
        }
        case kAttr: {
            AttrPtg p;
            p.options = reader.readU8();
            p.data = reader.readU16();
            if (p.options & AttrPtg::kChoose) {
                // 跳转表含 data + 1 个偏移
                for (uint32_t i = 0; i <= p.data; ++i) {
                    p.jump_table.push_back(reader.readU16());
                }
            }
            return Ptg(std::move(p));
        }
        case kErr:
            return Ptg(ErrPtg{reader.readU8()});
        case kBool:
            return Ptg(BoolPtg{reader.readU8() != 0});
        case kInt:
            return Ptg(IntPtg{reader.readU16()});
        case kNum:
            return Ptg(NumPtg{reader.readDouble()});
        default:
            return core::makeError(core::ErrorCode::InvalidFormula,
                                   fmt::format("Unsupported formula token 0x{:02X}", id));
    }
}

void writePtg(const Ptg& ptg, utils::ByteWriter& writer) {
    std::visit([&writer](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, RefPtg>) {
            writer.writeU8(classedId(kRef, p.cls));
            writeCell(writer, p.cell);
        } else if constexpr (std::is_same_v<T, AreaPtg>) {
            writer.writeU8(classedId(kArea, p.cls));
            writeArea(writer, p.first, p.last);
        } else if constexpr (std::is_same_v<T, Ref3dPtg>) {
            writer.writeU8(classedId(kRef3d, p.cls));
            writer.writeU16(p.extern_index);
            writeCell(writer, p.cell);
        } else if constexpr (std::is_same_v<T, Area3dPtg>) {
            writer.writeU8(classedId(kArea3d, p.cls));
            writer.writeU16(p.extern_index);
            writeArea(writer, p.first, p.last);
        } else if constexpr (std::is_same_v<T, RefErr3dPtg>) {
            writer.writeU8(classedId(kRefErr3d, p.cls));
            writer.writeU16(p.extern_index);
            writeCell(writer, p.cell);
        } else if constexpr (std::is_same_v<T, AreaErr3dPtg>) {
            writer.writeU8(classedId(kAreaErr3d, p.cls));
            writer.writeU16(p.extern_index);
            writeArea(writer, p.first, p.last);
        } else if constexpr (std::is_same_v<T, RefErrPtg>) {
            writer.writeU8(classedId(kRefErr, p.cls));
            writer.writeZeros(4);
        } else if constexpr (std::is_same_v<T, AreaErrPtg>) {
            writer.writeU8(classedId(kAreaErr, p.cls));
            writer.writeZeros(8);
        } else if constexpr (std::is_same_v<T, IntPtg>) {
            writer.writeU8(kInt);
            writer.writeU16(p.value);
        } else if constexpr (std::is_same_v<T, NumPtg>) {
            writer.writeU8(kNum);
            writer.writeDouble(p.value);
        } else if constexpr (std::is_same_v<T, StrPtg>) {
            writer.writeU8(kStr);
            record::writeShortUnicodeString(writer, p.value);
        } else if constexpr (std::is_same_v<T, BoolPtg>) {
            writer.writeU8(kBool);
            writer.writeU8(p.value ? 1 : 0);
        } else if constexpr (std::is_same_v<T, ErrPtg>) {
            writer.writeU8(kErr);
            writer.writeU8(p.code);
        } else if constexpr (std::is_same_v<T, MissArgPtg>) {
            writer.writeU8(kMissArg);
        } else if constexpr (std::is_same_v<T, OperatorPtg>) {
            writer.writeU8(p.id);
        } else if constexpr (std::is_same_v<T, FuncPtg>) {
            writer.writeU8(classedId(kFunc, p.cls));
            writer.writeU16(p.index);
        } else if constexpr (std::is_same_v<T, FuncVarPtg>) {
            writer.writeU8(classedId(kFuncVar, p.cls));
            writer.writeU8(p.arg_count);
            writer.writeU16(p.index);
        } else if constexpr (std::is_same_v<T, NamePtg>) {
            writer.writeU8(classedId(kName, p.cls));
            writer.writeU16(p.index);
            writer.writeU16(0);
        } else if constexpr (std::is_same_v<T, NameXPtg>) {
            writer.writeU8(classedId(kNameX, p.cls));
            writer.writeU16(p.extern_index);
            writer.writeU16(p.name_index);
            writer.writeU16(0);
        } else if constexpr (std::is_same_v<T, MemFuncPtg>) {
            writer.writeU8(classedId(kMemFunc, p.cls));
            writer.writeU16(p.size);
        } else if constexpr (std::is_same_v<T, AttrPtg>) {
            writer.writeU8(kAttr);
            writer.writeU8(p.options);
            writer.writeU16(p.data);
            for (uint16_t offset : p.jump_table) {
                writer.writeU16(offset);
            }
        } else if constexpr (std::is_same_v<T, ExpPtg>) {
            writer.writeU8(p.id);
            writer.writeU16(p.row);
            writer.writeU16(p.col);
        }
    }, ptg);
}

size_t ptgSize(const Ptg& ptg) {
    return std::visit([](const auto& p) -> size_t {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, RefPtg> || std::is_same_v<T, RefErrPtg> || std::is_same_v<T, ExpPtg> ||
                      std::is_same_v<T, NamePtg>) {
            return 5;
        } else if constexpr (std::is_same_v<T, AreaPtg> || std::is_same_v<T, AreaErrPtg> ||
                             std::is_same_v<T, NumPtg>) {
            return 9;
        } else if constexpr (std::is_same_v<T, Ref3dPtg> || std::is_same_v<T, RefErr3dPtg> ||
                             std::is_same_v<T, NameXPtg>) {
            return 7;
        } else if constexpr (std::is_same_v<T, Area3dPtg> || std::is_same_v<T, AreaErr3dPtg>) {
            return 11;
        } else if constexpr (std::is_same_v<T, IntPtg> || std::is_same_v<T, FuncPtg> ||
                             std::is_same_v<T, MemFuncPtg>) {
            return 3;
        } else if constexpr (std::is_same_v<T, FuncVarPtg>) {
            return 4;
        } else if constexpr (std::is_same_v<T, BoolPtg> || std::is_same_v<T, ErrPtg>) {
            return 2;
        } else if constexpr (std::is_same_v<T, MissArgPtg> || std::is_same_v<T, OperatorPtg>) {
            return 1;
        } else if constexpr (std::is_same_v<T, StrPtg>) {
            return 1 + record::shortUnicodeStringSize(p.value);
        } else {
            static_assert(std::is_same_v<T, AttrPtg>, "unhandled token type");
            return 4 + 2 * p.jump_table.size();
        }
    }, ptg);
}

bool ptgEquals(const Ptg& a, const Ptg& b) {
    if (a.index() != b.index()) {
        return false;
    }
    utils::ByteWriter wa;
    utils::ByteWriter wb;
    writePtg(a, wa);
    writePtg(b, wb);
    return wa.data() == wb.data();
}

} // namespace formula
} // namespace fastxls
