#pragma once

#include "fastxls/utils/LittleEndian.hpp"

#include <cstdint>
#include <vector>

namespace fastxls {
namespace test {

/**
 * @file EscherData.hpp
 * @brief 构造最小的绘图数据：BLIP 存储（BSE）和引用图片的形状（FOPT）
 */

inline void writeEscherHeader(utils::ByteWriter& out, uint16_t version, uint16_t instance,
                              uint16_t type, uint32_t length) {
    out.writeU16(static_cast<uint16_t>((version & 0x000F) | (instance << 4)));
    out.writeU16(type);
    out.writeU32(length);
}

/**
 * @brief MSODRAWINGGROUP 数据：OfficeArtDggContainer > BStoreContainer > 若干 BSE
 * @param ref_counts 每个 BSE 的初始 cRef
 */
inline std::vector<uint8_t> drawingGroupData(const std::vector<uint32_t>& ref_counts) {
    constexpr uint32_t kBseBodySize = 36;
    constexpr uint32_t kDggBodySize = 16;

    const uint32_t store_size = static_cast<uint32_t>(ref_counts.size()) * (8 + kBseBodySize);
    const uint32_t container_size = (8 + kDggBodySize) + (8 + store_size);

    utils::ByteWriter out;
    writeEscherHeader(out, 0xF, 0, 0xF000, container_size);

    writeEscherHeader(out, 0x0, 0, 0xF006, kDggBodySize);
    out.writeU32(1026);   // 最大形状编号
    out.writeU32(1);      // 簇数 + 1
    out.writeU32(static_cast<uint32_t>(ref_counts.size()));
    out.writeU32(1);      // 绘图数

    writeEscherHeader(out, 0xF, static_cast<uint16_t>(ref_counts.size()), 0xF001, store_size);
    for (uint32_t ref_count : ref_counts) {
        writeEscherHeader(out, 0x2, 6, 0xF007, kBseBodySize);
        out.writeU8(6);          // btWin32 = PNG
        out.writeU8(6);          // btMacOS
        out.writeZeros(16);      // rgbUid
        out.writeU16(0x00FF);    // tag
        out.writeU32(0);         // size
        out.writeU32(ref_count); // cRef
        out.writeU32(0);         // foDelay
        out.writeU8(0);          // usage
        out.writeU8(0);          // cbName
        out.writeU8(0);
        out.writeU8(0);
    }
    return out.take();
}

/**
 * @brief MSODRAWING 数据：DgContainer > SpgrContainer > 每张图片一个 SpContainer（含 FOPT.pib）
 */
inline std::vector<uint8_t> drawingData(const std::vector<uint32_t>& pibs) {
    constexpr uint32_t kOptBodySize = 6;
    const uint32_t sp_size = 8 + kOptBodySize;
    const uint32_t spgr_size = static_cast<uint32_t>(pibs.size()) * (8 + sp_size);
    const uint32_t dg_size = 8 + spgr_size;

    utils::ByteWriter out;
    writeEscherHeader(out, 0xF, 0, 0xF002, dg_size);
    writeEscherHeader(out, 0xF, 0, 0xF003, spgr_size);
    for (uint32_t pib : pibs) {
        writeEscherHeader(out, 0xF, 0, 0xF004, sp_size);
        writeEscherHeader(out, 0x3, 1, 0xF00B, kOptBodySize);
        out.writeU16(0x4104);   // pib，fBid 置位
        out.writeU32(pib);
    }
    return out.take();
}

} // namespace test
} // namespace fastxls
