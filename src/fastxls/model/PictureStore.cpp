#include "fastxls/model/PictureStore.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace fastxls {
namespace model {

namespace {

constexpr size_t kEscherHeaderSize = 8;
constexpr uint16_t kContainerVersion = 0x000F;
constexpr uint16_t kTypeBse = 0xF007;
constexpr uint16_t kTypeOpt = 0xF00B;
constexpr uint16_t kPropertyPib = 0x0104;
constexpr uint16_t kPropertyIdMask = 0x3FFF;
constexpr uint16_t kPropertyComplex = 0x8000;
constexpr size_t kBseRefCountOffset = 24;   // BSE 记录体内 cRef 的位置

struct EscherHeader {
    uint16_t version;
    uint16_t instance;
    uint16_t type;
    uint32_t length;
};

template<typename ByteAt>
EscherHeader readHeader(const ByteAt& at, size_t pos) {
    auto u16 = [&](size_t p) { return static_cast<uint16_t>(at(p) | (at(p + 1) << 8)); };
    const uint16_t ver_inst = u16(pos);
    EscherHeader h;
    h.version = static_cast<uint16_t>(ver_inst & 0x000F);
    h.instance = static_cast<uint16_t>(ver_inst >> 4);
    h.type = u16(pos + 2);
    h.length = static_cast<uint32_t>(at(pos + 4)) | (static_cast<uint32_t>(at(pos + 5)) << 8) |
               (static_cast<uint32_t>(at(pos + 6)) << 16) | (static_cast<uint32_t>(at(pos + 7)) << 24);
    return h;
}

} // namespace

PictureStore::PictureStore(std::vector<record::DrawingGroupRecord*> groups) : groups_(std::move(groups)) {
    size_t total = 0;
    for (const record::DrawingGroupRecord* group : groups_) {
        total += group->data.size();
    }

    // 线性遍历：容器只跳过头部进入子项，原子记录整体跳过
    size_t pos = 0;
    auto at = [this](size_t p) { return byteAt(p); };
    while (pos + kEscherHeaderSize <= total) {
        const EscherHeader h = readHeader(at, pos);
        if (h.version == kContainerVersion) {
            pos += kEscherHeaderSize;
            continue;
        }
        if (h.type == kTypeBse) {
            if (pos + kEscherHeaderSize + kBseRefCountOffset + 4 > total) {
                MODEL_WARN("Truncated BSE entry at drawing group offset {}", pos);
                break;
            }
            ref_offsets_.push_back(pos + kEscherHeaderSize + kBseRefCountOffset);
        }
        pos += kEscherHeaderSize + h.length;
    }
}

size_t PictureStore::slotFor(uint32_t pib) const {
    if (pib == 0 || pib > ref_offsets_.size()) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("Picture index {} is out of range (1..{})", pib, ref_offsets_.size()),
                      "pib");
    }
    return pib - 1;
}

uint32_t PictureStore::refCount(uint32_t pib) const {
    return readU32At(ref_offsets_[slotFor(pib)]);
}

void PictureStore::addRef(uint32_t pib) {
    const size_t offset = ref_offsets_[slotFor(pib)];
    writeU32At(offset, readU32At(offset) + 1);
}

void PictureStore::release(uint32_t pib) {
    const size_t offset = ref_offsets_[slotFor(pib)];
    const uint32_t count = readU32At(offset);
    if (count > 0) {
        writeU32At(offset, count - 1);
    }
}

uint8_t PictureStore::byteAt(size_t offset) const {
    for (const record::DrawingGroupRecord* group : groups_) {
        if (offset < group->data.size()) {
            return group->data[offset];
        }
        offset -= group->data.size();
    }
    return 0;
}

void PictureStore::setByteAt(size_t offset, uint8_t value) {
    for (record::DrawingGroupRecord* group : groups_) {
        if (offset < group->data.size()) {
            group->data[offset] = value;
            return;
        }
        offset -= group->data.size();
    }
}

uint32_t PictureStore::readU32At(size_t offset) const {
    return static_cast<uint32_t>(byteAt(offset)) | (static_cast<uint32_t>(byteAt(offset + 1)) << 8) |
           (static_cast<uint32_t>(byteAt(offset + 2)) << 16) | (static_cast<uint32_t>(byteAt(offset + 3)) << 24);
}

void PictureStore::writeU32At(size_t offset, uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
        setByteAt(offset + i, static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

std::vector<uint32_t> PictureStore::collectPictureIds(const std::vector<uint8_t>& escher) {
    std::vector<uint32_t> ids;
    auto at = [&escher](size_t p) { return escher[p]; };
    size_t pos = 0;
    while (pos + kEscherHeaderSize <= escher.size()) {
        const EscherHeader h = readHeader(at, pos);
        if (h.version == kContainerVersion) {
            pos += kEscherHeaderSize;
            continue;
        }
        if (h.type == kTypeOpt) {
            // instance 为属性个数，每个属性 6 字节：id(2) + value(4)
            size_t prop = pos + kEscherHeaderSize;
            for (uint16_t i = 0; i < h.instance && prop + 6 <= escher.size(); ++i, prop += 6) {
                const uint16_t id = utils::readU16LE(escher.data() + prop);
                if ((id & kPropertyIdMask) == kPropertyPib && !(id & kPropertyComplex)) {
                    const uint32_t pib = utils::readU32LE(escher.data() + prop + 2);
                    if (pib > 0) {
                        ids.push_back(pib);
                    }
                }
            }
        }
        pos += kEscherHeaderSize + h.length;
    }
    return ids;
}

} // namespace model
} // namespace fastxls
