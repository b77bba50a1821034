#include "fastxls/cfb/CompoundFileWriter.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/LittleEndian.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"
#include "fastxls/utils/Unicode.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/format.h>

namespace fastxls {
namespace cfb {

using utils::writeU16LE;
using utils::writeU32LE;

namespace {

size_t ceilDiv(size_t value, size_t divisor) {
    return (value + divisor - 1) / divisor;
}

void writeU64LE(uint8_t* p, uint64_t v) {
    writeU32LE(p, static_cast<uint32_t>(v & 0xFFFFFFFFu));
    writeU32LE(p + 4, static_cast<uint32_t>(v >> 32));
}

} // namespace

CompoundFileWriter::CompoundFileWriter(uint16_t major_version)
    : major_version_(major_version == 4 ? 4 : 3)
    , sector_size_(sectorSizeForVersion(major_version_)) {
}

std::vector<uint8_t> CompoundFileWriter::write(const Entry& root) {
    flat_.clear();
    mini_stream_.clear();
    minifat_.clear();
    fat_.clear();
    fat_sectors_.clear();
    difat_sectors_.clear();
    next_free_ = 0;

    FlatEntry root_flat;
    root_flat.entry = &root;
    root_flat.name = u"Root Entry";
    flat_.push_back(root_flat);
    flatten(0);
    layoutMiniStream();

    // 计算各区域扇区数
    const size_t entries_per_sector = sector_size_ / 4;
    size_t stream_sectors = 0;
    for (const FlatEntry& flat : flat_) {
        if (flat.entry->type == EntryType::Stream && flat.size >= kMiniStreamCutoff) {
            stream_sectors += ceilDiv(static_cast<size_t>(flat.size), sector_size_);
        }
    }
    const size_t mini_container_sectors = ceilDiv(mini_stream_.size(), sector_size_);
    const size_t minifat_sectors = ceilDiv(minifat_.size() * 4, sector_size_);
    const size_t dir_sectors = ceilDiv(flat_.size() * kDirectoryEntrySize, sector_size_);
    const size_t base = stream_sectors + mini_container_sectors + minifat_sectors + dir_sectors;

    // FAT 自身也占用扇区，迭代到不动点
    size_t num_fat = 0;
    size_t num_difat = 0;
    while (true) {
        const size_t total = base + num_fat + num_difat;
        const size_t need_fat = ceilDiv(total, entries_per_sector);
        const size_t need_difat = need_fat > kHeaderDifatEntries
                                      ? ceilDiv(need_fat - kHeaderDifatEntries, entries_per_sector - 1)
                                      : 0;
        if (need_fat == num_fat && need_difat == num_difat) break;
        num_fat = need_fat;
        num_difat = need_difat;
    }

    fat_.assign(num_fat * entries_per_sector, FREESECT);

    // 普通流
    for (FlatEntry& flat : flat_) {
        if (flat.entry->type == EntryType::Stream && flat.size >= kMiniStreamCutoff) {
            flat.start = allocate(ceilDiv(static_cast<size_t>(flat.size), sector_size_));
        }
    }
    // 迷你流容器挂在根目录项上
    flat_[0].start = allocate(mini_container_sectors);
    flat_[0].size = mini_stream_.size();
    const SectorId first_dir = allocate(dir_sectors);
    const SectorId first_minifat = allocate(minifat_sectors);

    for (size_t i = 0; i < num_fat; ++i) {
        fat_sectors_.push_back(next_free_);
        fat_[next_free_++] = FATSECT;
    }
    for (size_t i = 0; i < num_difat; ++i) {
        difat_sectors_.push_back(next_free_);
        fat_[next_free_++] = DIFSECT;
    }

    std::vector<uint8_t> out(sector_size_ + static_cast<size_t>(next_free_) * sector_size_, 0);
    writeHeader(out, dir_sectors, minifat_sectors, first_dir, first_minifat,
                difat_sectors_.empty() ? ENDOFCHAIN : difat_sectors_.front());

    // 流数据
    for (const FlatEntry& flat : flat_) {
        if (flat.entry->type != EntryType::Stream || flat.size < kMiniStreamCutoff) continue;
        const std::vector<uint8_t>& data = flat.entry->data;
        for (size_t offset = 0, sector = flat.start; offset < data.size(); offset += sector_size_, ++sector) {
            const size_t take = std::min(sector_size_, data.size() - offset);
            std::memcpy(sectorPtr(out, static_cast<SectorId>(sector)), data.data() + offset, take);
        }
    }
    for (size_t offset = 0, sector = flat_[0].start; offset < mini_stream_.size(); offset += sector_size_, ++sector) {
        const size_t take = std::min(sector_size_, mini_stream_.size() - offset);
        std::memcpy(sectorPtr(out, static_cast<SectorId>(sector)), mini_stream_.data() + offset, take);
    }

    // 目录：空槽位的兄弟/子节点指针为 NOSTREAM
    const size_t dir_per_sector = sector_size_ / kDirectoryEntrySize;
    for (size_t i = 0; i < dir_sectors * dir_per_sector; ++i) {
        uint8_t* p = sectorPtr(out, static_cast<SectorId>(first_dir + i / dir_per_sector))
                     + (i % dir_per_sector) * kDirectoryEntrySize;
        if (i < flat_.size()) {
            writeDirectoryEntry(p, flat_[i]);
        } else {
            writeU32LE(p + 68, NOSTREAM);
            writeU32LE(p + 72, NOSTREAM);
            writeU32LE(p + 76, NOSTREAM);
        }
    }

    // 迷你 FAT
    for (size_t i = 0; i < minifat_sectors * entries_per_sector; ++i) {
        uint8_t* p = sectorPtr(out, static_cast<SectorId>(first_minifat + i / entries_per_sector))
                     + (i % entries_per_sector) * 4;
        writeU32LE(p, i < minifat_.size() ? minifat_[i] : FREESECT);
    }

    // FAT
    for (size_t i = 0; i < fat_.size(); ++i) {
        uint8_t* p = sectorPtr(out, fat_sectors_[i / entries_per_sector]) + (i % entries_per_sector) * 4;
        writeU32LE(p, fat_[i]);
    }

    // DIFAT：头部之外的 FAT 扇区位置
    size_t fat_index = kHeaderDifatEntries;
    for (size_t d = 0; d < difat_sectors_.size(); ++d) {
        uint8_t* p = sectorPtr(out, difat_sectors_[d]);
        for (size_t i = 0; i < entries_per_sector - 1; ++i, ++fat_index) {
            writeU32LE(p + i * 4, fat_index < fat_sectors_.size() ? fat_sectors_[fat_index] : FREESECT);
        }
        writeU32LE(p + (entries_per_sector - 1) * 4,
                   d + 1 < difat_sectors_.size() ? difat_sectors_[d + 1] : ENDOFCHAIN);
    }

    CFB_DEBUG("Laid out compound document v{}: {} entries, {} sectors ({} FAT, {} DIFAT), mini stream {} bytes",
              major_version_, flat_.size(), next_free_, num_fat, num_difat, mini_stream_.size());
    return out;
}

void CompoundFileWriter::flatten(uint32_t parent_index) {
    const Entry* parent = flat_[parent_index].entry;
    if (parent->children.empty()) {
        return;
    }

    std::vector<uint32_t> indices;
    indices.reserve(parent->children.size());
    for (const Entry& child : parent->children) {
        FlatEntry flat;
        flat.entry = &child;
        flat.name = utils::utf8ToUtf16(child.name);
        if (flat.name.empty() || flat.name.size() > kMaxEntryNameLength) {
            FASTXLS_THROW(core::ParameterException,
                          fmt::format("Directory entry name must be 1 to {} UTF-16 characters", kMaxEntryNameLength),
                          child.name);
        }
        if (child.type == EntryType::Stream) {
            flat.size = child.data.size();
        }
        indices.push_back(static_cast<uint32_t>(flat_.size()));
        flat_.push_back(std::move(flat));
    }

    std::sort(indices.begin(), indices.end(), [this](uint32_t a, uint32_t b) {
        return compareEntryNames(flat_[a].name, flat_[b].name) < 0;
    });
    for (size_t i = 1; i < indices.size(); ++i) {
        if (compareEntryNames(flat_[indices[i - 1]].name, flat_[indices[i]].name) == 0) {
            FASTXLS_THROW(core::ParameterException, "Duplicate directory entry name",
                          flat_[indices[i]].entry->name);
        }
    }

    // 中位数切分得到的树，所有空链接的深度只差一层：
    // 满层数为 floor(log2(n + 1))，更深一层（若存在）着红色，黑高保持一致
    size_t full_levels = 0;
    while ((size_t{2} << full_levels) <= indices.size() + 1) {
        ++full_levels;
    }
    flat_[parent_index].child = buildSiblingTree(indices, 0, indices.size(), 0, full_levels);

    for (uint32_t index : indices) {
        if (flat_[index].entry->isStorage()) {
            flatten(index);
        }
    }
}

uint32_t CompoundFileWriter::buildSiblingTree(const std::vector<uint32_t>& sorted, size_t begin, size_t end,
                                              size_t depth, size_t red_depth) {
    if (begin >= end) {
        return NOSTREAM;
    }
    const size_t mid = begin + (end - begin) / 2;
    const uint32_t node = sorted[mid];
    flat_[node].red = depth >= red_depth;
    flat_[node].left = buildSiblingTree(sorted, begin, mid, depth + 1, red_depth);
    flat_[node].right = buildSiblingTree(sorted, mid + 1, end, depth + 1, red_depth);
    return node;
}

void CompoundFileWriter::layoutMiniStream() {
    for (FlatEntry& flat : flat_) {
        if (flat.entry->type != EntryType::Stream || flat.size == 0 || flat.size >= kMiniStreamCutoff) {
            continue;
        }
        const std::vector<uint8_t>& data = flat.entry->data;
        const size_t count = ceilDiv(data.size(), kMiniSectorSize);
        const SectorId first = static_cast<SectorId>(minifat_.size());
        for (size_t i = 0; i < count; ++i) {
            minifat_.push_back(i + 1 < count ? static_cast<SectorId>(first + i + 1) : ENDOFCHAIN);
        }
        flat.start = first;
        mini_stream_.insert(mini_stream_.end(), data.begin(), data.end());
        mini_stream_.resize(minifat_.size() * kMiniSectorSize, 0);
    }
}

SectorId CompoundFileWriter::allocate(size_t count) {
    if (count == 0) {
        return ENDOFCHAIN;
    }
    const SectorId first = next_free_;
    for (size_t i = 0; i < count; ++i) {
        fat_[next_free_] = (i + 1 < count) ? next_free_ + 1 : ENDOFCHAIN;
        ++next_free_;
    }
    return first;
}

uint8_t* CompoundFileWriter::sectorPtr(std::vector<uint8_t>& out, SectorId id) const {
    return out.data() + (static_cast<size_t>(id) + 1) * sector_size_;
}

void CompoundFileWriter::writeHeader(std::vector<uint8_t>& out, size_t num_dir_sectors, size_t num_minifat_sectors,
                                     SectorId first_dir, SectorId first_minifat, SectorId first_difat) {
    uint8_t* h = out.data();
    std::copy(kSignature.begin(), kSignature.end(), h);
    writeU16LE(h + 24, 0x003E);
    writeU16LE(h + 26, major_version_);
    writeU16LE(h + 28, kByteOrderMark);
    writeU16LE(h + 30, major_version_ == 4 ? 12 : 9);
    writeU16LE(h + 32, 6);
    // v3 文件的目录扇区数必须为 0
    writeU32LE(h + 40, major_version_ == 4 ? static_cast<uint32_t>(num_dir_sectors) : 0);
    writeU32LE(h + 44, static_cast<uint32_t>(fat_sectors_.size()));
    writeU32LE(h + 48, first_dir);
    writeU32LE(h + 52, 0);
    writeU32LE(h + 56, kMiniStreamCutoff);
    writeU32LE(h + 60, num_minifat_sectors ? first_minifat : ENDOFCHAIN);
    writeU32LE(h + 64, static_cast<uint32_t>(num_minifat_sectors));
    writeU32LE(h + 68, first_difat);
    writeU32LE(h + 72, static_cast<uint32_t>(difat_sectors_.size()));
    for (size_t i = 0; i < kHeaderDifatEntries; ++i) {
        writeU32LE(h + 76 + i * 4, i < fat_sectors_.size() ? fat_sectors_[i] : FREESECT);
    }
}

void CompoundFileWriter::writeDirectoryEntry(uint8_t* p, const FlatEntry& flat) const {
    const Entry& entry = *flat.entry;
    for (size_t i = 0; i < flat.name.size(); ++i) {
        writeU16LE(p + i * 2, static_cast<uint16_t>(flat.name[i]));
    }
    writeU16LE(p + 64, static_cast<uint16_t>((flat.name.size() + 1) * 2));
    p[66] = static_cast<uint8_t>(entry.type);
    p[67] = flat.red ? 0 : 1;  // 0 红 1 黑
    writeU32LE(p + 68, flat.left);
    writeU32LE(p + 72, flat.right);
    writeU32LE(p + 76, flat.child);
    std::memcpy(p + 80, entry.clsid.data(), entry.clsid.size());
    writeU32LE(p + 96, entry.state_bits);
    writeU64LE(p + 100, entry.created);
    writeU64LE(p + 108, entry.modified);
    if (entry.type == EntryType::Storage) {
        writeU32LE(p + 116, 0);
        writeU64LE(p + 120, 0);
    } else {
        writeU32LE(p + 116, flat.start);
        writeU64LE(p + 120, flat.size);
    }
}

} // namespace cfb
} // namespace fastxls
