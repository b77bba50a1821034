#include "fastxls/cfb/CompoundFileReader.hpp"
#include "fastxls/cfb/FileMagic.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/LittleEndian.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"
#include "fastxls/utils/Unicode.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/format.h>

namespace fastxls {
namespace cfb {

using utils::readU16LE;
using utils::readU32LE;

namespace {

uint64_t readU64LE(const uint8_t* p) {
    return static_cast<uint64_t>(readU32LE(p)) | (static_cast<uint64_t>(readU32LE(p + 4)) << 32);
}

std::string describeForeignSignature(const std::vector<uint8_t>& bytes) {
    const FileMagic magic = detectFileMagic(bytes);
    switch (magic) {
        case FileMagic::OLE2_BETA:
            return "The supplied data appears to be an old beta OLE2 document, which is not supported";
        case FileMagic::OOXML:
            return "The supplied data appears to be in the Office 2007+ XML (OOXML) format, "
                   "not an OLE2 compound document";
        case FileMagic::BIFF2:
        case FileMagic::BIFF3:
        case FileMagic::BIFF4:
        case FileMagic::BIFF5_RAW:
        case FileMagic::BIFF8_RAW:
            return fmt::format("The supplied data appears to be a {}, not an OLE2 compound document",
                               toString(magic));
        case FileMagic::XML:
            return "The supplied data appears to be an XML or HTML document, not an OLE2 compound document";
        default:
            break;
    }
    uint64_t found = bytes.size() >= 8 ? readU64LE(bytes.data()) : 0;
    return fmt::format("Invalid header signature; read 0x{:016X}, expected 0xE11AB1A1E011CFD0", found);
}

} // namespace

CompoundFileReader::CompoundFileReader(const std::vector<uint8_t>& bytes)
    : bytes_(bytes) {
}

Entry CompoundFileReader::read() {
    parseHeader();
    loadFat();
    loadDirectory();
    loadMiniStream();

    const RawDirectoryEntry& raw_root = directory_[0];
    Entry root;
    root.name = raw_root.name;
    root.type = EntryType::Root;
    root.clsid = raw_root.clsid;
    root.state_bits = raw_root.state_bits;
    root.created = raw_root.created;
    root.modified = raw_root.modified;

    std::unordered_set<uint32_t> visited{0};
    buildChildren(raw_root.child, root, visited, 0);

    CFB_DEBUG("Parsed compound document v{}: {} sectors, {} directory slots, {} top-level entries",
              major_version_, sector_count_, directory_.size(), root.children.size());
    return root;
}

void CompoundFileReader::parseHeader() {
    if (bytes_.size() < kSignature.size() ||
        !std::equal(kSignature.begin(), kSignature.end(), bytes_.begin())) {
        FASTXLS_THROW(core::FormatException, describeForeignSignature(bytes_));
    }
    if (bytes_.size() < kHeaderSize) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("Compound document header is truncated ({} bytes)", bytes_.size()));
    }

    const uint8_t* h = bytes_.data();
    std::memcpy(header_clsid_.data(), h + 8, header_clsid_.size());
    major_version_ = readU16LE(h + 26);
    const uint16_t byte_order = readU16LE(h + 28);
    const uint16_t sector_shift = readU16LE(h + 30);
    const uint16_t mini_sector_shift = readU16LE(h + 32);

    if (byte_order != kByteOrderMark) {
        FASTXLS_THROW(core::FormatException, fmt::format("Invalid byte order mark 0x{:04X}", byte_order));
    }
    if (major_version_ != 3 && major_version_ != 4) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("Unsupported compound document major version {}", major_version_));
    }
    const uint16_t expected_shift = major_version_ == 4 ? 12 : 9;
    if (sector_shift != expected_shift) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("Inconsistent sector shift {} for major version {}", sector_shift, major_version_));
    }
    if (mini_sector_shift != 6) {
        FASTXLS_THROW(core::FormatException, fmt::format("Invalid mini sector shift {}", mini_sector_shift));
    }

    sector_size_ = size_t(1) << sector_shift;
    sector_count_ = bytes_.size() > sector_size_
                        ? (bytes_.size() - sector_size_ + sector_size_ - 1) / sector_size_
                        : 0;

    num_fat_sectors_ = readU32LE(h + 44);
    first_dir_sector_ = readU32LE(h + 48);
    mini_stream_cutoff_ = readU32LE(h + 56);
    first_minifat_sector_ = readU32LE(h + 60);
    num_minifat_sectors_ = readU32LE(h + 64);
    first_difat_sector_ = readU32LE(h + 68);
    num_difat_sectors_ = readU32LE(h + 72);

    if (mini_stream_cutoff_ != kMiniStreamCutoff) {
        CFB_WARN("Non-standard mini stream cutoff {}, using {}", mini_stream_cutoff_, kMiniStreamCutoff);
        mini_stream_cutoff_ = kMiniStreamCutoff;
    }

    header_difat_.clear();
    for (size_t i = 0; i < kHeaderDifatEntries; ++i) {
        header_difat_.push_back(readU32LE(h + 76 + i * 4));
    }
}

const uint8_t* CompoundFileReader::sectorData(SectorId id) const {
    const size_t offset = (static_cast<size_t>(id) + 1) * sector_size_;
    if (id > MAXREGSECT || offset >= bytes_.size()) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("Sector index {} is out of range (file holds {} sectors)", id, sector_count_));
    }
    return bytes_.data() + offset;
}

void CompoundFileReader::loadFat() {
    std::vector<SectorId> fat_sectors;
    fat_sectors.reserve(num_fat_sectors_);

    for (SectorId id : header_difat_) {
        if (fat_sectors.size() >= num_fat_sectors_) break;
        if (id == FREESECT) break;
        fat_sectors.push_back(id);
    }

    // 头部 109 项之外的 FAT 扇区位置记录在 DIFAT 扇区链中
    const size_t entries_per_difat = sector_size_ / 4 - 1;
    std::unordered_set<SectorId> seen_difat;
    SectorId current = first_difat_sector_;
    while (fat_sectors.size() < num_fat_sectors_ && current != ENDOFCHAIN && current != FREESECT) {
        if (!seen_difat.insert(current).second || seen_difat.size() > num_difat_sectors_ + 1) {
            FASTXLS_THROW(core::FormatException, "DIFAT sector chain contains a cycle");
        }
        const uint8_t* data = sectorData(current);
        for (size_t i = 0; i < entries_per_difat && fat_sectors.size() < num_fat_sectors_; ++i) {
            SectorId id = readU32LE(data + i * 4);
            if (id != FREESECT) {
                fat_sectors.push_back(id);
            }
        }
        current = readU32LE(data + entries_per_difat * 4);
    }

    if (fat_sectors.size() < num_fat_sectors_) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("DIFAT lists {} FAT sectors but the header declares {}",
                                  fat_sectors.size(), num_fat_sectors_));
    }

    const size_t entries_per_sector = sector_size_ / 4;
    fat_.clear();
    fat_.reserve(fat_sectors.size() * entries_per_sector);
    for (SectorId id : fat_sectors) {
        const uint8_t* data = sectorData(id);
        for (size_t i = 0; i < entries_per_sector; ++i) {
            fat_.push_back(readU32LE(data + i * 4));
        }
    }
}

std::vector<SectorId> CompoundFileReader::followChain(SectorId start, const std::vector<SectorId>& table,
                                                      size_t limit, const char* what) const {
    std::vector<SectorId> chain;
    std::vector<bool> visited(table.size(), false);

    SectorId current = start;
    while (current != ENDOFCHAIN) {
        if (current > MAXREGSECT) {
            FASTXLS_THROW(core::FormatException,
                          fmt::format("Unexpected marker 0x{:08X} in {} sector chain", current, what));
        }
        if (current >= table.size() || current >= limit) {
            FASTXLS_THROW(core::FormatException,
                          fmt::format("{} sector chain references out-of-range sector {}", what, current));
        }
        if (visited[current]) {
            FASTXLS_THROW(core::FormatException,
                          fmt::format("{} sector chain contains a cycle at sector {}", what, current));
        }
        visited[current] = true;
        chain.push_back(current);
        current = table[current];
    }
    return chain;
}

std::vector<uint8_t> CompoundFileReader::readChain(const std::vector<SectorId>& chain, uint64_t size) const {
    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(size));
    for (SectorId id : chain) {
        if (out.size() >= size) break;
        const uint8_t* data = sectorData(id);
        const size_t offset = (static_cast<size_t>(id) + 1) * sector_size_;
        const size_t available = std::min(sector_size_, bytes_.size() - offset);
        const size_t wanted = std::min<uint64_t>(sector_size_, size - out.size());
        const size_t take = std::min(available, wanted);
        out.insert(out.end(), data, data + take);
        // 文件末尾不完整的扇区按 0 补齐
        out.insert(out.end(), wanted - take, 0);
    }
    return out;
}

void CompoundFileReader::loadDirectory() {
    const std::vector<SectorId> chain = followChain(first_dir_sector_, fat_, sector_count_, "Directory");
    if (chain.empty()) {
        FASTXLS_THROW(core::FormatException, "Compound document has no directory sectors");
    }
    const std::vector<uint8_t> data = readChain(chain, static_cast<uint64_t>(chain.size()) * sector_size_);

    const size_t count = data.size() / kDirectoryEntrySize;
    directory_.clear();
    directory_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const uint8_t* p = data.data() + i * kDirectoryEntrySize;
        RawDirectoryEntry entry;

        const uint8_t raw_type = p[66];
        switch (raw_type) {
            case 0: entry.type = EntryType::Empty; break;
            case 1: entry.type = EntryType::Storage; break;
            case 2: entry.type = EntryType::Stream; break;
            case 5: entry.type = EntryType::Root; break;
            default:
                CFB_WARN("Directory entry {} has unsupported type {}, treating it as empty", i, raw_type);
                entry.type = EntryType::Empty;
                break;
        }

        if (entry.type != EntryType::Empty) {
            uint16_t name_bytes = readU16LE(p + 64);
            if (name_bytes > 64 || (name_bytes % 2) != 0) {
                FASTXLS_THROW(core::FormatException,
                              fmt::format("Directory entry {} has invalid name length {}", i, name_bytes));
            }
            std::u16string name;
            for (size_t c = 0; c + 1 < name_bytes / 2u; ++c) {
                name.push_back(static_cast<char16_t>(readU16LE(p + c * 2)));
            }
            entry.name = utils::utf16ToUtf8(name);
        }

        entry.left = readU32LE(p + 68);
        entry.right = readU32LE(p + 72);
        entry.child = readU32LE(p + 76);
        std::memcpy(entry.clsid.data(), p + 80, entry.clsid.size());
        entry.state_bits = readU32LE(p + 96);
        entry.created = readU64LE(p + 100);
        entry.modified = readU64LE(p + 108);
        entry.start = readU32LE(p + 116);
        entry.size = readU64LE(p + 120);
        if (major_version_ == 3) {
            // v3 文件的高 32 位可能是垃圾数据
            entry.size &= 0xFFFFFFFFull;
        }
        directory_.push_back(std::move(entry));
    }

    if (directory_.empty() || directory_[0].type != EntryType::Root) {
        FASTXLS_THROW(core::FormatException, "Compound document directory has no root entry");
    }
}

void CompoundFileReader::loadMiniStream() {
    const RawDirectoryEntry& root = directory_[0];
    if (root.size > 0) {
        const std::vector<SectorId> chain = followChain(root.start, fat_, sector_count_, "Mini stream");
        if (static_cast<uint64_t>(chain.size()) * sector_size_ < root.size) {
            FASTXLS_THROW(core::FormatException,
                          fmt::format("Mini stream chain covers {} bytes, root entry declares {}",
                                      chain.size() * sector_size_, root.size));
        }
        mini_stream_ = readChain(chain, root.size);
    }

    if (num_minifat_sectors_ > 0 && first_minifat_sector_ != ENDOFCHAIN) {
        const std::vector<SectorId> chain = followChain(first_minifat_sector_, fat_, sector_count_, "MiniFAT");
        const std::vector<uint8_t> data = readChain(chain, static_cast<uint64_t>(chain.size()) * sector_size_);
        minifat_.reserve(data.size() / 4);
        for (size_t i = 0; i + 4 <= data.size(); i += 4) {
            minifat_.push_back(readU32LE(data.data() + i));
        }
    }
}

std::vector<uint8_t> CompoundFileReader::readStream(const RawDirectoryEntry& entry) const {
    if (entry.size == 0) {
        return {};
    }

    if (entry.size < mini_stream_cutoff_) {
        const size_t mini_limit = mini_stream_.size() / kMiniSectorSize
                                  + ((mini_stream_.size() % kMiniSectorSize) ? 1 : 0);
        const std::vector<SectorId> chain = followChain(entry.start, minifat_, mini_limit, "Mini");
        const uint64_t needed = (entry.size + kMiniSectorSize - 1) / kMiniSectorSize;
        if (chain.size() < needed) {
            FASTXLS_THROW(core::FormatException,
                          fmt::format("Mini sector chain for '{}' is shorter than its declared size {}",
                                      entry.name, entry.size));
        }
        std::vector<uint8_t> out;
        out.reserve(static_cast<size_t>(entry.size));
        for (SectorId id : chain) {
            if (out.size() >= entry.size) break;
            const size_t offset = static_cast<size_t>(id) * kMiniSectorSize;
            const size_t take = static_cast<size_t>(std::min<uint64_t>(
                {kMiniSectorSize, entry.size - out.size(), mini_stream_.size() - offset}));
            out.insert(out.end(), mini_stream_.begin() + offset, mini_stream_.begin() + offset + take);
        }
        out.resize(static_cast<size_t>(entry.size), 0);
        return out;
    }

    const std::vector<SectorId> chain = followChain(entry.start, fat_, sector_count_, "Stream");
    const uint64_t needed = (entry.size + sector_size_ - 1) / sector_size_;
    if (chain.size() < needed) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("Sector chain for '{}' is shorter than its declared size {} ({} of {} sectors)",
                                  entry.name, entry.size, chain.size(), needed));
    }
    if (chain.size() > needed) {
        CFB_WARN("Sector chain for '{}' has {} sectors, {} needed for {} bytes",
                 entry.name, chain.size(), needed, entry.size);
    }
    return readChain(chain, entry.size);
}

void CompoundFileReader::buildChildren(uint32_t node, Entry& parent,
                                       std::unordered_set<uint32_t>& visited, int depth) const {
    if (node == NOSTREAM) {
        return;
    }
    if (node >= directory_.size()) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("Directory tree references out-of-range entry {}", node));
    }
    if (!visited.insert(node).second) {
        FASTXLS_THROW(core::FormatException,
                      fmt::format("Directory tree contains a cycle at entry {}", node));
    }

    const RawDirectoryEntry& raw = directory_[node];
    buildChildren(raw.left, parent, visited, depth);

    if (raw.type == EntryType::Stream || raw.type == EntryType::Storage) {
        Entry entry;
        entry.name = raw.name;
        entry.type = raw.type;
        entry.clsid = raw.clsid;
        entry.state_bits = raw.state_bits;
        entry.created = raw.created;
        entry.modified = raw.modified;
        if (raw.type == EntryType::Stream) {
            entry.data = readStream(raw);
        } else {
            buildChildren(raw.child, entry, visited, depth + 1);
        }
        parent.children.push_back(std::move(entry));
    } else {
        CFB_WARN("Ignoring directory entry {} of type {} inside '{}'",
                 node, static_cast<int>(raw.type), parent.name);
    }

    buildChildren(raw.right, parent, visited, depth);
}

} // namespace cfb
} // namespace fastxls
