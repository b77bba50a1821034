#pragma once

#include "fastxls/cfb/CfbTypes.hpp"
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace fastxls {
namespace cfb {

/**
 * @brief 复合文档解析器
 *
 * 一次性解析整个文件：校验文件头，重建 FAT / 迷你 FAT，
 * 遍历目录红黑树并把所有流读入内存（Entry 树）。
 * 扇区链成环、越界、长度不足时抛出 FormatException。
 */
class CompoundFileReader {
public:
    explicit CompoundFileReader(const std::vector<uint8_t>& bytes);

    CompoundFileReader(const CompoundFileReader&) = delete;
    CompoundFileReader& operator=(const CompoundFileReader&) = delete;

    /**
     * @brief 解析并返回根节点（type == Root）
     * @throws FormatException 文件头或扇区链不合法
     */
    Entry read();

    uint16_t getMajorVersion() const { return major_version_; }
    size_t getSectorSize() const { return sector_size_; }

private:
    struct RawDirectoryEntry {
        std::string name;
        EntryType type = EntryType::Empty;
        uint32_t left = NOSTREAM;
        uint32_t right = NOSTREAM;
        uint32_t child = NOSTREAM;
        ClassId clsid{};
        uint32_t state_bits = 0;
        uint64_t created = 0;
        uint64_t modified = 0;
        SectorId start = ENDOFCHAIN;
        uint64_t size = 0;
    };

    void parseHeader();
    void loadFat();
    void loadDirectory();
    void loadMiniStream();

    std::vector<SectorId> followChain(SectorId start, const std::vector<SectorId>& table,
                                      size_t limit, const char* what) const;
    const uint8_t* sectorData(SectorId id) const;
    std::vector<uint8_t> readChain(const std::vector<SectorId>& chain, uint64_t size) const;
    std::vector<uint8_t> readStream(const RawDirectoryEntry& entry) const;

    void buildChildren(uint32_t node, Entry& parent, std::unordered_set<uint32_t>& visited, int depth) const;

    const std::vector<uint8_t>& bytes_;

    uint16_t major_version_ = 3;
    size_t sector_size_ = 512;
    size_t sector_count_ = 0;
    ClassId header_clsid_{};

    uint32_t num_fat_sectors_ = 0;
    SectorId first_dir_sector_ = ENDOFCHAIN;
    uint32_t mini_stream_cutoff_ = kMiniStreamCutoff;
    SectorId first_minifat_sector_ = ENDOFCHAIN;
    uint32_t num_minifat_sectors_ = 0;
    SectorId first_difat_sector_ = ENDOFCHAIN;
    uint32_t num_difat_sectors_ = 0;
    std::vector<SectorId> header_difat_;

    std::vector<SectorId> fat_;
    std::vector<SectorId> minifat_;
    std::vector<uint8_t> mini_stream_;
    std::vector<RawDirectoryEntry> directory_;
};

} // namespace cfb
} // namespace fastxls
