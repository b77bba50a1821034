#pragma once

#include "fastxls/cfb/CfbTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace fastxls {
namespace cfb {

/**
 * @brief 复合文档序列化器
 *
 * 每次都从 Entry 树重新布局全部扇区：普通流 → 迷你流容器 → 目录 →
 * 迷你 FAT → FAT → DIFAT。同级目录项按名称规则构建平衡二叉树，
 * 未填满的最深一层着红色，其余为黑色。
 */
class CompoundFileWriter {
public:
    explicit CompoundFileWriter(uint16_t major_version = 3);

    /**
     * @brief 序列化整棵目录树
     * @throws ParameterException 目录项名称过长或同级重名
     */
    std::vector<uint8_t> write(const Entry& root);

private:
    struct FlatEntry {
        const Entry* entry = nullptr;
        std::u16string name;
        uint32_t left = NOSTREAM;
        uint32_t right = NOSTREAM;
        uint32_t child = NOSTREAM;
        SectorId start = ENDOFCHAIN;
        uint64_t size = 0;
        bool red = false;
    };

    void flatten(uint32_t parent_index);
    uint32_t buildSiblingTree(const std::vector<uint32_t>& sorted, size_t begin, size_t end,
                              size_t depth, size_t red_depth);
    void layoutMiniStream();
    SectorId allocate(size_t count);
    void writeHeader(std::vector<uint8_t>& out, size_t num_dir_sectors, size_t num_minifat_sectors,
                     SectorId first_dir, SectorId first_minifat, SectorId first_difat);
    void writeDirectoryEntry(uint8_t* p, const FlatEntry& flat) const;
    uint8_t* sectorPtr(std::vector<uint8_t>& out, SectorId id) const;

    uint16_t major_version_;
    size_t sector_size_;

    std::vector<FlatEntry> flat_;
    std::vector<uint8_t> mini_stream_;
    std::vector<SectorId> minifat_;
    std::vector<SectorId> fat_;
    std::vector<SectorId> fat_sectors_;
    std::vector<SectorId> difat_sectors_;
    SectorId next_free_ = 0;
};

} // namespace cfb
} // namespace fastxls
