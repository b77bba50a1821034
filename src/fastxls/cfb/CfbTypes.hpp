#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace fastxls {
namespace cfb {

/**
 * @file CfbTypes.hpp
 * @brief OLE2 复合文档（Compound File Binary）公共类型与常量
 */

using ClassId = std::array<uint8_t, 16>;
using SectorId = uint32_t;

// 特殊扇区编号
constexpr SectorId FREESECT   = 0xFFFFFFFF;
constexpr SectorId ENDOFCHAIN = 0xFFFFFFFE;
constexpr SectorId FATSECT    = 0xFFFFFFFD;
constexpr SectorId DIFSECT    = 0xFFFFFFFC;
constexpr SectorId MAXREGSECT = 0xFFFFFFFA;
constexpr uint32_t NOSTREAM   = 0xFFFFFFFF;

constexpr std::array<uint8_t, 8> kSignature = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};

constexpr size_t kHeaderSize = 512;
constexpr size_t kHeaderDifatEntries = 109;
constexpr size_t kDirectoryEntrySize = 128;
constexpr size_t kMiniSectorSize = 64;
constexpr uint32_t kMiniStreamCutoff = 4096;
constexpr size_t kMaxEntryNameLength = 31;   // UTF-16 码元数，不含结尾 0
constexpr uint16_t kByteOrderMark = 0xFFFE;

enum class EntryType : uint8_t {
    Empty = 0,
    Storage = 1,
    Stream = 2,
    Root = 5
};

/**
 * @brief 文档数据来源，决定是否支持原地提交
 */
enum class SourceKind {
    Created,        // create() 新建
    Buffer,         // 字节缓冲区/流
    ReadOnlyFile,   // 只读文件
    ReadWriteFile   // 可随机写的文件
};

/**
 * @brief 新建复合文档的配置
 */
struct ContainerOptions {
    uint16_t major_version = 3;   // 3: 512 字节扇区，4: 4096 字节扇区
};

/**
 * @brief 目录树节点（存储或流），流内容全部加载到内存
 */
struct Entry {
    std::string name;
    EntryType type = EntryType::Stream;
    ClassId clsid{};
    uint32_t state_bits = 0;
    uint64_t created = 0;
    uint64_t modified = 0;
    std::vector<uint8_t> data;     // 仅流有效
    std::vector<Entry> children;   // 仅存储/根有效

    bool isStorage() const { return type == EntryType::Storage || type == EntryType::Root; }
};

/**
 * @brief listEntries() 返回的条目描述
 */
struct EntryInfo {
    std::string path;   // 以 '/' 分隔的完整路径
    EntryType type;
    uint64_t size;
};

inline size_t sectorSizeForVersion(uint16_t major_version) {
    return major_version == 4 ? 4096 : 512;
}

/**
 * @brief 复合文档目录项名称排序规则：先比 UTF-16 长度，再逐字符比较大写形式
 */
inline int compareEntryNames(const std::u16string& a, const std::u16string& b) {
    if (a.size() != b.size()) {
        return a.size() < b.size() ? -1 : 1;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        char16_t ca = (a[i] >= u'a' && a[i] <= u'z') ? static_cast<char16_t>(a[i] - 32) : a[i];
        char16_t cb = (b[i] >= u'a' && b[i] <= u'z') ? static_cast<char16_t>(b[i] - 32) : b[i];
        if (ca != cb) {
            return ca < cb ? -1 : 1;
        }
    }
    return 0;
}

} // namespace cfb
} // namespace fastxls
