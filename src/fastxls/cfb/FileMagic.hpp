#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fastxls {
namespace cfb {

/**
 * @brief 根据文件头部字节识别的格式
 */
enum class FileMagic {
    OLE2,        // 复合文档
    OLE2_BETA,   // 早期测试版复合文档签名
    OOXML,       // ZIP 包（xlsx）
    BIFF2,       // 裸 BIFF2 记录流
    BIFF3,
    BIFF4,
    BIFF5_RAW,   // 未放入复合文档的 BIFF5 流
    BIFF8_RAW,   // 未放入复合文档的 BIFF8 流
    XML,
    UNKNOWN
};

FileMagic detectFileMagic(const uint8_t* data, size_t size);

inline FileMagic detectFileMagic(const std::vector<uint8_t>& data) {
    return detectFileMagic(data.data(), data.size());
}

/**
 * @brief 格式的可读名称，用于错误信息
 */
const char* toString(FileMagic magic);

/**
 * @brief 旧版 BIFF 记录流对应的代际名称（BIFF2 ~ BIFF5），其他格式返回 nullptr
 */
const char* oldBiffGeneration(FileMagic magic);

} // namespace cfb
} // namespace fastxls
