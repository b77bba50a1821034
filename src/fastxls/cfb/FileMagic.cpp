#include "fastxls/cfb/FileMagic.hpp"
#include "fastxls/cfb/CfbTypes.hpp"

#include <algorithm>
#include <cstring>

namespace fastxls {
namespace cfb {

namespace {

constexpr uint8_t kOle2BetaSignature[8] = {0x0E, 0x11, 0xFC, 0x0D, 0xD0, 0xCF, 0x11, 0x0E};
constexpr uint8_t kZipSignature[4] = {0x50, 0x4B, 0x03, 0x04};

// 各代 BOF 记录的 sid
constexpr uint16_t kBof2 = 0x0009;
constexpr uint16_t kBof3 = 0x0209;
constexpr uint16_t kBof4 = 0x0409;
constexpr uint16_t kBof8 = 0x0809;

} // namespace

FileMagic detectFileMagic(const uint8_t* data, size_t size) {
    if (data == nullptr || size < 4) {
        return FileMagic::UNKNOWN;
    }

    if (size >= kSignature.size() && std::equal(kSignature.begin(), kSignature.end(), data)) {
        return FileMagic::OLE2;
    }
    if (size >= sizeof(kOle2BetaSignature) && std::memcmp(data, kOle2BetaSignature, sizeof(kOle2BetaSignature)) == 0) {
        return FileMagic::OLE2_BETA;
    }
    if (std::memcmp(data, kZipSignature, sizeof(kZipSignature)) == 0) {
        return FileMagic::OOXML;
    }

    const uint16_t sid = static_cast<uint16_t>(data[0] | (data[1] << 8));
    switch (sid) {
        case kBof2: return FileMagic::BIFF2;
        case kBof3: return FileMagic::BIFF3;
        case kBof4: return FileMagic::BIFF4;
        case kBof8:
            if (size >= 6) {
                const uint16_t version = static_cast<uint16_t>(data[4] | (data[5] << 8));
                return version == 0x0600 ? FileMagic::BIFF8_RAW : FileMagic::BIFF5_RAW;
            }
            return FileMagic::BIFF5_RAW;
        default:
            break;
    }

    // 跳过 UTF-8 BOM 与空白后以 '<' 开头
    size_t pos = 0;
    if (size >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
        pos = 3;
    }
    while (pos < size && (data[pos] == ' ' || data[pos] == '\t' || data[pos] == '\r' || data[pos] == '\n')) {
        ++pos;
    }
    if (pos < size && data[pos] == '<') {
        return FileMagic::XML;
    }
    return FileMagic::UNKNOWN;
}

const char* toString(FileMagic magic) {
    switch (magic) {
        case FileMagic::OLE2:      return "OLE2 compound document";
        case FileMagic::OLE2_BETA: return "OLE2 beta compound document";
        case FileMagic::OOXML:     return "Office Open XML (zip) package";
        case FileMagic::BIFF2:     return "raw BIFF2 stream";
        case FileMagic::BIFF3:     return "raw BIFF3 stream";
        case FileMagic::BIFF4:     return "raw BIFF4 stream";
        case FileMagic::BIFF5_RAW: return "raw BIFF5 stream";
        case FileMagic::BIFF8_RAW: return "raw BIFF8 stream";
        case FileMagic::XML:       return "XML/HTML document";
        case FileMagic::UNKNOWN:   return "unknown format";
    }
    return "unknown format";
}

const char* oldBiffGeneration(FileMagic magic) {
    switch (magic) {
        case FileMagic::BIFF2:     return "BIFF2";
        case FileMagic::BIFF3:     return "BIFF3";
        case FileMagic::BIFF4:     return "BIFF4";
        case FileMagic::BIFF5_RAW: return "BIFF5";
        default:                   return nullptr;
    }
}

} // namespace cfb
} // namespace fastxls
