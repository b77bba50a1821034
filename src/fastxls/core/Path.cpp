#include "fastxls/core/Path.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#include <utf8.h>
#endif

namespace fastxls {
namespace core {

Path::Path(const std::string& path) : utf8_path_(path) {}

Path::Path(const char* path) : utf8_path_(path ? path : "") {}

#ifdef _WIN32
std::wstring Path::getWidePath() const {
    if (utf8_path_.empty()) return std::wstring();

    try {
        std::wstring result;
        utf8::utf8to16(utf8_path_.begin(), utf8_path_.end(), std::back_inserter(result));
        return result;
    } catch (const utf8::exception& e) {
        // 非法UTF-8时退回系统API
        UTILS_DEBUG("utf8cpp conversion failed for '{}': {}", utf8_path_, e.what());
        int size_needed = MultiByteToWideChar(CP_UTF8, 0, utf8_path_.c_str(), -1, NULL, 0);
        if (size_needed == 0) return std::wstring();

        std::wstring result(size_needed - 1, 0);
        MultiByteToWideChar(CP_UTF8, 0, utf8_path_.c_str(), -1, &result[0], size_needed);
        return result;
    }
}
#endif

bool Path::exists() const {
    if (utf8_path_.empty()) return false;
#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    return GetFileAttributesW(wide_path.c_str()) != INVALID_FILE_ATTRIBUTES;
#else
    std::error_code ec;
    return std::filesystem::exists(utf8_path_, ec);
#endif
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;
#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    DWORD attributes = GetFileAttributesW(wide_path.c_str());
    return (attributes != INVALID_FILE_ATTRIBUTES && !(attributes & FILE_ATTRIBUTE_DIRECTORY));
#else
    std::error_code ec;
    return std::filesystem::is_regular_file(utf8_path_, ec);
#endif
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;

    std::error_code ec;
#ifdef _WIN32
    auto size = std::filesystem::file_size(std::filesystem::path(getWidePath()), ec);
#else
    auto size = std::filesystem::file_size(utf8_path_, ec);
#endif
    if (ec) {
        UTILS_DEBUG("Filesystem error getting file size '{}': {}", utf8_path_, ec.message());
        return 0;
    }
    return size;
}

bool Path::remove() const {
    if (utf8_path_.empty()) return false;
#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    return DeleteFileW(wide_path.c_str()) != 0;
#else
    std::error_code ec;
    bool removed = std::filesystem::remove(utf8_path_, ec);
    if (ec) {
        UTILS_DEBUG("Filesystem error removing file '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return removed;
#endif
}

bool Path::resize(uintmax_t new_size) const {
    if (utf8_path_.empty()) return false;

    std::error_code ec;
#ifdef _WIN32
    std::filesystem::resize_file(std::filesystem::path(getWidePath()), new_size, ec);
#else
    std::filesystem::resize_file(utf8_path_, new_size, ec);
#endif
    if (ec) {
        UTILS_ERROR("Failed to resize '{}' to {} bytes: {}", utf8_path_, new_size, ec.message());
        return false;
    }
    return true;
}

FILE* Path::openForRead(bool binary) const {
    if (utf8_path_.empty()) return nullptr;
#ifdef _WIN32
    FILE* file = nullptr;
    errno_t err = _wfopen_s(&file, getWidePath().c_str(), binary ? L"rb" : L"r");
    return (err == 0) ? file : nullptr;
#else
    return std::fopen(utf8_path_.c_str(), binary ? "rb" : "r");
#endif
}

FILE* Path::openForWrite(bool binary) const {
    if (utf8_path_.empty()) return nullptr;
#ifdef _WIN32
    FILE* file = nullptr;
    errno_t err = _wfopen_s(&file, getWidePath().c_str(), binary ? L"wb" : L"w");
    return (err == 0) ? file : nullptr;
#else
    return std::fopen(utf8_path_.c_str(), binary ? "wb" : "w");
#endif
}

FILE* Path::openForUpdate() const {
    if (utf8_path_.empty()) return nullptr;
#ifdef _WIN32
    FILE* file = nullptr;
    errno_t err = _wfopen_s(&file, getWidePath().c_str(), L"r+b");
    return (err == 0) ? file : nullptr;
#else
    return std::fopen(utf8_path_.c_str(), "r+b");
#endif
}

} // namespace core
} // namespace fastxls
