#pragma once

#include <cstdint>
#include <cstdio>
#include <ostream>
#include <string>

namespace fastxls {
namespace core {

/**
 * @brief UTF-8路径处理类，封装跨平台文件路径操作
 *
 * 在Windows下借助utf8cpp将UTF-8转换为UTF-16后调用宽字符API，
 * 在其他平台直接使用UTF-8
 */
class Path {
private:
    std::string utf8_path_;

public:
    explicit Path(const std::string& path);
    explicit Path(const char* path);
    Path() = default;

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    // 文件操作
    bool exists() const;
    bool isFile() const;

    /**
     * @brief 获取文件大小
     * @return 文件大小（字节），失败返回0
     */
    uintmax_t fileSize() const;

    /**
     * @brief 删除文件
     * @return 是否删除成功
     */
    bool remove() const;

    /**
     * @brief 将文件截断或扩展到指定长度
     * @return 是否成功
     */
    bool resize(uintmax_t new_size) const;

    // 文件流操作（失败返回nullptr）
    FILE* openForRead(bool binary = true) const;
    FILE* openForWrite(bool binary = true) const;

    /**
     * @brief 以读写方式打开已有文件（"r+b"），用于原地写回
     */
    FILE* openForUpdate() const;

#ifdef _WIN32
    /**
     * @brief 获取Windows宽字符路径
     */
    std::wstring getWidePath() const;
#endif

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

} // namespace core
} // namespace fastxls
