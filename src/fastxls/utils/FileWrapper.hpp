/**
 * @file FileWrapper.hpp
 * @brief RAII文件句柄包装器，提供异常安全的文件管理
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>
#include "fastxls/core/Exception.hpp"
#include "fastxls/core/Path.hpp"

namespace fastxls {
namespace utils {

/**
 * @brief RAII文件句柄包装器
 *
 * 任何退出路径（包括解析中途抛出的 FormatException）都会关闭文件句柄
 */
class FileWrapper {
public:
    enum class Mode {
        Read,    // "rb"
        Write,   // "wb"，截断
        Update   // "r+b"，文件必须存在
    };

    /**
     * @brief 打开文件
     * @throws FileException 文件打开失败时
     */
    FileWrapper(const core::Path& path, Mode mode);

    FileWrapper() = default;
    FileWrapper(FileWrapper&& other) noexcept = default;
    FileWrapper& operator=(FileWrapper&& other) noexcept = default;

    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;

    FILE* get() const noexcept { return file_.get(); }

    explicit operator bool() const noexcept { return file_ != nullptr; }

    const std::string& getFilename() const noexcept { return filename_; }

    /**
     * @brief 从文件开头读取全部内容
     * @throws FileException 读取失败
     */
    std::vector<uint8_t> readAll();

    /**
     * @brief 从文件开头写入全部内容（不截断多余部分）
     * @throws FileException 写入失败
     */
    void writeAll(const std::vector<uint8_t>& data);

    void flush();

    /**
     * @brief 关闭文件句柄；重复调用无副作用
     */
    void close() noexcept { file_.reset(); }

private:
    std::unique_ptr<FILE, int(*)(FILE*)> file_{nullptr, &std::fclose};
    std::string filename_;
};

} // namespace utils
} // namespace fastxls
