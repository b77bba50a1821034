#pragma once

#include "fastxls/cfb/CfbTypes.hpp"
#include "fastxls/core/Path.hpp"
#include "fastxls/core/WorkbookTypes.hpp"
#include "fastxls/utils/FileWrapper.hpp"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace fastxls {
namespace cfb {

/**
 * @brief 复合文档 - 组合 CompoundFileReader 和 CompoundFileWriter 提供完整功能
 *
 * 打开时全部流读入内存，修改只作用于内存中的目录树；
 * writeTo() 整体重写到新目标，commit() 重新布局后原地覆盖读写打开的源文件。
 * 未被替换的流（嵌入对象、类标识等）逐字节保留。
 */
class CompoundFile {
public:
    /**
     * @brief 从字节缓冲区打开（只读语义，不支持 commit）
     * @throws FormatException 签名或扇区链不合法
     */
    static std::unique_ptr<CompoundFile> open(std::vector<uint8_t> bytes);

    /**
     * @brief 从文件打开；ReadWrite 模式保留可写句柄用于 commit()
     * @throws FileException 文件无法打开
     * @throws FormatException 签名或扇区链不合法（句柄随之释放）
     */
    static std::unique_ptr<CompoundFile> open(const core::Path& path, core::OpenMode mode);

    /**
     * @brief 新建只含根目录项的空文档
     */
    static std::unique_ptr<CompoundFile> create(const ContainerOptions& options = {});

    ~CompoundFile();

    CompoundFile(const CompoundFile&) = delete;
    CompoundFile& operator=(const CompoundFile&) = delete;

    // 流操作（路径以 '/' 分隔，名称大小写不敏感）

    bool hasStream(const std::string& name) const;

    /**
     * @throws ParameterException 流不存在
     */
    std::vector<uint8_t> getStream(const std::string& name) const;

    /**
     * @brief 替换流内容；不存在时在对应存储下创建
     */
    void replaceStream(const std::string& name, std::vector<uint8_t> data);

    /**
     * @brief 删除流或存储
     * @return 是否存在并已删除
     */
    bool removeEntry(const std::string& name);

    std::vector<EntryInfo> listEntries() const;

    const ClassId& getRootClassId() const { return root_.clsid; }
    void setRootClassId(const ClassId& clsid) { root_.clsid = clsid; }

    uint16_t getMajorVersion() const { return major_version_; }
    SourceKind getSourceKind() const { return source_; }
    bool supportsInPlaceWrite() const { return source_ == SourceKind::ReadWriteFile && file_; }
    bool isOpen() const { return open_; }

    /**
     * @brief 序列化为完整的复合文档字节
     */
    std::vector<uint8_t> toBytes() const;

    void writeTo(std::ostream& out) const;
    void writeTo(const core::Path& path) const;

    /**
     * @brief 原地写回读写打开的源文件
     * @throws InvalidStateException 来源是缓冲区、只读文件或新建文档
     */
    void commit();

    /**
     * @brief 释放文件句柄，不写入任何内容
     */
    void close();

private:
    CompoundFile(Entry root, uint16_t major_version, SourceKind source);

    const Entry* findEntry(const std::string& name) const;
    Entry* findEntry(const std::string& name);

    Entry root_;
    uint16_t major_version_;
    SourceKind source_;
    core::Path path_;
    utils::FileWrapper file_;
    bool open_ = true;
};

} // namespace cfb
} // namespace fastxls
