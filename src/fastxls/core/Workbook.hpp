#pragma once

#include "fastxls/core/Path.hpp"
#include "fastxls/core/WorkbookTypes.hpp"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace fastxls {

namespace cfb {
class CompoundFile;
}

namespace model {
class InternalWorkbook;
}

namespace core {

class Worksheet;
class Name;

/**
 * @brief Workbook类 - BIFF8 工作簿（.xls）
 *
 * 持有复合文档容器和工作簿结构模型。打开时从容器中取出 Workbook 流并解码为模型，
 * 保存时由模型重新生成记录流，校验每条记录的声明长度后写回容器。
 *
 * 核心特性：
 * - 工作表管理：新建、克隆、排序、重命名、删除，引用与选中状态随之保持一致
 * - 定义名称：工作簿级与工作表级名称，引用文本解析与生成
 * - 容器保真：其他流（嵌入对象、摘要信息）和根类标识原样保留
 * - 两种保存方式：整体重写到新目标，或对读写打开的文件原地写回
 *
 * Worksheet 和 Name 句柄只保存稳定标识，工作簿关闭后再使用会抛出 InvalidStateException。
 */
class Workbook {
public:
    /**
     * @brief 新建内存工作簿（21 个内置样式，没有工作表）
     */
    static std::unique_ptr<Workbook> create(const WorkbookOptions& options = {});

    /**
     * @brief 从内存中的复合文档打开
     * @throws OldFormatException BIFF2 ~ BIFF5 文档
     * @throws FormatException 不是复合文档或结构损坏
     * @throws ParameterException 容器中没有 Workbook 流
     */
    static std::unique_ptr<Workbook> open(std::vector<uint8_t> bytes, const WorkbookOptions& options = {});
    static std::unique_ptr<Workbook> open(std::istream& in, const WorkbookOptions& options = {});

    /**
     * @brief 从文件打开；ReadWrite 模式保留文件句柄，支持 writeInPlace()
     */
    static std::unique_ptr<Workbook> open(const Path& path, OpenMode mode = OpenMode::ReadOnly,
                                          const WorkbookOptions& options = {});

    ~Workbook();

    // 禁用拷贝构造和赋值
    Workbook(const Workbook&) = delete;
    Workbook& operator=(const Workbook&) = delete;

    // ========== 保存 ==========

    /**
     * @brief 整体重写到输出流
     * @throws SizeMismatchException 记录声明长度与实际长度不一致，此时不写出任何字节
     */
    void write(std::ostream& out);
    void write(const Path& path);
    std::vector<uint8_t> getBytes();

    /**
     * @brief 原地写回打开时的文件
     * @throws InvalidStateException 工作簿不是以 ReadWrite 模式从文件打开
     */
    void writeInPlace();

    /**
     * @brief 释放文件句柄和模型，不写出任何内容
     */
    void close();

    bool isOpen() const { return model_ != nullptr; }
    WorkbookSource getSource() const { return source_; }
    const WorkbookOptions& getOptions() const { return options_; }

    // ========== 工作表 ==========

    size_t getNumberOfSheets() const;

    /**
     * @brief 以 "<前缀><n>" 命名新建工作表
     */
    std::shared_ptr<Worksheet> createSheet();

    /**
     * @throws WorksheetException 名称不合法或已存在
     */
    std::shared_ptr<Worksheet> createSheet(const std::string& name);

    /**
     * @brief 克隆工作表并追加到末尾，新表不活动也不选中
     */
    std::shared_ptr<Worksheet> cloneSheet(size_t index);

    std::shared_ptr<Worksheet> getSheetAt(size_t index);

    /**
     * @return 不存在时返回 nullptr
     */
    std::shared_ptr<Worksheet> getSheet(const std::string& name);

    int getSheetIndex(const std::string& name) const;
    int getSheetIndex(const Worksheet& sheet) const;
    std::string getSheetName(size_t index) const;

    void setSheetName(size_t index, const std::string& name);
    void setSheetOrder(const std::string& name, size_t position);

    void removeSheetAt(size_t index);

    /**
     * @brief 批量删除，按序号从大到小逐个删除
     */
    void removeSheetsAt(std::vector<size_t> indices);

    // ========== 选中与活动 ==========

    void setActiveSheet(size_t index);
    int getActiveSheetIndex() const;

    /**
     * @brief 只选中 index 指向的工作表
     */
    void setSelectedTab(size_t index);

    /**
     * @brief 用给定集合替换当前选中的工作表
     */
    void setSelectedTabs(const std::vector<size_t>& indices);
    std::vector<size_t> getSelectedTabs() const;

    void setFirstVisibleTab(size_t index);
    size_t getFirstVisibleTab() const;

    // ========== 定义名称 ==========

    size_t getNumberOfNames() const;
    std::shared_ptr<Name> createName();

    /**
     * @return 第一个匹配的名称，不存在时返回 nullptr
     */
    std::shared_ptr<Name> getName(const std::string& name);

    /**
     * @throws InvalidStateException 工作簿中没有定义名称
     * @throws ParameterException 索引越界
     */
    std::shared_ptr<Name> getNameAt(size_t index);

    int getNameIndex(const std::string& name) const;
    int getNameIndex(const Name& name) const;

    void removeName(size_t index);
    void removeName(const std::string& name);
    void removeName(const Name& name);

    // ========== 样式 ==========

    /**
     * @brief 追加单元格样式
     * @return 新样式的索引
     * @throws CapacityExceededException 样式表已满，样式表保持不变
     */
    int createCellStyle();
    size_t getNumCellStyles() const;

    // ========== 图片 ==========

    size_t getNumberOfPictures();

    /**
     * @param pib 图片序号，从 1 开始
     */
    uint32_t getPictureReferenceCount(uint32_t pib);

    // ========== 工作簿属性 ==========

    bool isHidden() const;
    void setHidden(bool hidden);

    /**
     * @brief 设置写保护：下次打开时要求密码才能修改
     */
    void writeProtectWorkbook(const std::string& password, const std::string& user_name);
    void unwriteProtectWorkbook();
    bool isWriteProtected() const;

    /**
     * @brief 底层结构模型，供外部协作者（图表等）访问记录
     */
    model::InternalWorkbook& getInternalWorkbook();

private:
    Workbook(std::unique_ptr<cfb::CompoundFile> container, std::shared_ptr<model::InternalWorkbook> model,
             WorkbookSource source, const WorkbookOptions& options);

    static std::unique_ptr<Workbook> load(std::unique_ptr<cfb::CompoundFile> container, WorkbookSource source,
                                          const WorkbookOptions& options);

    model::InternalWorkbook& model() const;
    std::shared_ptr<Worksheet> sheetHandle(size_t index);
    void storeWorkbookStream();

    std::unique_ptr<cfb::CompoundFile> container_;
    std::shared_ptr<model::InternalWorkbook> model_;
    WorkbookSource source_ = WorkbookSource::NEW_WORKBOOK;
    WorkbookOptions options_;
};

} // namespace core
} // namespace fastxls
