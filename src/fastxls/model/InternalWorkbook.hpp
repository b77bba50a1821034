#pragma once

#include "fastxls/core/WorkbookTypes.hpp"
#include "fastxls/formula/FormulaText.hpp"
#include "fastxls/model/LinkTable.hpp"
#include "fastxls/model/NameTable.hpp"
#include "fastxls/model/SelectionState.hpp"
#include "fastxls/model/SheetBlock.hpp"
#include "fastxls/model/XFTable.hpp"
#include "fastxls/record/Record.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fastxls {
namespace model {

class PictureStore;

/**
 * @brief 工作簿结构模型
 *
 * 独占工作表列表、选中/活动状态、外部引用表、定义名称表和样式表，
 * 在新建、克隆、排序、重命名、删除工作表时保持它们相互一致。
 * 保存时由模型重新生成完整的记录流；记录流加载后不再是数据来源。
 *
 * 所有操作同步执行，违反约束时立即抛出异常且不留下部分修改。
 */
class InternalWorkbook : public formula::FormulaContext {
public:
    /**
     * @brief 新建工作簿：全局子流含 21 个内置 XF、WINDOW1，没有工作表
     */
    static std::unique_ptr<InternalWorkbook> createEmpty(const core::WorkbookOptions& options);

    /**
     * @brief 从解码后的记录流构建模型
     * @throws OldFormatException 全局子流不是 BIFF8
     * @throws FormatException 记录流结构不合法
     */
    static std::unique_ptr<InternalWorkbook> load(std::vector<record::Record> records,
                                                  const core::WorkbookOptions& options);

    ~InternalWorkbook() override;

    InternalWorkbook(const InternalWorkbook&) = delete;
    InternalWorkbook& operator=(const InternalWorkbook&) = delete;

    /**
     * @brief 生成完整的工作簿流
     *
     * 先按声明长度预先计算每个工作表子流的大小（也用于 BOUNDSHEET 中的位置），
     * 写出时实际长度与预计算不符即抛出 SizeMismatchException，不产生任何输出。
     */
    std::vector<uint8_t> serialize();

    // ========== 工作表 ==========

    size_t getNumSheets() const { return sheets_.size(); }

    /**
     * @throws WorksheetException 名称不合法或已存在
     */
    Sheet& createSheet(const std::string& name);

    /**
     * @brief 复制工作表追加到末尾，名称为 "<原名> (k)"；共享图片只增加引用计数
     */
    Sheet& cloneSheet(size_t index);

    void removeSheetAt(size_t index);

    /**
     * @brief 把名为 name 的工作表移到 position
     * @throws ParameterException 工作表不存在或位置越界
     */
    void setSheetOrder(const std::string& name, size_t position);

    void setSheetName(size_t index, const std::string& name);

    Sheet& getSheetAt(size_t index);
    const Sheet& getSheetAt(size_t index) const;

    /**
     * @return 工作表序号，不存在时返回 -1
     */
    int getSheetIndex(const std::string& name) const;
    int getSheetIndex(SheetId id) const;

    // ========== 选中与活动 ==========

    void setActiveSheet(size_t index);

    /**
     * @return 没有工作表时返回 -1
     */
    int getActiveSheetIndex() const;

    void setSelectedTab(size_t index);
    void setSelectedTabs(const std::vector<size_t>& indices);
    std::vector<size_t> getSelectedTabs() const;
    bool isSheetSelected(size_t index) const;
    bool isSheetActive(size_t index) const;

    void setFirstVisibleTab(size_t index);
    size_t getFirstVisibleTab() const { return selection_.firstVisibleTab(); }

    // ========== 定义名称 ==========

    size_t getNumberOfNames() const { return names_.size(); }

    DefinedName& createName();

    /**
     * @throws InvalidStateException 没有定义名称
     * @throws ParameterException 索引越界
     */
    DefinedName& getNameAt(size_t index);

    DefinedName* findName(NameId id);
    const DefinedName* findName(NameId id) const;

    /**
     * @return 第一个匹配的名称索引，不存在时返回 -1
     */
    int getNameIndex(const std::string& text) const { return names_.indexOf(text); }
    int getNameIndex(NameId id) const { return names_.indexOfId(id); }

    void removeName(size_t index);

    /**
     * @throws ParameterException 名称不合法或在同一作用域内重复
     */
    void setNameText(NameId id, const std::string& text);

    /**
     * @param sheet_index 工作表序号，-1 表示工作簿级
     */
    void setNameScope(NameId id, int sheet_index);
    int getNameScope(NameId id) const;

    /**
     * @throws FormulaException 引用文本无法解析
     */
    void setNameFormula(NameId id, const std::string& text);
    std::string getNameFormula(NameId id) const;

    // ========== 单元格公式 ==========

    formula::Formula parseFormula(const std::string& text, formula::FormulaType type);
    std::string renderFormula(const formula::Formula& formula) const;

    // ========== 样式与图片 ==========

    /**
     * @brief 追加一个默认单元格样式
     * @return 新样式索引；样式表已满时返回 CapacityExceeded 错误
     */
    core::Result<int> tryAddCellStyle();
    size_t getNumCellStyles() const { return xfs_.size(); }

    size_t getNumPictures();
    uint32_t getPictureRefCount(uint32_t pib);

    // ========== 工作簿属性 ==========

    bool isHidden() const { return window1_.isHidden(); }
    void setHidden(bool hidden) { window1_.setHidden(hidden); }

    void writeProtect(const std::string& password, const std::string& user_name);
    void unwriteProtect();
    bool isWriteProtected() const;

    // ========== FormulaContext ==========

    std::optional<std::string> sheetNameForExternIndex(uint16_t extern_index) const override;
    int externIndexForSheet(const std::string& sheet_name) override;
    std::string nameText(uint16_t index) const override;
    uint16_t nameIndexForText(const std::string& text) const override;

private:
    /// 全局子流中由模型生成的部分
    enum class GlobalsSlot {
        BoundSheets,
        LinkTable,
        Names,
        XFs,
        Window1
    };

    using GlobalsItem = std::variant<record::Record, GlobalsSlot>;

    explicit InternalWorkbook(const core::WorkbookOptions& options);

    void loadGlobals(std::vector<record::Record> globals, std::vector<record::BoundSheetRecord>& bound_sheets,
                     std::vector<record::Record>& link_records, std::vector<record::NameRecord>& name_records);

    void validateSheetIndex(size_t index) const;
    void validateSheetName(const std::string& name, int except_index) const;
    std::string uniqueSheetName(const std::string& source_name) const;
    std::vector<SheetId> sheetOrder() const;

    bool hasSlot(GlobalsSlot slot) const;
    void ensureSlot(GlobalsSlot slot);
    size_t findGlobal(uint16_t sid) const;

    PictureStore pictureStore();

    void degradeDeletedReferences();
    void applySelectionToRecords();
    std::vector<record::Record> emitGlobals() const;

    core::WorkbookOptions options_;
    std::vector<GlobalsItem> globals_;
    std::vector<Sheet> sheets_;
    SheetId next_sheet_id_ = 1;
    record::Window1Record window1_;
    LinkTable link_table_;
    NameTable names_;
    XFTable xfs_;
    SelectionState selection_;
};

} // namespace model
} // namespace fastxls
