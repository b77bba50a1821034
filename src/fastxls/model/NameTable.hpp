#pragma once

#include "fastxls/model/SheetBlock.hpp"
#include "fastxls/record/Records.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fastxls {
namespace model {

/// 定义名称的稳定标识，删除其他名称时不变
using NameId = uint32_t;

/**
 * @brief 定义名称条目
 */
struct DefinedName {
    NameId id = 0;
    record::NameRecord record;      ///< 名称文本、选项和引用定义
    std::optional<SheetId> scope;   ///< 所属工作表，空表示工作簿级
};

/**
 * @brief 定义名称表
 *
 * 封装定义名称的增删查逻辑。名称在 NAME 记录中的顺序决定公式里名称记号的
 * 索引（从 1 开始），因此删除名称时由 InternalWorkbook 负责修正公式。
 */
class NameTable {
public:
    NameTable() = default;

    // 禁用拷贝，允许移动
    NameTable(const NameTable&) = delete;
    NameTable& operator=(const NameTable&) = delete;
    NameTable(NameTable&&) = default;
    NameTable& operator=(NameTable&&) = default;

    size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }

    /**
     * @throws InvalidStateException 没有任何定义名称
     * @throws ParameterException 索引越界
     */
    DefinedName& at(size_t index);
    const DefinedName& at(size_t index) const;

    DefinedName* findById(NameId id);
    const DefinedName* findById(NameId id) const;

    /**
     * @brief 名称表中的位置，不存在时返回 -1
     */
    int indexOfId(NameId id) const;

    /**
     * @brief 按名称文本查找（大小写不敏感，不区分作用域），返回第一个匹配的索引或 -1
     */
    int indexOf(const std::string& text) const;

    /**
     * @brief 同一作用域内是否已有该名称（大小写不敏感）
     */
    bool contains(const std::string& text, std::optional<SheetId> scope, NameId except = 0) const;

    /**
     * @brief 追加新名称（空文本、工作簿级）
     */
    DefinedName& add();

    /**
     * @brief 追加已加载或复制的名称记录
     */
    DefinedName& add(record::NameRecord record, std::optional<SheetId> scope);

    void removeAt(size_t index);

    std::vector<DefinedName>& entries() { return names_; }
    const std::vector<DefinedName>& entries() const { return names_; }

    /**
     * @brief 名称显示文本；内置名称返回其内置名（如 Print_Area）
     */
    static std::string displayText(const record::NameRecord& record);

    /**
     * @brief 检查名称文本是否合法
     */
    static bool isValidName(const std::string& name);

private:
    void checkIndex(size_t index) const;

    std::vector<DefinedName> names_;
    NameId next_id_ = 1;
};

} // namespace model
} // namespace fastxls
