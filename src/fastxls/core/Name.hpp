#pragma once

#include "fastxls/model/NameTable.hpp"

#include <memory>
#include <string>

namespace fastxls {

namespace model {
class InternalWorkbook;
}

namespace core {

/**
 * @brief 定义名称句柄
 *
 * 删除其他名称后句柄仍指向同一个名称；名称本身被删除后操作抛出 InvalidStateException。
 */
class Name {
public:
    Name(std::weak_ptr<model::InternalWorkbook> workbook, model::NameId id);

    model::NameId getNameId() const { return id_; }

    std::string getNameName() const;

    /**
     * @throws ParameterException 名称不合法或在同一作用域内已存在
     */
    void setNameName(const std::string& name);

    /**
     * @return 所属工作表序号，工作簿级名称返回 -1
     */
    int getSheetIndex() const;

    /**
     * @param index 工作表序号，-1 表示工作簿级
     */
    void setSheetIndex(int index);

    /**
     * @return 所属工作表名称，工作簿级名称返回空字符串
     */
    std::string getSheetName() const;

    /**
     * @brief 设置引用，例如 "'first sheet'!$A$3:$A$4"
     * @throws FormulaException 文本无法解析
     */
    void setRefersToFormula(const std::string& formula);
    std::string getRefersToFormula() const;

    bool isBuiltIn() const;
    bool isHidden() const;

    /**
     * @brief 名称是否仍在工作簿中
     */
    bool exists() const;

private:
    model::InternalWorkbook& workbook() const;
    const model::DefinedName& entry() const;

    std::weak_ptr<model::InternalWorkbook> workbook_;
    model::NameId id_;
};

} // namespace core
} // namespace fastxls
