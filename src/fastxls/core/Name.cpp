#include "fastxls/core/Name.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/model/InternalWorkbook.hpp"

namespace fastxls {
namespace core {

Name::Name(std::weak_ptr<model::InternalWorkbook> workbook, model::NameId id)
    : workbook_(std::move(workbook)), id_(id) {
}

model::InternalWorkbook& Name::workbook() const {
    std::shared_ptr<model::InternalWorkbook> wb = workbook_.lock();
    if (!wb) {
        FASTXLS_THROW(InvalidStateException, "Workbook owning this name has been closed");
    }
    return *wb;
}

const model::DefinedName& Name::entry() const {
    const model::DefinedName* dn = static_cast<const model::InternalWorkbook&>(workbook()).findName(id_);
    if (!dn) {
        FASTXLS_THROW(InvalidStateException, "Defined name has been removed from the workbook");
    }
    return *dn;
}

std::string Name::getNameName() const {
    return model::NameTable::displayText(entry().record);
}

void Name::setNameName(const std::string& name) {
    workbook().setNameText(id_, name);
}

int Name::getSheetIndex() const {
    entry();
    return workbook().getNameScope(id_);
}

void Name::setSheetIndex(int index) {
    workbook().setNameScope(id_, index);
}

std::string Name::getSheetName() const {
    const int index = getSheetIndex();
    if (index < 0) {
        return {};
    }
    return workbook().getSheetAt(static_cast<size_t>(index)).name;
}

void Name::setRefersToFormula(const std::string& formula) {
    workbook().setNameFormula(id_, formula);
}

std::string Name::getRefersToFormula() const {
    return workbook().getNameFormula(id_);
}

bool Name::isBuiltIn() const {
    return entry().record.isBuiltIn();
}

bool Name::isHidden() const {
    return (entry().record.options & record::NameRecord::kHiddenFlag) != 0;
}

bool Name::exists() const {
    std::shared_ptr<model::InternalWorkbook> wb = workbook_.lock();
    return wb && static_cast<const model::InternalWorkbook&>(*wb).findName(id_) != nullptr;
}

} // namespace core
} // namespace fastxls
