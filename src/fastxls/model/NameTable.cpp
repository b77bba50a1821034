#include "fastxls/model/NameTable.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/formula/CellAddress.hpp"
#include "fastxls/utils/Unicode.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace fastxls {
namespace model {

namespace {

const char* const kBuiltInNames[] = {
    "Consolidate_Area", "Auto_Open", "Auto_Close", "Extract", "Database", "Criteria",
    "Print_Area", "Print_Titles", "Recorder", "Data_Form", "Auto_Activate",
    "Auto_Deactivate", "Sheet_Title", "_FilterDatabase"
};

} // namespace

void NameTable::checkIndex(size_t index) const {
    if (names_.empty()) {
        FASTXLS_THROW(core::InvalidStateException, "There are no defined names in this workbook");
    }
    if (index >= names_.size()) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("Specified name index {} is outside the allowable range (0..{})",
                                  index, names_.size() - 1),
                      "index");
    }
}

DefinedName& NameTable::at(size_t index) {
    checkIndex(index);
    return names_[index];
}

const DefinedName& NameTable::at(size_t index) const {
    checkIndex(index);
    return names_[index];
}

DefinedName* NameTable::findById(NameId id) {
    const int index = indexOfId(id);
    return index < 0 ? nullptr : &names_[static_cast<size_t>(index)];
}

const DefinedName* NameTable::findById(NameId id) const {
    const int index = indexOfId(id);
    return index < 0 ? nullptr : &names_[static_cast<size_t>(index)];
}

int NameTable::indexOfId(NameId id) const {
    for (size_t i = 0; i < names_.size(); ++i) {
        if (names_[i].id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int NameTable::indexOf(const std::string& text) const {
    for (size_t i = 0; i < names_.size(); ++i) {
        if (utils::equalsIgnoreCase(displayText(names_[i].record), text)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool NameTable::contains(const std::string& text, std::optional<SheetId> scope, NameId except) const {
    return std::any_of(names_.begin(), names_.end(), [&](const DefinedName& dn) {
        return dn.id != except && dn.scope == scope && utils::equalsIgnoreCase(displayText(dn.record), text);
    });
}

DefinedName& NameTable::add() {
    return add(record::NameRecord{}, std::nullopt);
}

DefinedName& NameTable::add(record::NameRecord record, std::optional<SheetId> scope) {
    DefinedName entry;
    entry.id = next_id_++;
    entry.record = std::move(record);
    entry.scope = scope;
    names_.push_back(std::move(entry));
    return names_.back();
}

void NameTable::removeAt(size_t index) {
    checkIndex(index);
    names_.erase(names_.begin() + static_cast<std::ptrdiff_t>(index));
}

std::string NameTable::displayText(const record::NameRecord& record) {
    if (record.isBuiltIn()) {
        const uint8_t code = record.builtInCode();
        if (code < sizeof(kBuiltInNames) / sizeof(kBuiltInNames[0])) {
            return kBuiltInNames[code];
        }
        return fmt::format("Unknown_BuiltIn_{}", code);
    }
    return record.name;
}

bool NameTable::isValidName(const std::string& name) {
    if (name.empty() || name.length() > 255) {
        return false;
    }

    // 名称必须以字母、下划线或反斜杠开头
    const auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_' && first != '\\' && first < 0x80) {
        return false;
    }

    for (char c : name) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x80 && !std::isalnum(u) && c != '_' && c != '.' && c != '\\') {
            return false;
        }
    }

    // 不能与单元格引用冲突（如 A1, $B$2）
    formula::CellRef unused;
    if (formula::CellAddress::parse(name, unused)) {
        return false;
    }
    const std::string upper = utils::toUpperAscii(name);
    return upper != "TRUE" && upper != "FALSE";
}

} // namespace model
} // namespace fastxls
