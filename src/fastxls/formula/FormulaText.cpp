#include "fastxls/formula/FormulaText.hpp"
#include "fastxls/formula/CellAddress.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"
#include "fastxls/utils/Unicode.hpp"

#include <cctype>
#include <cstring>
#include <fmt/format.h>
#include <type_traits>

namespace fastxls {
namespace formula {

namespace {

struct FunctionInfo {
    uint16_t index;
    const char* name;
    int min_args;
    int max_args;
    bool reference_args;  // 参数按引用类别编码
};

const FunctionInfo kFunctions[] = {
    {0, "COUNT", 1, 30, true},       {1, "IF", 2, 3, false},
    {2, "ISNA", 1, 1, false},        {3, "ISERROR", 1, 1, false},
    {4, "SUM", 1, 30, true},         {5, "AVERAGE", 1, 30, true},
    {6, "MIN", 1, 30, true},         {7, "MAX", 1, 30, true},
    {8, "ROW", 0, 1, true},          {9, "COLUMN", 0, 1, true},
    {10, "NA", 0, 0, false},         {19, "PI", 0, 0, false},
    {20, "SQRT", 1, 1, false},       {24, "ABS", 1, 1, false},
    {25, "INT", 1, 1, false},        {27, "ROUND", 2, 2, false},
    {29, "INDEX", 2, 4, true},       {31, "MID", 3, 3, false},
    {32, "LEN", 1, 1, false},        {33, "VALUE", 1, 1, false},
    {34, "TRUE", 0, 0, false},       {35, "FALSE", 0, 0, false},
    {36, "AND", 1, 30, false},       {37, "OR", 1, 30, false},
    {38, "NOT", 1, 1, false},        {39, "MOD", 2, 2, false},
    {48, "TEXT", 2, 2, false},       {63, "RAND", 0, 0, false},
    {65, "DATE", 3, 3, false},       {74, "NOW", 0, 0, false},
    {100, "CHOOSE", 2, 30, false},   {101, "HLOOKUP", 3, 4, true},
    {102, "VLOOKUP", 3, 4, true},    {112, "LOWER", 1, 1, false},
    {113, "UPPER", 1, 1, false},     {115, "LEFT", 1, 2, false},
    {116, "RIGHT", 1, 2, false},     {118, "TRIM", 1, 1, false},
    {169, "COUNTA", 1, 30, true},    {221, "TODAY", 0, 0, false},
    {336, "CONCATENATE", 1, 30, false}, {345, "SUMIF", 2, 3, true},
    {346, "COUNTIF", 2, 2, true},
};

const FunctionInfo* findFunction(const std::string& upper_name) {
    for (const FunctionInfo& info : kFunctions) {
        if (upper_name == info.name) {
            return &info;
        }
    }
    return nullptr;
}

const FunctionInfo* findFunction(uint16_t index) {
    for (const FunctionInfo& info : kFunctions) {
        if (info.index == index) {
            return &info;
        }
    }
    return nullptr;
}

const char* errorText(uint8_t code) {
    switch (code) {
        case 0x00: return "#NULL!";
        case 0x07: return "#DIV/0!";
        case 0x0F: return "#VALUE!";
        case 0x17: return "#REF!";
        case 0x1D: return "#NAME?";
        case 0x24: return "#NUM!";
        case 0x2A: return "#N/A";
        default:   return "#ERR!";
    }
}

const char* binaryOperatorText(uint8_t id) {
    switch (id) {
        case OperatorPtg::Add:          return "+";
        case OperatorPtg::Subtract:     return "-";
        case OperatorPtg::Multiply:     return "*";
        case OperatorPtg::Divide:       return "/";
        case OperatorPtg::Power:        return "^";
        case OperatorPtg::Concat:       return "&";
        case OperatorPtg::Less:         return "<";
        case OperatorPtg::LessEqual:    return "<=";
        case OperatorPtg::Equal:        return "=";
        case OperatorPtg::GreaterEqual: return ">=";
        case OperatorPtg::Greater:      return ">";
        case OperatorPtg::NotEqual:     return "<>";
        case OperatorPtg::Intersect:    return " ";
        case OperatorPtg::Union:        return ",";
        case OperatorPtg::Range:        return ":";
        default:                        return nullptr;
    }
}

bool isIdentifierChar(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '.' || c == '$' || c == '\\' || u >= 0x80;
}

/**
 * @brief 递归下降解析器，直接按逆波兰顺序生成记号
 */
class Parser {
public:
    Parser(const std::string& text, FormulaContext& context, FormulaType type)
        : text_(text), context_(context), type_(type) {}

    Formula run() {
        skipSpaces();
        if (pos_ < text_.size() && text_[pos_] == '=') {
            ++pos_;
        }
        if (type_ == FormulaType::NamedRange) {
            parseUnion();
        } else {
            parseComparison();
        }
        skipSpaces();
        if (pos_ != text_.size()) {
            fail(fmt::format("Unexpected '{}' at position {}", text_[pos_], pos_));
        }
        return Formula(std::move(tokens_));
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        FASTXLS_THROW(core::FormulaException, message, text_);
    }

    void skipSpaces() {
        while (pos_ < text_.size() && text_[pos_] == ' ') {
            ++pos_;
        }
    }

    char peek() {
        skipSpaces();
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    bool accept(char c) {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool acceptPair(const char* pair) {
        skipSpaces();
        if (text_.compare(pos_, 2, pair) == 0) {
            pos_ += 2;
            return true;
        }
        return false;
    }

    void expect(char c) {
        if (!accept(c)) {
            fail(fmt::format("Expected '{}' at position {}", c, pos_));
        }
    }

    void emitOperator(uint8_t id) {
        OperatorPtg op;
        op.id = id;
        tokens_.push_back(op);
    }

    PtgClass referenceClass() const {
        return (type_ == FormulaType::NamedRange || reference_args_) ? PtgClass::Reference : PtgClass::Value;
    }

    void parseUnion() {
        parseComparison();
        while (accept(',')) {
            parseComparison();
            emitOperator(OperatorPtg::Union);
        }
    }

    void parseComparison() {
        parseConcat();
        for (;;) {
            uint8_t id;
            if (acceptPair("<>")) id = OperatorPtg::NotEqual;
            else if (acceptPair("<=")) id = OperatorPtg::LessEqual;
            else if (acceptPair(">=")) id = OperatorPtg::GreaterEqual;
            else if (accept('<')) id = OperatorPtg::Less;
            else if (accept('>')) id = OperatorPtg::Greater;
            else if (accept('=')) id = OperatorPtg::Equal;
            else return;
            parseConcat();
            emitOperator(id);
        }
    }

    void parseConcat() {
        parseAdditive();
        while (accept('&')) {
            parseAdditive();
            emitOperator(OperatorPtg::Concat);
        }
    }

    void parseAdditive() {
        parseTerm();
        for (;;) {
            if (accept('+')) {
                parseTerm();
                emitOperator(OperatorPtg::Add);
            } else if (accept('-')) {
                parseTerm();
                emitOperator(OperatorPtg::Subtract);
            } else {
                return;
            }
        }
    }

    void parseTerm() {
        parsePower();
        for (;;) {
            if (accept('*')) {
                parsePower();
                emitOperator(OperatorPtg::Multiply);
            } else if (accept('/')) {
                parsePower();
                emitOperator(OperatorPtg::Divide);
            } else {
                return;
            }
        }
    }

    void parsePower() {
        parseUnary();
        while (accept('^')) {
            parseUnary();
            emitOperator(OperatorPtg::Power);
        }
    }

    void parseUnary() {
        if (accept('-')) {
            parseUnary();
            emitOperator(OperatorPtg::UnaryMinus);
        } else if (accept('+')) {
            parseUnary();
            emitOperator(OperatorPtg::UnaryPlus);
        } else {
            parsePrimary();
            while (accept('%')) {
                emitOperator(OperatorPtg::Percent);
            }
        }
    }

    void parsePrimary() {
        const char c = peek();
        if (c == '\0') {
            fail("Unexpected end of formula");
        }
        if (c == '(') {
            ++pos_;
            parseComparison();
            expect(')');
            emitOperator(OperatorPtg::Paren);
            return;
        }
        if (c == '"') {
            parseString();
            return;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            parseNumber();
            return;
        }
        if (c == '\'') {
            std::string sheet = readQuotedSheetName();
            if (!accept('!')) {
                fail(fmt::format("Expected '!' after sheet name '{}'", sheet));
            }
            parseSheetReference(sheet);
            return;
        }
        if (!isIdentifierChar(c)) {
            fail(fmt::format("Unexpected '{}' at position {}", c, pos_));
        }

        std::string ident = readIdentifier();
        if (pos_ < text_.size() && text_[pos_] == '(') {
            parseFunction(ident);
            return;
        }
        if (pos_ < text_.size() && text_[pos_] == '!') {
            ++pos_;
            parseSheetReference(ident);
            return;
        }
        CellRef first;
        if (CellAddress::parse(ident, first)) {
            parseLocalReference(first);
            return;
        }
        const std::string upper = utils::toUpperAscii(ident);
        if (upper == "TRUE" || upper == "FALSE") {
            tokens_.push_back(BoolPtg{upper == "TRUE"});
            return;
        }
        const uint16_t name_index = context_.nameIndexForText(ident);
        if (name_index == 0) {
            fail(fmt::format("Unknown name '{}'", ident));
        }
        tokens_.push_back(NamePtg{referenceClass(), name_index});
    }

    std::string readIdentifier() {
        const size_t start = pos_;
        while (pos_ < text_.size() && isIdentifierChar(text_[pos_])) {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    std::string readQuotedSheetName() {
        ++pos_;  // 开头的 '
        std::string name;
        for (;;) {
            if (pos_ >= text_.size()) {
                fail("Unterminated quoted sheet name");
            }
            char c = text_[pos_++];
            if (c == '\'') {
                if (pos_ < text_.size() && text_[pos_] == '\'') {
                    name += '\'';
                    ++pos_;
                    continue;
                }
                return name;
            }
            name += c;
        }
    }

    CellRef readCell() {
        const size_t start = pos_;
        std::string ident = readIdentifier();
        CellRef cell;
        if (!CellAddress::parse(ident, cell)) {
            fail(fmt::format("Invalid cell reference '{}' at position {}", ident, start));
        }
        return cell;
    }

    void parseLocalReference(const CellRef& first) {
        if (pos_ < text_.size() && text_[pos_] == ':') {
            ++pos_;
            AreaPtg area;
            area.cls = referenceClass();
            area.first = first;
            area.last = readCell();
            tokens_.push_back(area);
        } else {
            tokens_.push_back(RefPtg{referenceClass(), first});
        }
    }

    void parseSheetReference(const std::string& sheet) {
        CellRef first = readCell();
        const int extern_index = context_.externIndexForSheet(sheet);
        if (extern_index < 0) {
            fail(fmt::format("Unknown sheet '{}'", sheet));
        }
        if (pos_ < text_.size() && text_[pos_] == ':') {
            ++pos_;
            Area3dPtg area;
            area.cls = referenceClass();
            area.extern_index = static_cast<uint16_t>(extern_index);
            area.first = first;
            area.last = readCell();
            tokens_.push_back(area);
        } else {
            Ref3dPtg ref;
            ref.cls = referenceClass();
            ref.extern_index = static_cast<uint16_t>(extern_index);
            ref.cell = first;
            tokens_.push_back(ref);
        }
    }

    void parseString() {
        ++pos_;  // 开头的 "
        std::string value;
        for (;;) {
            if (pos_ >= text_.size()) {
                fail("Unterminated string literal");
            }
            char c = text_[pos_++];
            if (c == '"') {
                if (pos_ < text_.size() && text_[pos_] == '"') {
                    value += '"';
                    ++pos_;
                    continue;
                }
                break;
            }
            value += c;
        }
        tokens_.push_back(StrPtg{value});
    }

    void parseNumber() {
        const size_t start = pos_;
        bool integral = true;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        if (pos_ < text_.size() && text_[pos_] == '.') {
            integral = false;
            ++pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            integral = false;
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        }
        const std::string literal = text_.substr(start, pos_ - start);
        double value = 0.0;
        try {
            value = std::stod(literal);
        } catch (const std::exception&) {
            fail(fmt::format("Invalid number '{}'", literal));
        }
        if (integral && value <= 65535.0) {
            tokens_.push_back(IntPtg{static_cast<uint16_t>(value)});
        } else {
            tokens_.push_back(NumPtg{value});
        }
    }

    void parseFunction(const std::string& ident) {
        const FunctionInfo* info = findFunction(utils::toUpperAscii(ident));
        if (!info) {
            fail(fmt::format("Unknown function '{}'", ident));
        }
        ++pos_;  // '('

        const bool saved = reference_args_;
        reference_args_ = info->reference_args;
        int count = 0;
        if (!accept(')')) {
            for (;;) {
                parseComparison();
                ++count;
                if (accept(',')) {
                    continue;
                }
                expect(')');
                break;
            }
        }
        reference_args_ = saved;

        if (count < info->min_args || count > info->max_args) {
            fail(fmt::format("Function {} takes {} to {} arguments, got {}",
                             info->name, info->min_args, info->max_args, count));
        }
        if (info->min_args == info->max_args) {
            tokens_.push_back(FuncPtg{PtgClass::Value, info->index});
        } else {
            FuncVarPtg var;
            var.cls = PtgClass::Value;
            var.arg_count = static_cast<uint8_t>(count);
            var.index = info->index;
            tokens_.push_back(var);
        }
    }

    const std::string& text_;
    FormulaContext& context_;
    FormulaType type_;
    size_t pos_ = 0;
    bool reference_args_ = false;
    std::vector<Ptg> tokens_;
};

std::string renderNumber(double value) {
    return fmt::format("{}", value);
}

} // namespace

Formula FormulaParser::parse(const std::string& text, FormulaContext& context, FormulaType type) {
    Parser parser(text, context, type);
    Formula formula = parser.run();
    FORMULA_DEBUG("Parsed '{}' into {} tokens", text, formula.tokens().size());
    return formula;
}

std::string FormulaRenderer::render(const Formula& formula, const FormulaContext& context) {
    if (formula.isOpaque()) {
        FASTXLS_THROW(core::FormulaException, "Formula contains tokens that cannot be rendered", "");
    }

    std::vector<std::string> stack;
    auto pop = [&stack]() {
        if (stack.empty()) {
            FASTXLS_THROW(core::FormulaException, "Malformed formula: operand stack underflow", "");
        }
        std::string top = std::move(stack.back());
        stack.pop_back();
        return top;
    };
    auto popArgs = [&pop](size_t count) {
        std::vector<std::string> args(count);
        for (size_t i = count; i > 0; --i) {
            args[i - 1] = pop();
        }
        std::string joined;
        for (size_t i = 0; i < args.size(); ++i) {
            if (i > 0) joined += ',';
            joined += args[i];
        }
        return joined;
    };
    auto sheetPrefix = [&context](uint16_t extern_index) -> std::string {
        std::optional<std::string> sheet = context.sheetNameForExternIndex(extern_index);
        if (!sheet) {
            return "#REF!";
        }
        return CellAddress::quoteSheetName(*sheet) + "!";
    };

    for (const Ptg& ptg : formula.tokens()) {
        std::visit([&](const auto& p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, RefPtg>) {
                stack.push_back(CellAddress::format(p.cell));
            } else if constexpr (std::is_same_v<T, AreaPtg>) {
                stack.push_back(CellAddress::formatArea(p.first, p.last));
            } else if constexpr (std::is_same_v<T, Ref3dPtg>) {
                stack.push_back(sheetPrefix(p.extern_index) + CellAddress::format(p.cell));
            } else if constexpr (std::is_same_v<T, Area3dPtg>) {
                stack.push_back(sheetPrefix(p.extern_index) + CellAddress::formatArea(p.first, p.last));
            } else if constexpr (std::is_same_v<T, RefErr3dPtg>) {
                stack.push_back("#REF!" + CellAddress::format(p.cell));
            } else if constexpr (std::is_same_v<T, AreaErr3dPtg>) {
                stack.push_back("#REF!" + CellAddress::formatArea(p.first, p.last));
            } else if constexpr (std::is_same_v<T, RefErrPtg> || std::is_same_v<T, AreaErrPtg>) {
                stack.push_back("#REF!");
            } else if constexpr (std::is_same_v<T, IntPtg>) {
                stack.push_back(std::to_string(p.value));
            } else if constexpr (std::is_same_v<T, NumPtg>) {
                stack.push_back(renderNumber(p.value));
            } else if constexpr (std::is_same_v<T, StrPtg>) {
                std::string quoted = "\"";
                for (char c : p.value) {
                    quoted += c;
                    if (c == '"') quoted += '"';
                }
                stack.push_back(quoted + "\"");
            } else if constexpr (std::is_same_v<T, BoolPtg>) {
                stack.push_back(p.value ? "TRUE" : "FALSE");
            } else if constexpr (std::is_same_v<T, ErrPtg>) {
                stack.push_back(errorText(p.code));
            } else if constexpr (std::is_same_v<T, MissArgPtg>) {
                stack.push_back("");
            } else if constexpr (std::is_same_v<T, OperatorPtg>) {
                switch (p.id) {
                    case OperatorPtg::UnaryPlus:  stack.push_back("+" + pop()); break;
                    case OperatorPtg::UnaryMinus: stack.push_back("-" + pop()); break;
                    case OperatorPtg::Percent:    stack.push_back(pop() + "%"); break;
                    case OperatorPtg::Paren:      stack.push_back("(" + pop() + ")"); break;
                    default: {
                        std::string rhs = pop();
                        std::string lhs = pop();
                        stack.push_back(lhs + binaryOperatorText(p.id) + rhs);
                        break;
                    }
                }
            } else if constexpr (std::is_same_v<T, FuncPtg>) {
                const FunctionInfo* info = findFunction(p.index);
                if (!info) {
                    FASTXLS_THROW(core::FormulaException,
                                  fmt::format("Function index {} is not supported", p.index), "");
                }
                stack.push_back(std::string(info->name) + "(" + popArgs(static_cast<size_t>(info->min_args)) + ")");
            } else if constexpr (std::is_same_v<T, FuncVarPtg>) {
                const uint16_t index = static_cast<uint16_t>(p.index & 0x7FFF);
                const FunctionInfo* info = findFunction(index);
                if (!info) {
                    FASTXLS_THROW(core::FormulaException,
                                  fmt::format("Function index {} is not supported", index), "");
                }
                stack.push_back(std::string(info->name) + "(" + popArgs(p.arg_count & 0x7F) + ")");
            } else if constexpr (std::is_same_v<T, NamePtg>) {
                stack.push_back(context.nameText(p.index));
            } else if constexpr (std::is_same_v<T, NameXPtg>) {
                stack.push_back("#NAME?");
            } else if constexpr (std::is_same_v<T, MemFuncPtg>) {
                // 子表达式紧随其后，本身不产生文本
            } else if constexpr (std::is_same_v<T, AttrPtg>) {
                if (p.options & AttrPtg::kSum) {
                    stack.push_back("SUM(" + pop() + ")");
                }
            } else if constexpr (std::is_same_v<T, ExpPtg>) {
                FASTXLS_THROW(core::FormulaException, "Shared formula tokens cannot be rendered", "");
            }
        }, ptg);
    }

    if (stack.empty()) {
        return "";
    }
    if (stack.size() != 1) {
        FASTXLS_THROW(core::FormulaException,
                      fmt::format("Malformed formula: {} operands left on the stack", stack.size()), "");
    }
    return stack.back();
}

} // namespace formula
} // namespace fastxls
