#include "fastxls/formula/FormulaText.hpp"
#include "fastxls/formula/CellAddress.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace fastxls {
namespace formula {

namespace {

// 外部工作表索引 i 直接对应第 i 个工作表
class TestContext : public FormulaContext {
public:
    std::vector<std::string> sheets;
    std::vector<std::string> names;
    std::set<uint16_t> deleted;

    std::optional<std::string> sheetNameForExternIndex(uint16_t extern_index) const override {
        if (extern_index >= sheets.size() || deleted.count(extern_index)) {
            return std::nullopt;
        }
        return sheets[extern_index];
    }

    int externIndexForSheet(const std::string& sheet_name) override {
        auto it = std::find(sheets.begin(), sheets.end(), sheet_name);
        return it == sheets.end() ? -1 : static_cast<int>(it - sheets.begin());
    }

    std::string nameText(uint16_t index) const override {
        if (index == 0 || index > names.size()) {
            return "#NAME?";
        }
        return names[index - 1];
    }

    uint16_t nameIndexForText(const std::string& text) const override {
        auto it = std::find(names.begin(), names.end(), text);
        return it == names.end() ? 0 : static_cast<uint16_t>(it - names.begin() + 1);
    }
};

} // namespace

class FormulaTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastxls::Logger::getInstance().initialize("logs/Formula_test.log",
                                                  fastxls::Logger::Level::DEBUG,
                                                  false);
        context_.sheets = {"Sheet1", "Other", "My Sheet", "O'Brien"};
        context_.names = {"Alpha", "Beta", "Gamma"};
    }

    void TearDown() override {
        fastxls::Logger::getInstance().shutdown();
    }

    std::string roundTrip(const std::string& text, FormulaType type = FormulaType::Cell) {
        Formula parsed = FormulaParser::parse(text, context_, type);
        return FormulaRenderer::render(parsed, context_);
    }

    TestContext context_;
};

// 测试1: 地址格式化与解析
TEST_F(FormulaTest, CellAddressFormatting) {
    EXPECT_EQ(CellAddress::columnToLetters(0), "A");
    EXPECT_EQ(CellAddress::columnToLetters(25), "Z");
    EXPECT_EQ(CellAddress::columnToLetters(255), "IV");
    EXPECT_EQ(CellAddress::lettersToColumn("AA"), 26);

    CellRef ref;
    ASSERT_TRUE(CellAddress::parse("$B$2", ref));
    EXPECT_EQ(ref.row, 1);
    EXPECT_EQ(ref.col, 1);
    EXPECT_FALSE(ref.row_relative);
    EXPECT_FALSE(ref.col_relative);
    EXPECT_EQ(CellAddress::format(ref), "$B$2");

    EXPECT_FALSE(CellAddress::parse("Sheet1", ref));
    EXPECT_FALSE(CellAddress::parse("A0", ref));
}

// 测试2: 工作表名仅在需要时加引号
TEST_F(FormulaTest, SheetNameQuoting) {
    EXPECT_EQ(CellAddress::quoteSheetName("Sheet1"), "Sheet1");
    EXPECT_EQ(CellAddress::quoteSheetName("My Sheet"), "'My Sheet'");
    EXPECT_EQ(CellAddress::quoteSheetName("O'Brien"), "'O''Brien'");
    EXPECT_EQ(CellAddress::quoteSheetName("A1"), "'A1'");
    EXPECT_EQ(CellAddress::quoteSheetName("2024"), "'2024'");
    EXPECT_EQ(CellAddress::quoteSheetName("true"), "'true'");
}

// 测试3: 函数调用生成的记号
TEST_F(FormulaTest, ParseSumProducesAreaAndVarFunction) {
    Formula parsed = FormulaParser::parse("=SUM(A1:B2)", context_, FormulaType::Cell);
    ASSERT_EQ(parsed.tokens().size(), 2u);

    const auto* area = std::get_if<AreaPtg>(&parsed.tokens()[0]);
    ASSERT_NE(area, nullptr);
    EXPECT_EQ(area->cls, PtgClass::Reference);
    EXPECT_EQ(area->last.row, 1);
    EXPECT_EQ(area->last.col, 1);

    const auto* func = std::get_if<FuncVarPtg>(&parsed.tokens()[1]);
    ASSERT_NE(func, nullptr);
    EXPECT_EQ(func->index, 4);
    EXPECT_EQ(func->arg_count, 1);

    EXPECT_EQ(FormulaRenderer::render(parsed, context_), "SUM(A1:B2)");
}

// 测试4: 运算符与常量还原为文本
TEST_F(FormulaTest, OperatorsAndConstantsRender) {
    EXPECT_EQ(roundTrip("A1+B2*2"), "A1+B2*2");
    EXPECT_EQ(roundTrip("(1+2)^3"), "(1+2)^3");
    EXPECT_EQ(roundTrip("-A1%"), "-A1%");
    EXPECT_EQ(roundTrip("A1&\"say \"\"hi\"\"\""), "A1&\"say \"\"hi\"\"\"");
    EXPECT_EQ(roundTrip("IF(A1>=1.5,TRUE,FALSE)"), "IF(A1>=1.5,TRUE,FALSE)");
    EXPECT_EQ(roundTrip("A1<>B1"), "A1<>B1");
    EXPECT_EQ(roundTrip("ROUND(PI(),2)"), "ROUND(PI(),2)");
}

// 测试5: 三维引用经外部工作表索引还原工作表名
TEST_F(FormulaTest, SheetReferencesRender) {
    EXPECT_EQ(roundTrip("Other!C1"), "Other!C1");
    EXPECT_EQ(roundTrip("'My Sheet'!$B$2"), "'My Sheet'!$B$2");
    EXPECT_EQ(roundTrip("'O''Brien'!A1:A3"), "'O''Brien'!A1:A3");

    Formula parsed = FormulaParser::parse("Other!C1", context_, FormulaType::Cell);
    const auto* ref = std::get_if<Ref3dPtg>(&parsed.tokens()[0]);
    ASSERT_NE(ref, nullptr);
    EXPECT_EQ(ref->extern_index, 1);
    EXPECT_EQ(ref->cls, PtgClass::Value);
}

// 测试6: 名称定义允许顶层并集，引用取引用类别
TEST_F(FormulaTest, NamedRangeUnion) {
    Formula parsed = FormulaParser::parse("Sheet1!$A$1,Sheet1!$B$2", context_, FormulaType::NamedRange);
    ASSERT_EQ(parsed.tokens().size(), 3u);
    const auto* first = std::get_if<Ref3dPtg>(&parsed.tokens()[0]);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->cls, PtgClass::Reference);
    const auto* op = std::get_if<OperatorPtg>(&parsed.tokens()[2]);
    ASSERT_NE(op, nullptr);
    EXPECT_EQ(op->id, OperatorPtg::Union);

    EXPECT_EQ(FormulaRenderer::render(parsed, context_), "Sheet1!$A$1,Sheet1!$B$2");
}

// 测试7: 语法与引用错误
TEST_F(FormulaTest, InvalidFormulasThrow) {
    EXPECT_THROW(FormulaParser::parse("Missing!A1", context_, FormulaType::Cell), core::FormulaException);
    EXPECT_THROW(FormulaParser::parse("NoSuchName+1", context_, FormulaType::Cell), core::FormulaException);
    EXPECT_THROW(FormulaParser::parse("FROB(1)", context_, FormulaType::Cell), core::FormulaException);
    EXPECT_THROW(FormulaParser::parse("ROUND(1)", context_, FormulaType::Cell), core::FormulaException);
    EXPECT_THROW(FormulaParser::parse("(A1+1", context_, FormulaType::Cell), core::FormulaException);
    EXPECT_THROW(FormulaParser::parse("\"open", context_, FormulaType::Cell), core::FormulaException);
    EXPECT_THROW(FormulaParser::parse("A1 B1", context_, FormulaType::Cell), core::FormulaException);

    try {
        FormulaParser::parse("1+", context_, FormulaType::Cell);
        FAIL() << "Expected FormulaException";
    } catch (const core::FormulaException& e) {
        EXPECT_EQ(e.getFormula(), "1+");
    }
}

// 测试8: 删除工作表后三维引用降级为 #REF!
TEST_F(FormulaTest, DegradeReferencesToDeletedSheet) {
    Formula parsed = FormulaParser::parse("Other!A1+Sheet1!A1", context_, FormulaType::Cell);
    const uint16_t before = parsed.encodedSize();

    const size_t degraded = parsed.degradeReferences([](uint16_t ix) { return ix == 1; });
    EXPECT_EQ(degraded, 1u);
    EXPECT_EQ(parsed.encodedSize(), before);
    EXPECT_TRUE(parsed.usesExternIndex(1));
    EXPECT_EQ(FormulaRenderer::render(parsed, context_), "#REF!A1+Sheet1!A1");

    Formula area = FormulaParser::parse("Other!$A$3:$A$4", context_, FormulaType::NamedRange);
    area.degradeReferences([](uint16_t ix) { return ix == 1; });
    EXPECT_EQ(FormulaRenderer::render(area, context_), "#REF!$A$3:$A$4");
}

// 测试9: 改写外部工作表索引
TEST_F(FormulaTest, ReplaceExternIndex) {
    Formula parsed = FormulaParser::parse("Other!A1+Other!B1:B2+Sheet1!C1", context_, FormulaType::Cell);
    EXPECT_EQ(parsed.replaceExternIndex(1, 2), 2u);
    EXPECT_FALSE(parsed.usesExternIndex(1));
    EXPECT_EQ(FormulaRenderer::render(parsed, context_), "'My Sheet'!A1+'My Sheet'!B1:B2+Sheet1!C1");
}

// 测试10: 删除名称后修正名称记号
TEST_F(FormulaTest, RemoveNameIndexShiftsLaterNames) {
    Formula parsed = FormulaParser::parse("Alpha+Beta+Gamma", context_, FormulaType::Cell);
    const uint16_t before = parsed.encodedSize();

    EXPECT_EQ(parsed.removeNameIndex(2), 2u);
    EXPECT_EQ(parsed.encodedSize(), before);
    EXPECT_NE(std::get_if<RefErrPtg>(&parsed.tokens()[1]), nullptr);

    context_.names = {"Alpha", "Gamma"};
    EXPECT_EQ(FormulaRenderer::render(parsed, context_), "Alpha+#REF!+Gamma");
}

// 测试11: 记号字节往返及未知记号按原始字节保留
TEST_F(FormulaTest, BinaryEncodingAndOpaqueTokens) {
    Formula parsed = FormulaParser::parse("IF(Other!A1>0,\"yes\",1.25)", context_, FormulaType::Cell);
    utils::ByteWriter writer;
    parsed.write(writer);
    ASSERT_EQ(writer.size(), parsed.encodedSize());

    utils::ByteReader reader(writer.data());
    Formula decoded = Formula::read(reader, parsed.encodedSize());
    EXPECT_FALSE(decoded.isOpaque());
    EXPECT_EQ(decoded, parsed);

    const std::vector<uint8_t> raw = {0x18, 0x01, 0x02, 0x03};
    utils::ByteReader raw_reader(raw);
    Formula opaque = Formula::read(raw_reader, static_cast<uint16_t>(raw.size()));
    EXPECT_TRUE(opaque.isOpaque());
    EXPECT_EQ(opaque.encodedSize(), raw.size());
    EXPECT_EQ(opaque.degradeReferences([](uint16_t) { return true; }), 0u);
    EXPECT_THROW(FormulaRenderer::render(opaque, context_), core::FormulaException);

    utils::ByteWriter raw_writer;
    opaque.write(raw_writer);
    EXPECT_EQ(raw_writer.data(), raw);
}

} // namespace formula
} // namespace fastxls
