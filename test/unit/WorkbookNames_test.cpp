#include "fastxls/core/Workbook.hpp"
#include "fastxls/core/Worksheet.hpp"
#include "fastxls/core/Name.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace fastxls {
namespace core {

class WorkbookNamesTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastxls::Logger::getInstance().initialize("logs/WorkbookNames_test.log",
                                                  fastxls::Logger::Level::DEBUG,
                                                  false);
        workbook_ = Workbook::create();
        workbook_->createSheet("first sheet");
        workbook_->createSheet("Other");
    }

    void TearDown() override {
        workbook_.reset();
        fastxls::Logger::getInstance().shutdown();
    }

    std::shared_ptr<Name> defineName(const std::string& text, const std::string& refers_to) {
        auto name = workbook_->createName();
        name->setNameName(text);
        name->setRefersToFormula(refers_to);
        return name;
    }

    std::unique_ptr<Workbook> workbook_;
};

// 测试1: 新建名称并设置引用
TEST_F(WorkbookNamesTest, CreateNameWithReference) {
    auto name = defineName("Range1", "'first sheet'!$A$3:$A$4");
    EXPECT_EQ(workbook_->getNumberOfNames(), 1u);
    EXPECT_EQ(name->getNameName(), "Range1");
    EXPECT_EQ(name->getRefersToFormula(), "'first sheet'!$A$3:$A$4");
    EXPECT_EQ(name->getSheetIndex(), -1);
    EXPECT_EQ(name->getSheetName(), "");
    EXPECT_FALSE(name->isBuiltIn());
    EXPECT_FALSE(name->isHidden());

    auto found = workbook_->getName("range1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->getNameId(), name->getNameId());
    EXPECT_EQ(workbook_->getNameIndex("RANGE1"), 0);
    EXPECT_EQ(workbook_->getNameIndex(*name), 0);
    EXPECT_EQ(workbook_->getName("missing"), nullptr);
}

// 测试2: 名称作用域与同作用域重名
TEST_F(WorkbookNamesTest, ScopesAndDuplicates) {
    auto scoped = defineName("Range1", "Other!$B$1");
    scoped->setSheetIndex(1);
    EXPECT_EQ(scoped->getSheetIndex(), 1);
    EXPECT_EQ(scoped->getSheetName(), "Other");

    // 工作簿级同名名称与工作表级名称可以共存
    auto global = defineName("Range1", "'first sheet'!$B$1");
    EXPECT_EQ(global->getSheetIndex(), -1);

    // 同一作用域内不能重名
    EXPECT_THROW(global->setSheetIndex(1), ParameterException);
    EXPECT_EQ(global->getSheetIndex(), -1);
    auto third = workbook_->createName();
    EXPECT_THROW(third->setNameName("range1"), ParameterException);
    EXPECT_NO_THROW(third->setNameName("Range2"));

    EXPECT_THROW(third->setSheetIndex(2), ParameterException);
    EXPECT_THROW(third->setSheetIndex(-2), ParameterException);
}

// 测试3: 不合法的名称文本
TEST_F(WorkbookNamesTest, InvalidNameTextIsRejected) {
    auto name = workbook_->createName();
    EXPECT_THROW(name->setNameName(""), ParameterException);
    EXPECT_THROW(name->setNameName("1abc"), ParameterException);
    EXPECT_THROW(name->setNameName("A1"), ParameterException);
    EXPECT_THROW(name->setNameName("has space"), ParameterException);
    EXPECT_THROW(name->setNameName("TRUE"), ParameterException);
    EXPECT_NO_THROW(name->setNameName("_valid.name"));
    EXPECT_THROW(name->setRefersToFormula("Missing!A1"), FormulaException);
}

// 测试4: 工作表排序与重命名后名称引用保持指向原工作表
TEST_F(WorkbookNamesTest, ReferenceFollowsSheetOrderAndRename) {
    auto name = defineName("Target", "Other!C1");
    workbook_->setSheetOrder("Other", 0);
    EXPECT_EQ(name->getRefersToFormula(), "Other!C1");

    workbook_->setSheetName(0, "Moved Sheet");
    EXPECT_EQ(name->getRefersToFormula(), "'Moved Sheet'!C1");

    auto reloaded = Workbook::open(workbook_->getBytes());
    auto reloaded_name = reloaded->getName("Target");
    ASSERT_NE(reloaded_name, nullptr);
    EXPECT_EQ(reloaded_name->getRefersToFormula(), "'Moved Sheet'!C1");
}

// 测试5: 删除被引用的工作表后名称保留并引用 #REF!
TEST_F(WorkbookNamesTest, RemovingReferencedSheetDegradesName) {
    auto name = defineName("Range1", "Other!$A$3:$A$4");
    auto kept = defineName("Kept", "'first sheet'!$A$1");
    auto scoped = defineName("Local", "Other!$B$2");
    scoped->setSheetIndex(1);

    workbook_->removeSheetAt(1);
    EXPECT_EQ(workbook_->getNumberOfNames(), 3u);
    EXPECT_EQ(name->getRefersToFormula(), "#REF!$A$3:$A$4");
    EXPECT_EQ(kept->getRefersToFormula(), "'first sheet'!$A$1");

    // 作用于被删工作表的名称改为工作簿级
    EXPECT_EQ(scoped->getSheetIndex(), -1);
    EXPECT_EQ(scoped->getRefersToFormula(), "#REF!$B$2");

    auto reloaded = Workbook::open(workbook_->getBytes());
    EXPECT_EQ(reloaded->getNumberOfNames(), 3u);
    EXPECT_EQ(reloaded->getNameAt(0)->getRefersToFormula(), "#REF!$A$3:$A$4");
    EXPECT_EQ(reloaded->getNameAt(1)->getRefersToFormula(), "'first sheet'!$A$1");
}

// 测试6: 删除名称后单元格公式中的名称记号随之调整
TEST_F(WorkbookNamesTest, RemoveNameRewritesFormulas) {
    auto alpha = defineName("Alpha", "'first sheet'!$A$1");
    auto beta = defineName("Beta", "'first sheet'!$A$2");
    auto gamma = defineName("Gamma", "'first sheet'!$A$3");
    auto sheet = workbook_->getSheetAt(1);
    sheet->setCellFormula(0, 0, "Alpha+Beta+Gamma");
    sheet->setCellFormula(1, 0, "SUM(Gamma)");

    workbook_->removeName("beta");
    EXPECT_EQ(workbook_->getNumberOfNames(), 2u);
    EXPECT_EQ(sheet->getCellFormula(0, 0), "Alpha+#REF!+Gamma");
    EXPECT_EQ(sheet->getCellFormula(1, 0), "SUM(Gamma)");

    // 其他名称的句柄不受影响
    EXPECT_EQ(gamma->getNameName(), "Gamma");
    EXPECT_EQ(workbook_->getNameIndex(*gamma), 1);
    EXPECT_TRUE(alpha->exists());

    EXPECT_FALSE(beta->exists());
    EXPECT_THROW(beta->getNameName(), InvalidStateException);
    EXPECT_THROW(beta->setRefersToFormula("'first sheet'!$A$9"), InvalidStateException);

    auto reloaded = Workbook::open(workbook_->getBytes());
    EXPECT_EQ(reloaded->getSheetAt(1)->getCellFormula(0, 0), "Alpha+#REF!+Gamma");
    EXPECT_EQ(reloaded->getSheetAt(1)->getCellFormula(1, 0), "SUM(Gamma)");
}

// 测试7: 名称索引与删除的错误
TEST_F(WorkbookNamesTest, NameIndexErrors) {
    EXPECT_THROW(workbook_->getNameAt(0), InvalidStateException);
    EXPECT_THROW(workbook_->removeName("missing"), ParameterException);

    auto name = defineName("Only", "Other!A1");
    EXPECT_THROW(workbook_->getNameAt(1), ParameterException);
    EXPECT_THROW(workbook_->removeName(3), ParameterException);

    workbook_->removeName(*name);
    EXPECT_EQ(workbook_->getNumberOfNames(), 0u);
    EXPECT_THROW(workbook_->removeName(*name), ParameterException);
}

// 测试8: 工作簿级名称可以作为引用并集
TEST_F(WorkbookNamesTest, UnionReference) {
    auto name = defineName("Both", "'first sheet'!$A$1,Other!$B$2:$C$3");
    EXPECT_EQ(name->getRefersToFormula(), "'first sheet'!$A$1,Other!$B$2:$C$3");
}

} // namespace core
} // namespace fastxls
