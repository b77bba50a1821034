#include "fastxls/core/Workbook.hpp"
#include "fastxls/core/Worksheet.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace fastxls {
namespace core {

class WorkbookTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastxls::Logger::getInstance().initialize("logs/Workbook_test.log",
                                                  fastxls::Logger::Level::DEBUG,
                                                  false);
    }

    void TearDown() override {
        fastxls::Logger::getInstance().shutdown();
    }

    // 辅助函数：保存到内存并重新打开
    static std::unique_ptr<Workbook> reopen(Workbook& workbook) {
        return Workbook::open(workbook.getBytes());
    }
};

// 测试1: 新建工作簿的初始状态
TEST_F(WorkbookTest, CreateEmptyWorkbook) {
    auto workbook = Workbook::create();
    ASSERT_NE(workbook, nullptr);
    EXPECT_TRUE(workbook->isOpen());
    EXPECT_EQ(workbook->getSource(), WorkbookSource::NEW_WORKBOOK);
    EXPECT_EQ(workbook->getNumberOfSheets(), 0u);
    EXPECT_EQ(workbook->getNumberOfNames(), 0u);
    EXPECT_EQ(workbook->getNumCellStyles(), 21u);
    EXPECT_EQ(workbook->getActiveSheetIndex(), -1);
    EXPECT_FALSE(workbook->isHidden());
    EXPECT_FALSE(workbook->isWriteProtected());
}

// 测试2: 默认工作表名称
TEST_F(WorkbookTest, DefaultSheetNames) {
    auto workbook = Workbook::create();
    auto first = workbook->createSheet();
    auto second = workbook->createSheet();
    EXPECT_EQ(first->getName(), "Sheet1");
    EXPECT_EQ(second->getName(), "Sheet2");

    // 已被占用的名称顺延
    workbook->setSheetName(0, "Sheet3");
    auto third = workbook->createSheet();
    EXPECT_EQ(third->getName(), "Sheet4");

    WorkbookOptions options;
    options.default_sheet_prefix = "Data";
    auto custom = Workbook::create(options);
    EXPECT_EQ(custom->createSheet()->getName(), "Data1");
}

// 测试3: 样式表容量有界
TEST_F(WorkbookTest, CellStyleCapacity) {
    WorkbookOptions options;
    options.max_cell_styles = 25;
    auto workbook = Workbook::create(options);

    for (int expected = 21; expected < 25; ++expected) {
        EXPECT_EQ(workbook->createCellStyle(), expected);
    }
    EXPECT_EQ(workbook->getNumCellStyles(), 25u);

    try {
        workbook->createCellStyle();
        FAIL() << "Expected CapacityExceededException";
    } catch (const CapacityExceededException& e) {
        EXPECT_EQ(e.getLimit(), 25u);
    }
    EXPECT_EQ(workbook->getNumCellStyles(), 25u);
}

// 测试4: 新增的样式在保存后保留
TEST_F(WorkbookTest, CellStylesSurviveSave) {
    auto workbook = Workbook::create();
    workbook->createSheet();
    workbook->createCellStyle();
    workbook->createCellStyle();

    auto reloaded = reopen(*workbook);
    EXPECT_EQ(reloaded->getNumCellStyles(), 23u);
    EXPECT_EQ(reloaded->createCellStyle(), 23);
}

// 测试5: 隐藏工作簿窗口
TEST_F(WorkbookTest, HiddenFlag) {
    auto workbook = Workbook::create();
    workbook->createSheet();
    workbook->setHidden(true);
    EXPECT_TRUE(workbook->isHidden());

    auto reloaded = reopen(*workbook);
    EXPECT_TRUE(reloaded->isHidden());
    reloaded->setHidden(false);
    EXPECT_FALSE(reloaded->isHidden());
}

// 测试6: 写保护设置、保存与取消
TEST_F(WorkbookTest, WriteProtection) {
    auto workbook = Workbook::create();
    workbook->createSheet();
    workbook->writeProtectWorkbook("secret", "fastxls");
    EXPECT_TRUE(workbook->isWriteProtected());

    // 重复设置不会产生重复记录
    workbook->writeProtectWorkbook("other", "fastxls");
    EXPECT_TRUE(workbook->isWriteProtected());

    auto reloaded = reopen(*workbook);
    EXPECT_TRUE(reloaded->isWriteProtected());

    reloaded->unwriteProtectWorkbook();
    EXPECT_FALSE(reloaded->isWriteProtected());

    auto unprotected = reopen(*reloaded);
    EXPECT_FALSE(unprotected->isWriteProtected());
}

// 测试7: 用户名超出 WRITEACCESS 记录长度
TEST_F(WorkbookTest, WriteProtectionRejectsLongUserName) {
    auto workbook = Workbook::create();
    workbook->createSheet();
    const std::string long_name(200, 'u');
    EXPECT_THROW(workbook->writeProtectWorkbook("secret", long_name), ParameterException);
    EXPECT_FALSE(workbook->isWriteProtected());
}

// 测试8: 关闭后不能再使用
TEST_F(WorkbookTest, OperationsAfterCloseThrow) {
    auto workbook = Workbook::create();
    auto sheet = workbook->createSheet();
    workbook->close();

    EXPECT_FALSE(workbook->isOpen());
    EXPECT_THROW(workbook->getNumberOfSheets(), InvalidStateException);
    EXPECT_THROW(workbook->createSheet(), InvalidStateException);
    EXPECT_THROW(workbook->getBytes(), InvalidStateException);
    EXPECT_THROW(sheet->getName(), InvalidStateException);

    // 重复关闭无副作用
    EXPECT_NO_THROW(workbook->close());
}

} // namespace core
} // namespace fastxls
