#include "fastxls/core/Workbook.hpp"
#include "fastxls/core/Worksheet.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/cfb/CompoundFile.hpp"
#include "fastxls/record/RecordCodec.hpp"
#include "fastxls/utils/Logger.hpp"
#include "EscherData.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace fastxls {
namespace core {

class WorkbookSheetsTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastxls::Logger::getInstance().initialize("logs/WorkbookSheets_test.log",
                                                  fastxls::Logger::Level::DEBUG,
                                                  false);
        workbook_ = Workbook::create();
    }

    void TearDown() override {
        workbook_.reset();
        fastxls::Logger::getInstance().shutdown();
    }

    void createSheets(const std::vector<std::string>& names) {
        for (const auto& name : names) {
            workbook_->createSheet(name);
        }
    }

    std::vector<std::string> sheetNames() const {
        std::vector<std::string> names;
        for (size_t i = 0; i < workbook_->getNumberOfSheets(); ++i) {
            names.push_back(workbook_->getSheetName(i));
        }
        return names;
    }

    /**
     * @brief 构造一个工作表引用一张图片（cRef = 1）的工作簿
     *
     * 先正常保存，再在记录流中插入 MSODRAWINGGROUP 与 MSODRAWING 后重新打开。
     */
    static std::unique_ptr<Workbook> workbookWithPicture() {
        auto source = Workbook::create();
        source->createSheet("Pictures");
        auto container = cfb::CompoundFile::open(source->getBytes());
        std::vector<record::Record> records = record::RecordCodec::decode(container->getStream("Workbook"));

        auto bound = std::find_if(records.begin(), records.end(), [](const record::Record& r) {
            return record::recordAs<record::BoundSheetRecord>(r) != nullptr;
        });
        record::DrawingGroupRecord group;
        group.data = test::drawingGroupData({1});
        records.insert(bound, record::Record(std::move(group)));

        // 最后一条记录是工作表子流的 EOF
        record::DrawingRecord drawing;
        drawing.data = test::drawingData({1});
        records.insert(records.end() - 1, record::Record(std::move(drawing)));

        container->replaceStream("Workbook", record::RecordCodec::encode(records));
        return Workbook::open(container->toBytes());
    }

    std::unique_ptr<Workbook> workbook_;
};

// 测试1: 新建工作表与按名称查找
TEST_F(WorkbookSheetsTest, CreateAndLookupSheets) {
    createSheets({"first", "second"});
    EXPECT_EQ(workbook_->getNumberOfSheets(), 2u);
    EXPECT_EQ(workbook_->getSheetIndex("second"), 1);
    EXPECT_EQ(workbook_->getSheetIndex("SECOND"), 1);
    EXPECT_EQ(workbook_->getSheetIndex("missing"), -1);
    EXPECT_EQ(workbook_->getSheet("missing"), nullptr);

    auto sheet = workbook_->getSheet("first");
    ASSERT_NE(sheet, nullptr);
    EXPECT_EQ(sheet->getIndex(), 0u);
    EXPECT_EQ(workbook_->getSheetIndex(*sheet), 0);

    // 第一个工作表自动成为活动且选中
    EXPECT_TRUE(sheet->isActive());
    EXPECT_TRUE(sheet->isSelected());
    EXPECT_FALSE(workbook_->getSheetAt(1)->isSelected());

    EXPECT_THROW(workbook_->getSheetAt(2), ParameterException);
}

// 测试2: 不合法或重复的工作表名称
TEST_F(WorkbookSheetsTest, InvalidSheetNamesAreRejected) {
    createSheets({"Data"});
    EXPECT_THROW(workbook_->createSheet("data"), WorksheetException);
    EXPECT_THROW(workbook_->createSheet(""), WorksheetException);
    EXPECT_THROW(workbook_->createSheet(std::string(32, 'x')), WorksheetException);
    EXPECT_THROW(workbook_->createSheet("a/b"), WorksheetException);
    EXPECT_THROW(workbook_->createSheet("what?"), WorksheetException);
    EXPECT_THROW(workbook_->createSheet("[x]"), WorksheetException);
    EXPECT_THROW(workbook_->createSheet("'quoted'"), WorksheetException);
    EXPECT_NO_THROW(workbook_->createSheet(std::string(31, 'x')));
    EXPECT_EQ(workbook_->getNumberOfSheets(), 2u);
}

// 测试3: 重命名
TEST_F(WorkbookSheetsTest, RenameSheet) {
    createSheets({"first", "second"});
    auto handle = workbook_->getSheetAt(1);

    workbook_->setSheetName(1, "renamed");
    EXPECT_EQ(handle->getName(), "renamed");
    EXPECT_EQ(workbook_->getSheetIndex("second"), -1);

    // 改变自身名称的大小写是允许的
    EXPECT_NO_THROW(workbook_->setSheetName(1, "RENAMED"));
    EXPECT_THROW(workbook_->setSheetName(1, "First"), WorksheetException);
    EXPECT_THROW(workbook_->setSheetName(5, "x"), ParameterException);
}

// 测试4: 克隆命名规则
TEST_F(WorkbookSheetsTest, CloneSheetNaming) {
    createSheets({"Sheet1"});
    auto first_clone = workbook_->cloneSheet(0);
    auto second_clone = workbook_->cloneSheet(0);
    EXPECT_EQ(first_clone->getName(), "Sheet1 (2)");
    EXPECT_EQ(second_clone->getName(), "Sheet1 (3)");

    // 已带序号的名称继续递增
    auto third_clone = workbook_->cloneSheet(1);
    EXPECT_EQ(third_clone->getName(), "Sheet1 (4)");

    // 接近 31 字符的名称截断后追加序号
    workbook_->createSheet(std::string(31, 'L'));
    auto long_clone = workbook_->cloneSheet(4);
    EXPECT_EQ(long_clone->getName(), std::string(28, 'L') + "(2)");
}

// 测试5: 克隆复制单元格，新表不活动不选中
TEST_F(WorkbookSheetsTest, CloneCopiesCellsWithoutSelection) {
    createSheets({"Source"});
    auto source = workbook_->getSheetAt(0);
    source->setCellNumber(0, 0, 42.0);
    source->setCellString(1, 0, "hello");
    source->setCellFormula(2, 0, "A1*2");

    auto clone = workbook_->cloneSheet(0);
    EXPECT_EQ(clone->getIndex(), 1u);
    EXPECT_DOUBLE_EQ(clone->getCellNumber(0, 0), 42.0);
    EXPECT_EQ(clone->getCellString(1, 0), "hello");
    EXPECT_EQ(clone->getCellFormula(2, 0), "A1*2");
    EXPECT_FALSE(clone->isActive());
    EXPECT_FALSE(clone->isSelected());

    // 修改克隆不影响源表
    clone->setCellNumber(0, 0, 7.0);
    EXPECT_DOUBLE_EQ(source->getCellNumber(0, 0), 42.0);
}

// 测试6: 排序后句柄与活动状态跟随工作表
TEST_F(WorkbookSheetsTest, SetSheetOrder) {
    createSheets({"a", "b", "c"});
    auto a = workbook_->getSheet("a");
    workbook_->setActiveSheet(0);

    workbook_->setSheetOrder("a", 2);
    EXPECT_EQ(sheetNames(), (std::vector<std::string>{"b", "c", "a"}));
    EXPECT_EQ(a->getIndex(), 2u);
    EXPECT_EQ(workbook_->getActiveSheetIndex(), 2);
    EXPECT_EQ(workbook_->getSelectedTabs(), (std::vector<size_t>{2}));

    workbook_->setSheetOrder("c", 0);
    EXPECT_EQ(sheetNames(), (std::vector<std::string>{"c", "b", "a"}));

    EXPECT_THROW(workbook_->setSheetOrder("missing", 0), ParameterException);
    EXPECT_THROW(workbook_->setSheetOrder("a", 3), ParameterException);
}

// 测试7: 删除工作表后的选中与活动状态
TEST_F(WorkbookSheetsTest, SelectionAfterRemoval) {
    createSheets({"a", "b", "c"});
    workbook_->setActiveSheet(2);
    workbook_->setSelectedTab(2);

    workbook_->removeSheetAt(2);
    EXPECT_EQ(workbook_->getActiveSheetIndex(), 1);
    EXPECT_EQ(workbook_->getSelectedTabs(), (std::vector<size_t>{1}));

    // 删除活动表之前的工作表，活动序号前移
    workbook_->removeSheetAt(0);
    EXPECT_EQ(workbook_->getActiveSheetIndex(), 0);
    EXPECT_EQ(workbook_->getSheetName(0), "b");
    EXPECT_TRUE(workbook_->getSheetAt(0)->isSelected());

    workbook_->removeSheetAt(0);
    EXPECT_EQ(workbook_->getNumberOfSheets(), 0u);
    EXPECT_EQ(workbook_->getActiveSheetIndex(), -1);
    EXPECT_TRUE(workbook_->getSelectedTabs().empty());
}

// 测试8: 先删除再新建工作表，保存后仍只有一个选中的工作表
TEST_F(WorkbookSheetsTest, RemoveThenCreateKeepsSingleSelection) {
    createSheets({"first", "second"});
    workbook_->setActiveSheet(1);
    workbook_->setSelectedTab(1);
    workbook_->removeSheetAt(0);
    workbook_->createSheet("third");

    EXPECT_EQ(workbook_->getActiveSheetIndex(), 0);
    EXPECT_EQ(workbook_->getSelectedTabs(), (std::vector<size_t>{0}));

    auto reloaded = Workbook::open(workbook_->getBytes());
    EXPECT_EQ(reloaded->getNumberOfSheets(), 2u);
    EXPECT_EQ(reloaded->getActiveSheetIndex(), 0);
    EXPECT_EQ(reloaded->getSelectedTabs(), (std::vector<size_t>{0}));
    EXPECT_TRUE(reloaded->getSheetAt(0)->isSelected());
    EXPECT_FALSE(reloaded->getSheetAt(1)->isSelected());
}

// 测试9: 第一可见标签随删除调整
TEST_F(WorkbookSheetsTest, FirstVisibleTabFollowsRemoval) {
    createSheets({"a", "b", "c", "d"});
    workbook_->setFirstVisibleTab(3);
    workbook_->removeSheetAt(1);
    EXPECT_EQ(workbook_->getFirstVisibleTab(), 2u);

    workbook_->removeSheetAt(2);
    EXPECT_EQ(workbook_->getFirstVisibleTab(), 1u);
}

// 测试10: 批量删除
TEST_F(WorkbookSheetsTest, RemoveSheetsAt) {
    createSheets({"a", "b", "c", "d", "e"});
    workbook_->removeSheetsAt({1, 3});
    EXPECT_EQ(sheetNames(), (std::vector<std::string>{"a", "c", "e"}));

    // 任一序号越界时不删除任何工作表
    EXPECT_THROW(workbook_->removeSheetsAt({0, 7}), ParameterException);
    EXPECT_EQ(workbook_->getNumberOfSheets(), 3u);
}

// 测试11: 被删除工作表的句柄
TEST_F(WorkbookSheetsTest, RemovedSheetHandleThrows) {
    createSheets({"a", "b"});
    auto b = workbook_->getSheet("b");
    workbook_->removeSheetAt(1);
    EXPECT_THROW(b->getName(), InvalidStateException);
    EXPECT_THROW(b->setCellNumber(0, 0, 1.0), InvalidStateException);
}

// 测试12: 公式中对已删除工作表的引用变为 #REF!
TEST_F(WorkbookSheetsTest, FormulasReferencingRemovedSheetDegrade) {
    createSheets({"Data", "Summary"});
    auto summary = workbook_->getSheet("Summary");
    summary->setCellFormula(0, 0, "SUM(Data!A1:A3)+1");
    summary->setCellFormula(1, 0, "B1*2");

    workbook_->removeSheetAt(0);
    EXPECT_EQ(summary->getCellFormula(0, 0), "SUM(#REF!A1:A3)+1");
    EXPECT_EQ(summary->getCellFormula(1, 0), "B1*2");

    auto reloaded = Workbook::open(workbook_->getBytes());
    EXPECT_EQ(reloaded->getSheetAt(0)->getCellFormula(0, 0), "SUM(#REF!A1:A3)+1");
}

// 测试13: 克隆与删除维护图片引用计数
TEST_F(WorkbookSheetsTest, PictureReferenceCountsFollowCloneAndRemove) {
    auto workbook = workbookWithPicture();
    ASSERT_EQ(workbook->getNumberOfPictures(), 1u);
    EXPECT_EQ(workbook->getPictureReferenceCount(1), 1u);

    // N 次克隆后引用计数为 N + 1
    workbook->cloneSheet(0);
    EXPECT_EQ(workbook->getPictureReferenceCount(1), 2u);
    workbook->cloneSheet(0);
    EXPECT_EQ(workbook->getPictureReferenceCount(1), 3u);
    ASSERT_EQ(workbook->getNumberOfSheets(), 3u);

    auto reloaded = Workbook::open(workbook->getBytes());
    EXPECT_EQ(reloaded->getPictureReferenceCount(1), 3u);

    reloaded->removeSheetAt(2);
    EXPECT_EQ(reloaded->getPictureReferenceCount(1), 2u);
    reloaded->removeSheetAt(1);
    EXPECT_EQ(reloaded->getPictureReferenceCount(1), 1u);

    EXPECT_THROW(reloaded->getPictureReferenceCount(2), ParameterException);
}

} // namespace core
} // namespace fastxls
