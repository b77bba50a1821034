#include "fastxls/model/LinkTable.hpp"
#include "fastxls/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace fastxls {
namespace model {

using record::ExternSheetRecord;
using record::SupBookRecord;

class LinkTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastxls::Logger::getInstance().initialize("logs/LinkTable_test.log",
                                                  fastxls::Logger::Level::DEBUG,
                                                  false);
    }

    void TearDown() override {
        fastxls::Logger::getInstance().shutdown();
    }

    // 辅助函数：从输出中取 EXTERNSHEET
    static const ExternSheetRecord& externSheetOf(const std::vector<record::Record>& records) {
        const ExternSheetRecord* found = nullptr;
        for (const record::Record& r : records) {
            if (const auto* es = record::recordAs<ExternSheetRecord>(r)) {
                found = es;
            }
        }
        if (!found) {
            throw std::runtime_error("EXTERNSHEET missing from link table output");
        }
        return *found;
    }
};

// 测试1: 空表不产生任何记录
TEST_F(LinkTableTest, EmptyTableEmitsNothing) {
    LinkTable table;
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.externCount(), 0u);
    EXPECT_TRUE(table.emit({10, 11}).empty());
}

// 测试2: 首次引用时新建本工作簿 SUPBOOK，重复引用复用同一项
TEST_F(LinkTableTest, FindOrCreateReusesEntries) {
    LinkTable table;
    const uint16_t first = table.findOrCreateExternIndex(11, 3);
    const uint16_t second = table.findOrCreateExternIndex(12, 3);
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
    EXPECT_EQ(table.findOrCreateExternIndex(11, 3), first);
    EXPECT_FALSE(table.empty());
    EXPECT_EQ(table.externCount(), 2u);
    EXPECT_EQ(table.sheetForExternIndex(second), std::optional<SheetId>(12));
    EXPECT_FALSE(table.sheetForExternIndex(5).has_value());
}

// 测试3: 写出时按当前序号换算，排序后引用仍指向同一工作表
TEST_F(LinkTableTest, EmitUsesCurrentSheetOrder) {
    LinkTable table;
    table.findOrCreateExternIndex(12, 3);

    std::vector<record::Record> out = table.emit({10, 11, 12});
    ASSERT_EQ(out.size(), 2u);
    const SupBookRecord* supbook = record::recordAs<SupBookRecord>(out[0]);
    ASSERT_NE(supbook, nullptr);
    EXPECT_TRUE(supbook->isInternal());
    EXPECT_EQ(supbook->sheet_count, 3);
    EXPECT_EQ(externSheetOf(out).refs[0].first_sheet, 2);

    out = table.emit({12, 10, 11});
    EXPECT_EQ(externSheetOf(out).refs[0].first_sheet, 0);
    EXPECT_EQ(externSheetOf(out).refs[0].last_sheet, 0);
}

// 测试4: 删除工作表后对应项写出 0xFFFF
TEST_F(LinkTableTest, DeletedSheetEmitsSentinel) {
    LinkTable table;
    const uint16_t ix = table.findOrCreateExternIndex(11, 2);
    table.findOrCreateExternIndex(10, 2);

    EXPECT_EQ(table.markSheetDeleted(11), 1u);
    EXPECT_TRUE(table.isDeleted(ix));
    EXPECT_FALSE(table.sheetForExternIndex(ix).has_value());
    EXPECT_EQ(table.markSheetDeleted(11), 0u);

    const std::vector<record::Record> out = table.emit({10});
    const ExternSheetRecord& es = externSheetOf(out);
    ASSERT_EQ(es.refs.size(), 2u);
    EXPECT_EQ(es.refs[0].first_sheet, ExternSheetRecord::kDeletedSheet);
    EXPECT_EQ(es.refs[0].last_sheet, ExternSheetRecord::kDeletedSheet);
    EXPECT_EQ(es.refs[1].first_sheet, 0);

    // 已删除的项不会被复用
    EXPECT_EQ(table.findOrCreateExternIndex(10, 1), 1);
}

// 测试5: 加载的外部工作簿项原样写回，本工作簿项按 SheetId 跟踪
TEST_F(LinkTableTest, LoadKeepsExternalEntriesRaw) {
    SupBookRecord external;
    external.sheet_count = 1;
    external.body = {0x01, 0x00, 0x00, 0x41};

    ExternSheetRecord es;
    es.refs.push_back({0, 0, 0});   // 外部工作簿
    es.refs.push_back({1, 1, 1});   // 本工作簿第二张
    es.refs.push_back({1, 0xFFFF, 0xFFFF});

    std::vector<record::Record> records;
    records.push_back(external);
    records.push_back(SupBookRecord::createInternal(2));
    records.push_back(es);

    LinkTable table = LinkTable::load(records, {20, 21});
    EXPECT_EQ(table.externCount(), 3u);
    EXPECT_FALSE(table.sheetForExternIndex(0).has_value());
    EXPECT_EQ(table.sheetForExternIndex(1), std::optional<SheetId>(21));
    EXPECT_TRUE(table.isDeleted(2));
    EXPECT_EQ(table.findOrCreateExternIndex(21, 2), 1);

    const std::vector<record::Record> out = table.emit({21, 20});
    ASSERT_EQ(out.size(), 3u);
    const ExternSheetRecord& written = externSheetOf(out);
    EXPECT_EQ(written.refs[0].supbook_index, 0);
    EXPECT_EQ(written.refs[0].first_sheet, 0);
    EXPECT_EQ(written.refs[1].supbook_index, 1);
    EXPECT_EQ(written.refs[1].first_sheet, 0);
    EXPECT_EQ(written.refs[2].first_sheet, ExternSheetRecord::kDeletedSheet);
}

// 测试6: 调整顺序后区间项的端点按升序写出
TEST_F(LinkTableTest, RangeEndpointsAreWrittenInOrder) {
    ExternSheetRecord es;
    es.refs.push_back({0, 0, 2});

    std::vector<record::Record> records;
    records.push_back(SupBookRecord::createInternal(3));
    records.push_back(es);

    LinkTable table = LinkTable::load(records, {30, 31, 32});
    EXPECT_EQ(table.sheetForExternIndex(0), std::optional<SheetId>(30));

    // 30 移到最后、32 移到最前
    const std::vector<record::Record> reversed_out = table.emit({32, 31, 30});
    const ExternSheetRecord& reversed = externSheetOf(reversed_out);
    ASSERT_EQ(reversed.refs.size(), 1u);
    EXPECT_EQ(reversed.refs[0].first_sheet, 0);
    EXPECT_EQ(reversed.refs[0].last_sheet, 2);

    const std::vector<record::Record> narrowed_out = table.emit({31, 32, 30});
    const ExternSheetRecord& narrowed = externSheetOf(narrowed_out);
    EXPECT_EQ(narrowed.refs[0].first_sheet, 1);
    EXPECT_EQ(narrowed.refs[0].last_sheet, 2);
}

} // namespace model
} // namespace fastxls
