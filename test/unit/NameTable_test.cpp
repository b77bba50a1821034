#include "fastxls/model/NameTable.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/Logger.hpp"
#include <gtest/gtest.h>

namespace fastxls {
namespace model {

class NameTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastxls::Logger::getInstance().initialize("logs/NameTable_test.log",
                                                  fastxls::Logger::Level::DEBUG,
                                                  false);
    }

    void TearDown() override {
        fastxls::Logger::getInstance().shutdown();
    }

    static record::NameRecord named(const std::string& text) {
        record::NameRecord nr;
        nr.name = text;
        return nr;
    }
};

// 测试1: 空名称表与越界索引给出不同的异常
TEST_F(NameTableTest, IndexErrors) {
    NameTable table;
    EXPECT_THROW(table.at(0), core::InvalidStateException);

    table.add(named("Data"), std::nullopt);
    EXPECT_NO_THROW(table.at(0));
    try {
        table.at(1);
        FAIL() << "Expected ParameterException";
    } catch (const core::ParameterException& e) {
        EXPECT_EQ(std::string(e.what()), "Specified name index 1 is outside the allowable range (0..0)");
    }
}

// 测试2: 标识在删除其他名称后保持不变
TEST_F(NameTableTest, IdsAreStable) {
    NameTable table;
    const NameId first = table.add(named("First"), std::nullopt).id;
    const NameId second = table.add(named("Second"), std::nullopt).id;
    EXPECT_NE(first, second);

    table.removeAt(0);
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.indexOfId(second), 0);
    EXPECT_EQ(table.indexOfId(first), -1);
    EXPECT_EQ(table.findById(first), nullptr);
    ASSERT_NE(table.findById(second), nullptr);
    EXPECT_EQ(table.findById(second)->record.name, "Second");

    const NameId third = table.add().id;
    EXPECT_NE(third, first);
    EXPECT_NE(third, second);
}

// 测试3: 查找大小写不敏感，重复检查区分作用域
TEST_F(NameTableTest, LookupAndScopedDuplicates) {
    NameTable table;
    const NameId global = table.add(named("Total"), std::nullopt).id;
    table.add(named("Total"), SheetId{7});

    EXPECT_EQ(table.indexOf("TOTAL"), 0);
    EXPECT_EQ(table.indexOf("missing"), -1);

    EXPECT_TRUE(table.contains("total", std::nullopt));
    EXPECT_TRUE(table.contains("total", SheetId{7}));
    EXPECT_FALSE(table.contains("total", SheetId{8}));
    EXPECT_FALSE(table.contains("total", std::nullopt, global));
}

// 测试4: 内置名称按内置名显示和查找
TEST_F(NameTableTest, BuiltInNamesUseTheirBuiltInText) {
    NameTable table;
    table.add(record::NameRecord::createBuiltIn(record::NameRecord::PrintArea, 1), SheetId{3});
    table.add(record::NameRecord::createBuiltIn(record::NameRecord::FilterDatabase, 1), SheetId{3});

    EXPECT_EQ(NameTable::displayText(table.at(0).record), "Print_Area");
    EXPECT_EQ(NameTable::displayText(table.at(1).record), "_FilterDatabase");
    EXPECT_EQ(table.indexOf("print_area"), 0);

    EXPECT_EQ(NameTable::displayText(record::NameRecord::createBuiltIn(0x30, 0)), "Unknown_BuiltIn_48");
}

// 测试5: 名称文本合法性
TEST_F(NameTableTest, NameValidation) {
    EXPECT_TRUE(NameTable::isValidName("Sales"));
    EXPECT_TRUE(NameTable::isValidName("_hidden.value"));
    EXPECT_TRUE(NameTable::isValidName("\\backslash"));
    EXPECT_TRUE(NameTable::isValidName("ABCD1"));

    EXPECT_FALSE(NameTable::isValidName(""));
    EXPECT_FALSE(NameTable::isValidName("1st"));
    EXPECT_FALSE(NameTable::isValidName("has space"));
    EXPECT_FALSE(NameTable::isValidName("A1"));
    EXPECT_FALSE(NameTable::isValidName("$B$2"));
    EXPECT_FALSE(NameTable::isValidName("true"));
    EXPECT_FALSE(NameTable::isValidName(std::string(256, 'a')));
}

} // namespace model
} // namespace fastxls
