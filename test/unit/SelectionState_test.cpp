#include "fastxls/model/SelectionState.hpp"
#include "fastxls/utils/Logger.hpp"
#include <gtest/gtest.h>

namespace fastxls {
namespace model {

class SelectionStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastxls::Logger::getInstance().initialize("logs/SelectionState_test.log",
                                                  fastxls::Logger::Level::DEBUG,
                                                  false);
    }

    void TearDown() override {
        fastxls::Logger::getInstance().shutdown();
    }

    // 辅助函数：追加 count 张工作表
    static SelectionState withSheets(size_t count) {
        SelectionState state;
        for (size_t n = 1; n <= count; ++n) {
            state.onSheetAppended(n);
        }
        return state;
    }
};

// 测试1: 第一张工作表自动成为活动且选中
TEST_F(SelectionStateTest, FirstSheetBecomesActiveAndSelected) {
    SelectionState state = withSheets(3);
    ASSERT_TRUE(state.activeTab().has_value());
    EXPECT_EQ(*state.activeTab(), 0u);
    EXPECT_EQ(state.selectedTabs(), std::set<size_t>({0}));
    EXPECT_EQ(state.firstVisibleTab(), 0u);
}

// 测试2: 活动与选中相互独立
TEST_F(SelectionStateTest, ActiveAndSelectedAreIndependent) {
    SelectionState state = withSheets(3);
    state.setActive(2);
    EXPECT_TRUE(state.isActive(2));
    EXPECT_FALSE(state.isSelected(2));
    EXPECT_TRUE(state.isSelected(0));

    state.setSelected(1);
    EXPECT_EQ(state.selectedTabs(), std::set<size_t>({1}));
    EXPECT_TRUE(state.isActive(2));
}

// 测试3: 删除活动工作表时活动标签落到相邻工作表
TEST_F(SelectionStateTest, RemovingActiveSheetPicksNeighbour) {
    SelectionState state = withSheets(4);
    state.setActive(1);
    state.setSelected(1);

    state.onSheetRemoved(1, 3);
    EXPECT_EQ(*state.activeTab(), 1u);
    EXPECT_EQ(state.selectedTabs(), std::set<size_t>({1}));

    // 删除最后一张时取新的最后一张
    state.setActive(2);
    state.setSelected(2);
    state.onSheetRemoved(2, 2);
    EXPECT_EQ(*state.activeTab(), 1u);
    EXPECT_EQ(state.selectedTabs(), std::set<size_t>({1}));
}

// 测试4: 删除前面的工作表时序号左移
TEST_F(SelectionStateTest, RemovingEarlierSheetShiftsIndices) {
    SelectionState state = withSheets(5);
    state.setActive(3);
    state.setSelectedTabs({2, 4});
    state.setFirstVisible(3);

    state.onSheetRemoved(0, 4);
    EXPECT_EQ(*state.activeTab(), 2u);
    EXPECT_EQ(state.selectedTabs(), std::set<size_t>({1, 3}));
    EXPECT_EQ(state.firstVisibleTab(), 2u);
}

// 测试5: 删除未选中的工作表不改变选中集合的成员
TEST_F(SelectionStateTest, RemovingUnselectedSheetKeepsSelection) {
    SelectionState state = withSheets(3);
    state.setActive(0);
    state.setSelected(0);

    state.onSheetRemoved(2, 2);
    EXPECT_EQ(*state.activeTab(), 0u);
    EXPECT_EQ(state.selectedTabs(), std::set<size_t>({0}));
}

// 测试6: 首个可见标签越界时回退
TEST_F(SelectionStateTest, FirstVisibleTabClampedOnRemoval) {
    SelectionState state = withSheets(3);
    state.setFirstVisible(2);
    state.onSheetRemoved(2, 2);
    EXPECT_EQ(state.firstVisibleTab(), 1u);

    state.setFirstVisible(0);
    state.onSheetRemoved(1, 1);
    EXPECT_EQ(state.firstVisibleTab(), 0u);
}

// 测试7: 只剩一张工作表时它既活动又选中
TEST_F(SelectionStateTest, LastRemainingSheetIsActiveAndSelected) {
    SelectionState state = withSheets(2);
    state.setActive(0);
    state.setSelected(0);

    state.onSheetRemoved(0, 1);
    EXPECT_EQ(*state.activeTab(), 0u);
    EXPECT_EQ(state.selectedTabs(), std::set<size_t>({0}));

    state.onSheetRemoved(0, 0);
    EXPECT_FALSE(state.activeTab().has_value());
    EXPECT_TRUE(state.selectedTabs().empty());
}

// 测试8: 移动工作表时序号跟随
TEST_F(SelectionStateTest, MovingSheetsKeepsTabsOnTheirSheets) {
    SelectionState state = withSheets(4);
    state.setActive(0);
    state.setSelectedTabs({0, 2});
    state.setFirstVisible(1);

    state.onSheetMoved(0, 3);
    EXPECT_EQ(*state.activeTab(), 3u);
    EXPECT_EQ(state.selectedTabs(), std::set<size_t>({1, 3}));
    EXPECT_EQ(state.firstVisibleTab(), 0u);

    state.onSheetMoved(3, 1);
    EXPECT_EQ(*state.activeTab(), 1u);
    EXPECT_EQ(state.selectedTabs(), std::set<size_t>({1, 2}));
}

// 测试9: 从加载的窗口记录重建
TEST_F(SelectionStateTest, ResetClampsLoadedValues) {
    SelectionState state;
    state.reset(3, 7, {1, 5}, 9);
    EXPECT_EQ(*state.activeTab(), 2u);
    EXPECT_EQ(state.selectedTabs(), std::set<size_t>({1}));
    EXPECT_EQ(state.firstVisibleTab(), 2u);

    state.reset(1, std::nullopt, {}, 0);
    EXPECT_EQ(*state.activeTab(), 0u);
    EXPECT_EQ(state.selectedTabs(), std::set<size_t>({0}));
}

} // namespace model
} // namespace fastxls
