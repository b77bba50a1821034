#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <utility>

namespace fastxls {
namespace model {

/**
 * @brief 工作表标签的活动/选中状态
 *
 * 活动与选中是两个独立的标志：setActive() 不会把工作表加入选中集合。
 * 至少有一张工作表时恰有一个活动标签；只剩一张工作表时它总是既活动又选中。
 * 序号的合法性由调用方（InternalWorkbook）检查。
 */
class SelectionState {
public:
    std::optional<size_t> activeTab() const { return active_; }
    const std::set<size_t>& selectedTabs() const { return selected_; }
    size_t firstVisibleTab() const { return first_visible_; }

    bool isSelected(size_t index) const { return selected_.count(index) != 0; }
    bool isActive(size_t index) const { return active_ && *active_ == index; }

    /**
     * @brief 从加载的 WINDOW1 / WINDOW2 重建
     */
    void reset(size_t sheet_count, std::optional<size_t> active, std::set<size_t> selected, size_t first_visible);

    void setActive(size_t index) { active_ = index; }
    void setSelected(size_t index);
    void setSelectedTabs(std::set<size_t> indices) { selected_ = std::move(indices); }
    void setFirstVisible(size_t index) { first_visible_ = index; }

    /**
     * @brief 追加了一张工作表，sheet_count 为追加后的数量
     */
    void onSheetAppended(size_t sheet_count);

    /**
     * @brief 删除了 index 处的工作表，sheet_count 为删除后的数量
     */
    void onSheetRemoved(size_t index, size_t sheet_count);

    /**
     * @brief 工作表从 from 移到 to，所有序号跟随它们指向的工作表
     */
    void onSheetMoved(size_t from, size_t to);

private:
    std::optional<size_t> active_;
    std::set<size_t> selected_;
    size_t first_visible_ = 0;
};

} // namespace model
} // namespace fastxls
