#include "fastxls/model/SelectionState.hpp"

#include <algorithm>

namespace fastxls {
namespace model {

namespace {

// 元素从 from 移到 to 之后，原序号 index 的新位置
size_t movedIndex(size_t index, size_t from, size_t to) {
    if (index == from) {
        return to;
    }
    if (from < to && index > from && index <= to) {
        return index - 1;
    }
    if (to < from && index >= to && index < from) {
        return index + 1;
    }
    return index;
}

} // namespace

void SelectionState::reset(size_t sheet_count, std::optional<size_t> active,
                           std::set<size_t> selected, size_t first_visible) {
    selected_.clear();
    for (size_t index : selected) {
        if (index < sheet_count) {
            selected_.insert(index);
        }
    }
    if (sheet_count == 0) {
        active_.reset();
        first_visible_ = 0;
        return;
    }
    active_ = std::min(active.value_or(0), sheet_count - 1);
    first_visible_ = std::min(first_visible, sheet_count - 1);
    if (sheet_count == 1) {
        selected_ = {0};
    }
}

void SelectionState::setSelected(size_t index) {
    selected_.clear();
    selected_.insert(index);
}

void SelectionState::onSheetAppended(size_t sheet_count) {
    if (sheet_count == 1) {
        active_ = 0;
        selected_ = {0};
        first_visible_ = 0;
    }
}

void SelectionState::onSheetRemoved(size_t index, size_t sheet_count) {
    const bool was_selected = selected_.count(index) != 0;

    std::set<size_t> shifted;
    for (size_t i : selected_) {
        if (i < index) {
            shifted.insert(i);
        } else if (i > index) {
            shifted.insert(i - 1);
        }
    }
    selected_ = std::move(shifted);

    if (sheet_count == 0) {
        active_.reset();
        selected_.clear();
        first_visible_ = 0;
        return;
    }

    // 离被删工作表最近的剩余工作表
    const size_t replacement = std::min(index, sheet_count - 1);

    if (was_selected && selected_.empty()) {
        selected_.insert(replacement);
    }

    if (active_) {
        if (*active_ == index) {
            active_ = replacement;
        } else if (*active_ > index) {
            active_ = *active_ - 1;
        }
    } else {
        active_ = replacement;
    }

    if (first_visible_ > index || first_visible_ >= sheet_count) {
        first_visible_ = first_visible_ > 0 ? first_visible_ - 1 : 0;
    }

    if (sheet_count == 1) {
        active_ = 0;
        selected_ = {0};
    }
}

void SelectionState::onSheetMoved(size_t from, size_t to) {
    if (from == to) {
        return;
    }
    if (active_) {
        active_ = movedIndex(*active_, from, to);
    }
    std::set<size_t> moved;
    for (size_t i : selected_) {
        moved.insert(movedIndex(i, from, to));
    }
    selected_ = std::move(moved);
    first_visible_ = movedIndex(first_visible_, from, to);
}

} // namespace model
} // namespace fastxls
