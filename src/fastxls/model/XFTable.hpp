#pragma once

#include "fastxls/core/Expected.hpp"
#include "fastxls/record/Records.hpp"

#include <cstddef>
#include <vector>

namespace fastxls {
namespace model {

/**
 * @brief 单元格样式（XF）表，容量有上限
 *
 * 已满时 tryAdd() 返回 CapacityExceeded 错误，表保持不变。
 */
class XFTable {
public:
    explicit XFTable(size_t capacity);

    void load(std::vector<record::XFRecord> records);

    size_t size() const { return records_.size(); }
    size_t capacity() const { return capacity_; }
    bool full() const { return records_.size() >= capacity_; }

    /**
     * @throws ParameterException 索引越界
     */
    const record::XFRecord& at(size_t index) const;

    /**
     * @return 新样式的索引
     */
    core::Result<int> tryAdd(const record::XFRecord& xf);

    const std::vector<record::XFRecord>& records() const { return records_; }

    /**
     * @brief 新建工作簿的 21 个内置 XF（15 个样式 XF、1 个默认单元格 XF、5 个内置数字格式样式）
     */
    static std::vector<record::XFRecord> builtIn();

private:
    std::vector<record::XFRecord> records_;
    size_t capacity_;
};

} // namespace model
} // namespace fastxls
