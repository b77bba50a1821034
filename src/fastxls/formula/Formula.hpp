#pragma once

#include "fastxls/formula/Ptg.hpp"
#include "fastxls/utils/LittleEndian.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace fastxls {
namespace formula {

/**
 * @brief 已解析的公式（记号序列）
 *
 * 所有记号都能识别时以记号列表形式保存，可以改写引用；
 * 出现未建模的记号时整条公式按原始字节保存（opaque），逐字节写回。
 */
class Formula {
public:
    Formula() = default;
    explicit Formula(std::vector<Ptg> tokens);

    /**
     * @brief 从记录负载中读取 cce 字节的记号
     * @throws FormatException 记录剩余长度不足 cce
     */
    static Formula read(utils::ByteReader& reader, uint16_t cce);

    /**
     * @brief 写出记号字节（不含 cce 长度字段）
     */
    void write(utils::ByteWriter& writer) const;

    /**
     * @brief 记号字节数，即记录中的 cce
     */
    uint16_t encodedSize() const;

    bool empty() const { return opaque_ ? raw_.empty() : tokens_.empty(); }
    bool isOpaque() const noexcept { return opaque_; }

    const std::vector<Ptg>& tokens() const { return tokens_; }

    /**
     * @brief 把指向已删除工作表的三维引用降级为 #REF! 记号
     * @param is_deleted 判断外部工作表索引是否指向已删除工作表
     * @return 被降级的记号数
     */
    size_t degradeReferences(const std::function<bool(uint16_t)>& is_deleted);

    /**
     * @brief 把三维引用中的外部工作表索引 from 替换为 to
     * @return 被改写的记号数
     */
    size_t replaceExternIndex(uint16_t from, uint16_t to);

    /**
     * @brief 名称表删除第 index 个名称（从 1 开始）后修正名称记号
     *
     * 指向被删名称的记号改为等长的 #REF! 记号，其后的名称索引减一。
     * @return 被改写的记号数
     */
    size_t removeNameIndex(uint16_t index);

    /**
     * @brief 是否有引用（含已降级的）使用给定的外部工作表索引
     */
    bool usesExternIndex(uint16_t extern_index) const;

    bool operator==(const Formula& other) const;
    bool operator!=(const Formula& other) const { return !(*this == other); }

private:
    std::vector<Ptg> tokens_;
    std::vector<uint8_t> raw_;
    bool opaque_ = false;
};

} // namespace formula
} // namespace fastxls
