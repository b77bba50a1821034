#pragma once

#include "fastxls/record/Record.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fastxls {
namespace model {

/**
 * @brief 工作簿级图片存储（MSODRAWINGGROUP 中的 BLIP 存储）
 *
 * 每个 BSE 项带引用计数 cRef。克隆工作表时共享图片只增加计数，不复制图片数据；
 * 删除工作表时减少计数，降到 0 后项仍保留（格式本身没有回收机制）。
 *
 * 对象只在一次操作内有效：它保存指向工作簿全局记录的指针。
 */
class PictureStore {
public:
    explicit PictureStore(std::vector<record::DrawingGroupRecord*> groups);

    /**
     * @brief BSE 项个数
     */
    size_t size() const { return ref_offsets_.size(); }

    /**
     * @param pib 图片编号，从 1 开始
     * @throws ParameterException 编号超出范围
     */
    uint32_t refCount(uint32_t pib) const;

    void addRef(uint32_t pib);

    /**
     * @brief 减少计数，已为 0 时保持 0
     */
    void release(uint32_t pib);

    /**
     * @brief 在工作表绘图数据中查找形状引用的图片编号（FOPT 属性 pib）
     */
    static std::vector<uint32_t> collectPictureIds(const std::vector<uint8_t>& escher);

private:
    size_t slotFor(uint32_t pib) const;
    uint8_t byteAt(size_t offset) const;
    void setByteAt(size_t offset, uint8_t value);
    uint32_t readU32At(size_t offset) const;
    void writeU32At(size_t offset, uint32_t value);

    std::vector<record::DrawingGroupRecord*> groups_;
    std::vector<size_t> ref_offsets_;   // cRef 在拼接后数据中的偏移
};

} // namespace model
} // namespace fastxls
