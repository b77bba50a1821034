#pragma once

#include "fastxls/record/Record.hpp"
#include "fastxls/utils/LittleEndian.hpp"

#include <cstdint>
#include <vector>

namespace fastxls {
namespace record {

/**
 * @brief 工作簿流编解码器
 *
 * 解码：合并 CONTINUE 分片（记住分片边界），按 sid 分派到类型化记录；
 * 类型化解析失败的记录降级为 UnknownRecord。最后一个 EOF 之后的多余字节
 * （含不完整的记录头）只记录警告。
 *
 * 编码：先按声明长度求和一次性分配，再逐条序列化并核对实际写出的字节数，
 * 第一处不一致即抛出 SizeMismatchException，不返回任何部分结果。
 */
class RecordCodec {
public:
    /**
     * @throws FormatException 最后一个 EOF 之前记录越过流末尾
     */
    static std::vector<Record> decode(const std::vector<uint8_t>& stream);
    static std::vector<Record> decode(const uint8_t* data, size_t size);

    /**
     * @brief 记录编码后的字节数，含记录头及 CONTINUE 头
     */
    static size_t encodedSize(const Record& record);

    static size_t encodedSize(const std::vector<Record>& records);

    /**
     * @throws SizeMismatchException 声明长度与实际序列化长度不一致
     */
    static std::vector<uint8_t> encode(const std::vector<Record>& records);

    /**
     * @brief 追加到调用方的缓冲区；出错时缓冲区恢复到调用前的长度
     * @return 本次写入的字节数
     */
    static size_t encodeInto(const std::vector<Record>& records, utils::ByteWriter& out);

private:
    static Record parseRecord(uint16_t sid, std::vector<uint8_t> data, std::vector<uint16_t> fragments);
    static std::vector<size_t> fragmentSizes(const Record& record);
    static void writeRecord(const Record& record, utils::ByteWriter& out, utils::ByteWriter& scratch);
};

} // namespace record
} // namespace fastxls
