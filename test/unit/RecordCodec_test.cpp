#include "fastxls/record/RecordCodec.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace fastxls {
namespace record {

namespace {

// 声明长度与实际写出不一致的外部记录
class LyingRecord : public IExternalRecord {
public:
    LyingRecord(size_t declared, size_t actual) : declared_(declared), actual_(actual) {}

    uint16_t sid() const override { return 0x1002; }
    size_t dataSize() const override { return declared_; }
    void serialize(utils::ByteWriter& out) const override { out.writeZeros(actual_); }

private:
    size_t declared_;
    size_t actual_;
};

} // namespace

class RecordCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastxls::Logger::getInstance().initialize("logs/RecordCodec_test.log",
                                                  fastxls::Logger::Level::DEBUG,
                                                  false);
    }

    void TearDown() override {
        fastxls::Logger::getInstance().shutdown();
    }

    // 辅助函数：追加一条原始记录
    static void appendRaw(std::vector<uint8_t>& out, uint16_t sid, const std::vector<uint8_t>& payload) {
        out.push_back(static_cast<uint8_t>(sid & 0xFF));
        out.push_back(static_cast<uint8_t>(sid >> 8));
        out.push_back(static_cast<uint8_t>(payload.size() & 0xFF));
        out.push_back(static_cast<uint8_t>(payload.size() >> 8));
        out.insert(out.end(), payload.begin(), payload.end());
    }

    static std::vector<uint8_t> bofPayload(uint16_t version, uint16_t type) {
        std::vector<uint8_t> payload = {
            static_cast<uint8_t>(version & 0xFF), static_cast<uint8_t>(version >> 8),
            static_cast<uint8_t>(type & 0xFF), static_cast<uint8_t>(type >> 8)};
        payload.resize(16, 0);
        return payload;
    }

    static std::vector<uint8_t> minimalStream() {
        std::vector<uint8_t> stream;
        appendRaw(stream, sid::BOF, bofPayload(0x0600, BOFRecord::Workbook));
        appendRaw(stream, 0x0042, {0xE4, 0x04});   // CODEPAGE
        appendRaw(stream, sid::EOF_, {});
        return stream;
    }
};

// 测试1: 解码后再编码得到相同字节
TEST_F(RecordCodecTest, DecodeEncodeIsLossless) {
    const std::vector<uint8_t> stream = minimalStream();
    const std::vector<Record> records = RecordCodec::decode(stream);

    ASSERT_EQ(records.size(), 3u);
    const BOFRecord* bof = recordAs<BOFRecord>(records[0]);
    ASSERT_NE(bof, nullptr);
    EXPECT_EQ(bof->version, BOFRecord::kBiff8Version);
    EXPECT_EQ(bof->type, BOFRecord::Workbook);

    const UnknownRecord* codepage = recordAs<UnknownRecord>(records[1]);
    ASSERT_NE(codepage, nullptr);
    EXPECT_EQ(codepage->record_sid, 0x0042);
    EXPECT_NE(recordAs<EOFRecord>(records[2]), nullptr);

    EXPECT_EQ(RecordCodec::encodedSize(records), stream.size());
    EXPECT_EQ(RecordCodec::encode(records), stream);
}

// 测试2: 超过 8224 字节的负载拆分为 CONTINUE
TEST_F(RecordCodecTest, LargePayloadIsSplitIntoContinueRecords) {
    std::vector<uint8_t> payload(20000);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i % 253);
    }
    std::vector<Record> records;
    records.push_back(BOFRecord::create(BOFRecord::Workbook));
    records.push_back(UnknownRecord::make(0x00FC, payload));
    records.push_back(EOFRecord{});

    const size_t bof_size = 4 + 16;
    EXPECT_EQ(RecordCodec::encodedSize(records[1]), payload.size() + 3 * 4);

    const std::vector<uint8_t> bytes = RecordCodec::encode(records);
    ASSERT_EQ(bytes.size(), RecordCodec::encodedSize(records));

    // 第一片长度 8224，随后是 CONTINUE
    EXPECT_EQ(utils::readU16LE(bytes.data() + bof_size), 0x00FC);
    EXPECT_EQ(utils::readU16LE(bytes.data() + bof_size + 2), kMaxRecordDataSize);
    const size_t second = bof_size + 4 + kMaxRecordDataSize;
    EXPECT_EQ(utils::readU16LE(bytes.data() + second), sid::CONTINUE);
    EXPECT_EQ(utils::readU16LE(bytes.data() + second + 2), kMaxRecordDataSize);

    const std::vector<Record> decoded = RecordCodec::decode(bytes);
    ASSERT_EQ(decoded.size(), 3u);
    const UnknownRecord* merged = recordAs<UnknownRecord>(decoded[1]);
    ASSERT_NE(merged, nullptr);
    EXPECT_EQ(merged->data, payload);
    EXPECT_EQ(merged->fragments.size(), 3u);
}

// 测试3: 原有的分片边界在重新编码时保留
TEST_F(RecordCodecTest, OriginalFragmentBoundariesArePreserved) {
    std::vector<uint8_t> stream;
    appendRaw(stream, sid::BOF, bofPayload(0x0600, BOFRecord::Workbook));
    appendRaw(stream, sid::SST, std::vector<uint8_t>(10, 0x11));
    appendRaw(stream, sid::CONTINUE, std::vector<uint8_t>(5, 0x22));
    appendRaw(stream, sid::EOF_, {});

    const std::vector<Record> records = RecordCodec::decode(stream);
    ASSERT_EQ(records.size(), 3u);
    const UnknownRecord* sst = recordAs<UnknownRecord>(records[1]);
    ASSERT_NE(sst, nullptr);
    EXPECT_EQ(sst->data.size(), 15u);
    EXPECT_EQ(RecordCodec::encode(records), stream);
}

// 测试4: 最后一个 EOF 之后的多余字节被忽略
TEST_F(RecordCodecTest, TrailingBytesAfterFinalEofAreIgnored) {
    std::vector<uint8_t> stream = minimalStream();
    stream.push_back(0x00);
    stream.push_back(0x00);
    stream.push_back(0x00);

    std::vector<Record> records;
    EXPECT_NO_THROW(records = RecordCodec::decode(stream));
    EXPECT_EQ(records.size(), 3u);

    // 看起来像 BOF 但长度超出剩余字节的尾部数据同样忽略
    std::vector<uint8_t> bof_like = minimalStream();
    bof_like.insert(bof_like.end(), {0x09, 0x08, 0x10, 0x00, 0x00, 0x06});
    records.clear();
    EXPECT_NO_THROW(records = RecordCodec::decode(bof_like));
    EXPECT_EQ(records.size(), 3u);
}

// 测试5: EOF 之前的截断记录
TEST_F(RecordCodecTest, TruncatedRecordBeforeEofThrows) {
    std::vector<uint8_t> stream;
    appendRaw(stream, sid::BOF, bofPayload(0x0600, BOFRecord::Workbook));
    appendRaw(stream, 0x0042, {0xE4, 0x04});
    stream.resize(stream.size() - 1);
    EXPECT_THROW(RecordCodec::decode(stream), core::FormatException);

    std::vector<uint8_t> header_only;
    appendRaw(header_only, sid::BOF, bofPayload(0x0600, BOFRecord::Workbook));
    header_only.push_back(0x42);
    EXPECT_THROW(RecordCodec::decode(header_only), core::FormatException);
}

// 测试6: 缺少最后的 EOF 只记录警告
TEST_F(RecordCodecTest, MissingFinalEofIsTolerated) {
    std::vector<uint8_t> stream;
    appendRaw(stream, sid::BOF, bofPayload(0x0600, BOFRecord::Workbook));
    appendRaw(stream, 0x0042, {0xE4, 0x04});

    std::vector<Record> records;
    EXPECT_NO_THROW(records = RecordCodec::decode(stream));
    EXPECT_EQ(records.size(), 2u);
}

// 测试7: 类型化解析失败的记录降级为原样保存
TEST_F(RecordCodecTest, MalformedTypedRecordIsKeptOpaque) {
    std::vector<uint8_t> stream;
    appendRaw(stream, sid::BOF, bofPayload(0x0600, BOFRecord::Workbook));
    appendRaw(stream, sid::WINDOW1, {0x01, 0x02, 0x03});
    appendRaw(stream, sid::EOF_, {});

    const std::vector<Record> records = RecordCodec::decode(stream);
    ASSERT_EQ(records.size(), 3u);
    const UnknownRecord* window = recordAs<UnknownRecord>(records[1]);
    ASSERT_NE(window, nullptr);
    EXPECT_EQ(window->record_sid, sid::WINDOW1);
    EXPECT_EQ(RecordCodec::encode(records), stream);
}

// 测试8: 声明长度不一致时抛出 SizeMismatchException
TEST_F(RecordCodecTest, DeclaredSizeMismatchThrows) {
    std::vector<Record> records;
    records.push_back(BOFRecord::create(BOFRecord::Worksheet));
    records.push_back(ExternalRecord{std::make_shared<LyingRecord>(10, 12)});
    records.push_back(EOFRecord{});

    try {
        RecordCodec::encode(records);
        FAIL() << "Expected SizeMismatchException";
    } catch (const core::SizeMismatchException& e) {
        EXPECT_EQ(e.getSid(), 0x1002);
        EXPECT_EQ(e.getDeclaredSize(), 10u);
        EXPECT_EQ(e.getActualSize(), 12u);
    }
}

// 测试9: 编码失败时调用方缓冲区恢复原长度
TEST_F(RecordCodecTest, FailedEncodeLeavesBufferUntouched) {
    utils::ByteWriter out;
    out.writeU32(0xDEADBEEF);

    std::vector<Record> records;
    records.push_back(BOFRecord::create(BOFRecord::Worksheet));
    records.push_back(ExternalRecord{std::make_shared<LyingRecord>(4, 2)});

    EXPECT_THROW(RecordCodec::encodeInto(records, out), core::SizeMismatchException);
    EXPECT_EQ(out.size(), 4u);

    records[1] = ExternalRecord{std::make_shared<LyingRecord>(4, 4)};
    const size_t written = RecordCodec::encodeInto(records, out);
    EXPECT_EQ(written, RecordCodec::encodedSize(records));
    EXPECT_EQ(out.size(), 4u + written);
}

} // namespace record
} // namespace fastxls
