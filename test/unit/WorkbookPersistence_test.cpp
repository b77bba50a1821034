#include "fastxls/core/Workbook.hpp"
#include "fastxls/core/Worksheet.hpp"
#include "fastxls/core/Name.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/cfb/CompoundFile.hpp"
#include "fastxls/record/RecordCodec.hpp"
#include "fastxls/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fastxls {
namespace core {

namespace {

// 声明长度与实际写出不一致的外部记录
class MismatchedRecord : public record::IExternalRecord {
public:
    MismatchedRecord(size_t declared, size_t actual) : declared_(declared), actual_(actual) {}

    uint16_t sid() const override { return 0x1003; }
    size_t dataSize() const override { return declared_; }
    void serialize(utils::ByteWriter& out) const override { out.writeZeros(actual_); }

private:
    size_t declared_;
    size_t actual_;
};

} // namespace

class WorkbookPersistenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastxls::Logger::getInstance().initialize("logs/WorkbookPersistence_test.log",
                                                  fastxls::Logger::Level::DEBUG,
                                                  false);
        test_dir_ = "test_workbook_persistence";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        fastxls::Logger::getInstance().shutdown();
    }

    // 辅助函数：构造一个包含单元格、名称和多选标签的工作簿
    static std::unique_ptr<Workbook> createSampleWorkbook() {
        auto workbook = Workbook::create();
        auto data = workbook->createSheet("Data");
        auto report = workbook->createSheet("Report");
        workbook->createSheet("Notes");

        data->setCellNumber(0, 0, 1.5);
        data->setCellNumber(1, 0, 2.5);
        data->setCellString(0, 1, "label");
        report->setCellFormula(0, 0, "SUM(Data!A1:A2)");

        auto total = workbook->createName();
        total->setNameName("Total");
        total->setRefersToFormula("Report!$A$1");
        auto local = workbook->createName();
        local->setNameName("Inputs");
        local->setRefersToFormula("Data!$A$1:$A$2");
        local->setSheetIndex(0);

        workbook->setActiveSheet(2);
        workbook->setSelectedTabs({0, 2});
        workbook->setFirstVisibleTab(1);
        return workbook;
    }

    static std::vector<uint8_t> readFile(const Path& path) {
        std::ifstream in(path.string(), std::ios::binary);
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    static std::vector<uint8_t> bofPayload(uint16_t version, uint16_t type) {
        utils::ByteWriter w;
        w.writeU16(version);
        w.writeU16(type);
        w.writeZeros(12);
        return w.take();
    }

    std::string test_dir_;
};

// 测试1: 保存并重新打开后内容一致
TEST_F(WorkbookPersistenceTest, SaveAndReloadRoundTrip) {
    auto workbook = createSampleWorkbook();
    auto reloaded = Workbook::open(workbook->getBytes());
    EXPECT_EQ(reloaded->getSource(), WorkbookSource::BYTE_STREAM);

    ASSERT_EQ(reloaded->getNumberOfSheets(), 3u);
    EXPECT_EQ(reloaded->getSheetName(0), "Data");
    EXPECT_EQ(reloaded->getSheetName(1), "Report");
    EXPECT_EQ(reloaded->getSheetName(2), "Notes");

    auto data = reloaded->getSheetAt(0);
    EXPECT_DOUBLE_EQ(data->getCellNumber(0, 0), 1.5);
    EXPECT_DOUBLE_EQ(data->getCellNumber(1, 0), 2.5);
    EXPECT_EQ(data->getCellString(0, 1), "label");
    EXPECT_EQ(reloaded->getSheetAt(1)->getCellFormula(0, 0), "SUM(Data!A1:A2)");
    EXPECT_EQ(reloaded->getSheetAt(1)->getCellFormula(5, 5), "");

    ASSERT_EQ(reloaded->getNumberOfNames(), 2u);
    auto total = reloaded->getName("Total");
    ASSERT_NE(total, nullptr);
    EXPECT_EQ(total->getRefersToFormula(), "Report!$A$1");
    EXPECT_EQ(total->getSheetIndex(), -1);
    auto inputs = reloaded->getName("Inputs");
    ASSERT_NE(inputs, nullptr);
    EXPECT_EQ(inputs->getSheetIndex(), 0);
    EXPECT_EQ(inputs->getRefersToFormula(), "Data!$A$1:$A$2");

    EXPECT_EQ(reloaded->getActiveSheetIndex(), 2);
    EXPECT_EQ(reloaded->getSelectedTabs(), (std::vector<size_t>{0, 2}));
    EXPECT_EQ(reloaded->getFirstVisibleTab(), 1u);
}

// 测试2: 重新打开后再保存，Workbook 流不变
TEST_F(WorkbookPersistenceTest, RepeatedSaveIsStable) {
    auto workbook = createSampleWorkbook();
    const std::vector<uint8_t> first = workbook->getBytes();
    auto reloaded = Workbook::open(first);
    const std::vector<uint8_t> second = reloaded->getBytes();

    const std::vector<uint8_t> first_stream = cfb::CompoundFile::open(first)->getStream("Workbook");
    const std::vector<uint8_t> second_stream = cfb::CompoundFile::open(second)->getStream("Workbook");
    EXPECT_EQ(second_stream, first_stream);
}

// 测试3: 通过文件与流保存和打开
TEST_F(WorkbookPersistenceTest, FileAndStreamTargets) {
    auto workbook = createSampleWorkbook();
    const Path path(test_dir_ + "/sample.xls");
    workbook->write(path);
    ASSERT_TRUE(path.exists());

    auto from_file = Workbook::open(path);
    EXPECT_EQ(from_file->getSource(), WorkbookSource::FILE_READ_ONLY);
    EXPECT_EQ(from_file->getNumberOfSheets(), 3u);

    std::ostringstream out(std::ios::binary);
    from_file->write(out);
    std::istringstream in(out.str(), std::ios::binary);
    auto from_stream = Workbook::open(in);
    EXPECT_EQ(from_stream->getSheetName(1), "Report");

    EXPECT_THROW(Workbook::open(Path(test_dir_ + "/missing.xls")), FileException);
}

// 测试4: 容器中的其他流与根类标识原样保留
TEST_F(WorkbookPersistenceTest, OtherStreamsArePreserved) {
    auto source = createSampleWorkbook();
    auto container = cfb::CompoundFile::open(source->getBytes());
    const std::vector<uint8_t> summary = {0xFE, 0xFF, 0x00, 0x00, 0x05, 0x01, 0x02, 0x00};
    container->replaceStream("\x05SummaryInformation", summary);
    container->replaceStream("ObjectPool/_1/Ole", std::vector<uint8_t>(700, 0x5A));
    cfb::ClassId clsid{};
    clsid[0] = 0x20;
    clsid[1] = 0x08;
    container->setRootClassId(clsid);

    auto workbook = Workbook::open(container->toBytes());
    workbook->createSheet("Added");
    auto saved = cfb::CompoundFile::open(workbook->getBytes());

    EXPECT_EQ(saved->getStream("\x05SummaryInformation"), summary);
    EXPECT_EQ(saved->getStream("ObjectPool/_1/Ole"), std::vector<uint8_t>(700, 0x5A));
    EXPECT_EQ(saved->getRootClassId(), clsid);
}

// 测试5: 旧版本文档
TEST_F(WorkbookPersistenceTest, OldFormatsAreRejected) {
    auto biff5_container = cfb::CompoundFile::create();
    biff5_container->replaceStream("Book", std::vector<uint8_t>(64, 0));
    try {
        Workbook::open(biff5_container->toBytes());
        FAIL() << "Expected OldFormatException";
    } catch (const OldFormatException& e) {
        EXPECT_EQ(e.getGeneration(), "BIFF5");
    }

    // Workbook 流中的 BOF 版本低于 BIFF8
    utils::ByteWriter stream;
    const std::vector<uint8_t> bof = bofPayload(0x0500, record::BOFRecord::Workbook);
    stream.writeU16(record::sid::BOF);
    stream.writeU16(static_cast<uint16_t>(bof.size()));
    stream.writeBytes(bof);
    stream.writeU16(record::sid::EOF_);
    stream.writeU16(0);
    auto biff5_stream = cfb::CompoundFile::create();
    biff5_stream->replaceStream("Workbook", stream.take());
    EXPECT_THROW(Workbook::open(biff5_stream->toBytes()), OldFormatException);

    // 不在复合文档中的裸 BIFF5 记录流
    std::vector<uint8_t> raw = {0x09, 0x08, 0x08, 0x00, 0x00, 0x05, 0x05, 0x00};
    raw.resize(64, 0);
    try {
        Workbook::open(raw);
        FAIL() << "Expected OldFormatException";
    } catch (const OldFormatException& e) {
        EXPECT_EQ(e.getGeneration(), "BIFF5");
    }
}

// 测试6: 缺少 Workbook 流或不是复合文档
TEST_F(WorkbookPersistenceTest, MissingWorkbookStream) {
    auto container = cfb::CompoundFile::create();
    container->replaceStream("Something", std::vector<uint8_t>(16, 1));
    EXPECT_THROW(Workbook::open(container->toBytes()), ParameterException);

    std::vector<uint8_t> zip = {0x50, 0x4B, 0x03, 0x04};
    zip.resize(1024, 0);
    EXPECT_THROW(Workbook::open(zip), FormatException);
}

// 测试7: 只有读写打开的文件才能原地写回
TEST_F(WorkbookPersistenceTest, WriteInPlace) {
    const Path path(test_dir_ + "/inplace.xls");
    const std::vector<uint8_t> summary = {0xFE, 0xFF, 0x00, 0x00, 0x05, 0x01, 0x02, 0x00};
    cfb::ClassId clsid{};
    clsid[0] = 0x20;
    clsid[1] = 0x08;
    clsid[15] = 0x46;
    {
        auto container = cfb::CompoundFile::open(createSampleWorkbook()->getBytes());
        container->replaceStream("\x05SummaryInformation", summary);
        container->setRootClassId(clsid);
        container->writeTo(path);
    }

    {
        auto read_only = Workbook::open(path, OpenMode::ReadOnly);
        EXPECT_THROW(read_only->writeInPlace(), InvalidStateException);
    }
    {
        auto in_memory = Workbook::create();
        in_memory->createSheet();
        EXPECT_THROW(in_memory->writeInPlace(), InvalidStateException);
    }
    {
        auto read_write = Workbook::open(path, OpenMode::ReadWrite);
        EXPECT_EQ(read_write->getSource(), WorkbookSource::FILE_READ_WRITE);
        auto added = read_write->createSheet("Added");
        added->setCellString(3, 3, "in place");
        read_write->writeInPlace();
        read_write->close();
        EXPECT_THROW(read_write->writeInPlace(), InvalidStateException);
    }

    auto reopened = Workbook::open(path);
    ASSERT_EQ(reopened->getNumberOfSheets(), 4u);
    EXPECT_EQ(reopened->getSheetAt(3)->getCellString(3, 3), "in place");

    auto container = cfb::CompoundFile::open(path, OpenMode::ReadOnly);
    EXPECT_EQ(container->getStream("\x05SummaryInformation"), summary);
    EXPECT_EQ(container->getRootClassId(), clsid);
}

// 测试8: 外部记录声明长度不一致时不写出任何字节
TEST_F(WorkbookPersistenceTest, SizeMismatchAbortsWrite) {
    auto workbook = createSampleWorkbook();
    auto sheet = workbook->getSheetAt(1);
    sheet->insertExternalRecord(std::make_shared<MismatchedRecord>(10, 12));

    try {
        workbook->getBytes();
        FAIL() << "Expected SizeMismatchException";
    } catch (const SizeMismatchException& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Actual serialized sheet size", 0), 0u);
        EXPECT_EQ(e.getSid(), 0x1003);
    }

    std::ostringstream out(std::ios::binary);
    EXPECT_THROW(workbook->write(out), SizeMismatchException);
    EXPECT_TRUE(out.str().empty());

    const Path path(test_dir_ + "/mismatch.xls");
    EXPECT_THROW(workbook->write(path), SizeMismatchException);
    EXPECT_FALSE(path.exists());

    EXPECT_THROW(sheet->insertExternalRecord(nullptr), ParameterException);
}

// 测试9: 声明长度正确的外部记录按原样写出
TEST_F(WorkbookPersistenceTest, ExternalRecordIsWrittenBeforeEof) {
    auto workbook = createSampleWorkbook();
    workbook->getSheetAt(2)->insertExternalRecord(std::make_shared<MismatchedRecord>(6, 6));

    auto container = cfb::CompoundFile::open(workbook->getBytes());
    const std::vector<record::Record> records = record::RecordCodec::decode(container->getStream("Workbook"));
    ASSERT_GE(records.size(), 2u);
    const auto* external = record::recordAs<record::UnknownRecord>(records[records.size() - 2]);
    ASSERT_NE(external, nullptr);
    EXPECT_EQ(external->record_sid, 0x1003);
    EXPECT_EQ(external->data, std::vector<uint8_t>(6, 0));
}

// 测试10: 关闭后工作簿与句柄都不可用
TEST_F(WorkbookPersistenceTest, UseAfterClose) {
    auto workbook = createSampleWorkbook();
    auto sheet = workbook->getSheetAt(0);
    auto name = workbook->getNameAt(0);
    workbook->close();

    EXPECT_THROW(workbook->getSheetAt(0), InvalidStateException);
    EXPECT_THROW(workbook->write(Path(test_dir_ + "/closed.xls")), InvalidStateException);
    EXPECT_THROW(sheet->getCellNumber(0, 0), InvalidStateException);
    EXPECT_THROW(name->getRefersToFormula(), InvalidStateException);
    EXPECT_FALSE(name->exists());
}

// 测试11: 读写打开后只修改不写回，关闭时文件保持不变
TEST_F(WorkbookPersistenceTest, CloseWithoutWriteLeavesFileUnchanged) {
    const Path path(test_dir_ + "/untouched.xls");
    createSampleWorkbook()->write(path);
    const std::vector<uint8_t> before = readFile(path);
    ASSERT_FALSE(before.empty());

    {
        auto workbook = Workbook::open(path, OpenMode::ReadWrite);
        workbook->getSheetAt(0)->setCellString(5, 5, "not saved");
        workbook->setSheetName(1, "Renamed");
        workbook->createSheet("Extra");
        workbook->close();
    }
    EXPECT_EQ(readFile(path), before);

    // 析构时同样不写回
    {
        auto workbook = Workbook::open(path, OpenMode::ReadWrite);
        workbook->removeSheetAt(0);
    }
    EXPECT_EQ(readFile(path), before);
}

} // namespace core
} // namespace fastxls
