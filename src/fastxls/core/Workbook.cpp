#include "fastxls/core/Workbook.hpp"
#include "fastxls/cfb/CompoundFile.hpp"
#include "fastxls/cfb/FileMagic.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/core/Name.hpp"
#include "fastxls/core/Worksheet.hpp"
#include "fastxls/model/InternalWorkbook.hpp"
#include "fastxls/record/RecordCodec.hpp"
#include "fastxls/utils/FileWrapper.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <functional>
#include <istream>
#include <iterator>
#include <fmt/format.h>

namespace fastxls {
namespace core {

namespace {

/**
 * @brief 裸的旧版 BIFF 记录流（不在复合文档中）直接报告其代际
 */
void rejectOldBiffStream(const std::vector<uint8_t>& bytes) {
    const cfb::FileMagic magic = cfb::detectFileMagic(bytes);
    if (const char* generation = cfb::oldBiffGeneration(magic)) {
        CORE_ERROR("Data is a {}, only BIFF8 is supported", cfb::toString(magic));
        FASTXLS_THROW(OldFormatException, generation);
    }
}

} // namespace

// Workbook 实现

Workbook::Workbook(std::unique_ptr<cfb::CompoundFile> container, std::shared_ptr<model::InternalWorkbook> model,
                   WorkbookSource source, const WorkbookOptions& options)
    : container_(std::move(container))
    , model_(std::move(model))
    , source_(source)
    , options_(options) {
}

Workbook::~Workbook() {
    close();
}

std::unique_ptr<Workbook> Workbook::create(const WorkbookOptions& options) {
    cfb::ContainerOptions container_options;
    container_options.major_version = options.container_major_version;
    auto container = cfb::CompoundFile::create(container_options);
    std::shared_ptr<model::InternalWorkbook> model = model::InternalWorkbook::createEmpty(options);

    CORE_INFO("Created new workbook (container v{})", options.container_major_version);
    return std::unique_ptr<Workbook>(
        new Workbook(std::move(container), std::move(model), WorkbookSource::NEW_WORKBOOK, options));
}

std::unique_ptr<Workbook> Workbook::open(std::vector<uint8_t> bytes, const WorkbookOptions& options) {
    rejectOldBiffStream(bytes);
    auto container = cfb::CompoundFile::open(std::move(bytes));
    return load(std::move(container), WorkbookSource::BYTE_STREAM, options);
}

std::unique_ptr<Workbook> Workbook::open(std::istream& in, const WorkbookOptions& options) {
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        FASTXLS_THROW(FileException, "Failed to read workbook from input stream", "<stream>",
                      ErrorCode::FileReadError);
    }
    return open(std::move(bytes), options);
}

std::unique_ptr<Workbook> Workbook::open(const Path& path, OpenMode mode, const WorkbookOptions& options) {
    if (!path.exists()) {
        FASTXLS_THROW(FileException, fmt::format("File not found: {}", path.string()), path.string(),
                      ErrorCode::FileNotFound);
    }

    std::unique_ptr<cfb::CompoundFile> container;
    try {
        container = cfb::CompoundFile::open(path, mode);
    } catch (const FormatException&) {
        // 不是复合文档时，先确认是否为旧版 BIFF 文件
        utils::FileWrapper raw_file(path, utils::FileWrapper::Mode::Read);
        rejectOldBiffStream(raw_file.readAll());
        throw;
    }

    const WorkbookSource source = mode == OpenMode::ReadWrite ? WorkbookSource::FILE_READ_WRITE
                                                              : WorkbookSource::FILE_READ_ONLY;
    return load(std::move(container), source, options);
}

std::unique_ptr<Workbook> Workbook::load(std::unique_ptr<cfb::CompoundFile> container, WorkbookSource source,
                                         const WorkbookOptions& options) {
    if (!container->hasStream(Constants::kWorkbookStreamName)) {
        if (container->hasStream(Constants::kBiff5StreamName)) {
            FASTXLS_THROW(OldFormatException, "BIFF5");
        }
        FASTXLS_THROW(ParameterException,
                      "The supplied compound document does not contain a BIFF8 'Workbook' entry. "
                      "Is it really an Excel file?",
                      Constants::kWorkbookStreamName);
    }

    const std::vector<uint8_t> stream = container->getStream(Constants::kWorkbookStreamName);
    std::vector<record::Record> records = record::RecordCodec::decode(stream);
    std::shared_ptr<model::InternalWorkbook> model = model::InternalWorkbook::load(std::move(records), options);

    CORE_INFO("Opened workbook from {} ({} byte workbook stream, {} sheets)",
              toString(source), stream.size(), model->getNumSheets());
    return std::unique_ptr<Workbook>(new Workbook(std::move(container), std::move(model), source, options));
}

// ========== 保存 ==========

void Workbook::storeWorkbookStream() {
    model::InternalWorkbook& wb = model();
    // 序列化失败时容器保持不变
    std::vector<uint8_t> stream = wb.serialize();
    container_->replaceStream(Constants::kWorkbookStreamName, std::move(stream));
}

void Workbook::write(std::ostream& out) {
    storeWorkbookStream();
    container_->writeTo(out);
    CORE_INFO("Wrote workbook to output stream");
}

void Workbook::write(const Path& path) {
    storeWorkbookStream();
    container_->writeTo(path);
    CORE_INFO("Wrote workbook to {}", path.string());
}

std::vector<uint8_t> Workbook::getBytes() {
    storeWorkbookStream();
    return container_->toBytes();
}

void Workbook::writeInPlace() {
    model();
    if (source_ != WorkbookSource::FILE_READ_WRITE || !container_->supportsInPlaceWrite()) {
        FASTXLS_THROW(InvalidStateException,
                      fmt::format("Workbook opened from a {} cannot write in place; "
                                  "open the file with OpenMode::ReadWrite first", toString(source_)));
    }
    storeWorkbookStream();
    container_->commit();
    CORE_INFO("Wrote workbook in place");
}

void Workbook::close() {
    if (container_) {
        container_->close();
        container_.reset();
    }
    if (model_) {
        model_.reset();
        CORE_DEBUG("Closed workbook ({})", toString(source_));
    }
}

model::InternalWorkbook& Workbook::model() const {
    if (!model_) {
        FASTXLS_THROW(InvalidStateException, "Workbook has been closed");
    }
    return *model_;
}

model::InternalWorkbook& Workbook::getInternalWorkbook() {
    return model();
}

// ========== 工作表 ==========

size_t Workbook::getNumberOfSheets() const {
    return model().getNumSheets();
}

std::shared_ptr<Worksheet> Workbook::sheetHandle(size_t index) {
    return std::make_shared<Worksheet>(model_, model().getSheetAt(index).id);
}

std::shared_ptr<Worksheet> Workbook::createSheet() {
    model::InternalWorkbook& wb = model();
    size_t n = wb.getNumSheets() + 1;
    std::string name = options_.default_sheet_prefix + std::to_string(n);
    while (wb.getSheetIndex(name) >= 0) {
        name = options_.default_sheet_prefix + std::to_string(++n);
    }
    return createSheet(name);
}

std::shared_ptr<Worksheet> Workbook::createSheet(const std::string& name) {
    const model::Sheet& sheet = model().createSheet(name);
    return std::make_shared<Worksheet>(model_, sheet.id);
}

std::shared_ptr<Worksheet> Workbook::cloneSheet(size_t index) {
    const model::Sheet& sheet = model().cloneSheet(index);
    return std::make_shared<Worksheet>(model_, sheet.id);
}

std::shared_ptr<Worksheet> Workbook::getSheetAt(size_t index) {
    return sheetHandle(index);
}

std::shared_ptr<Worksheet> Workbook::getSheet(const std::string& name) {
    const int index = model().getSheetIndex(name);
    return index < 0 ? nullptr : sheetHandle(static_cast<size_t>(index));
}

int Workbook::getSheetIndex(const std::string& name) const {
    return model().getSheetIndex(name);
}

int Workbook::getSheetIndex(const Worksheet& sheet) const {
    return model().getSheetIndex(sheet.getSheetId());
}

std::string Workbook::getSheetName(size_t index) const {
    return model().getSheetAt(index).name;
}

void Workbook::setSheetName(size_t index, const std::string& name) {
    model().setSheetName(index, name);
}

void Workbook::setSheetOrder(const std::string& name, size_t position) {
    model().setSheetOrder(name, position);
}

void Workbook::removeSheetAt(size_t index) {
    model().removeSheetAt(index);
}

void Workbook::removeSheetsAt(std::vector<size_t> indices) {
    model::InternalWorkbook& wb = model();
    for (size_t index : indices) {
        wb.getSheetAt(index);
    }
    std::sort(indices.begin(), indices.end(), std::greater<size_t>());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    for (size_t index : indices) {
        wb.removeSheetAt(index);
    }
}

// ========== 选中与活动 ==========

void Workbook::setActiveSheet(size_t index) {
    model().setActiveSheet(index);
}

int Workbook::getActiveSheetIndex() const {
    return model().getActiveSheetIndex();
}

void Workbook::setSelectedTab(size_t index) {
    model().setSelectedTab(index);
}

void Workbook::setSelectedTabs(const std::vector<size_t>& indices) {
    model().setSelectedTabs(indices);
}

std::vector<size_t> Workbook::getSelectedTabs() const {
    return model().getSelectedTabs();
}

void Workbook::setFirstVisibleTab(size_t index) {
    model().setFirstVisibleTab(index);
}

size_t Workbook::getFirstVisibleTab() const {
    return model().getFirstVisibleTab();
}

// ========== 定义名称 ==========

size_t Workbook::getNumberOfNames() const {
    return model().getNumberOfNames();
}

std::shared_ptr<Name> Workbook::createName() {
    const model::DefinedName& dn = model().createName();
    return std::make_shared<Name>(model_, dn.id);
}

std::shared_ptr<Name> Workbook::getName(const std::string& name) {
    const int index = model().getNameIndex(name);
    if (index < 0) {
        return nullptr;
    }
    return getNameAt(static_cast<size_t>(index));
}

std::shared_ptr<Name> Workbook::getNameAt(size_t index) {
    const model::DefinedName& dn = model().getNameAt(index);
    return std::make_shared<Name>(model_, dn.id);
}

int Workbook::getNameIndex(const std::string& name) const {
    return model().getNameIndex(name);
}

int Workbook::getNameIndex(const Name& name) const {
    return model().getNameIndex(name.getNameId());
}

void Workbook::removeName(size_t index) {
    model().removeName(index);
}

void Workbook::removeName(const std::string& name) {
    const int index = model().getNameIndex(name);
    if (index < 0) {
        FASTXLS_THROW(ParameterException, fmt::format("Defined name '{}' does not exist", name), "name");
    }
    model().removeName(static_cast<size_t>(index));
}

void Workbook::removeName(const Name& name) {
    const int index = model().getNameIndex(name.getNameId());
    if (index < 0) {
        FASTXLS_THROW(ParameterException, "Defined name is not part of this workbook", "name");
    }
    model().removeName(static_cast<size_t>(index));
}

// ========== 样式 ==========

int Workbook::createCellStyle() {
    auto result = model().tryAddCellStyle();
    if (!result) {
        CORE_WARN("{}", result.error().message);
        FASTXLS_THROW(CapacityExceededException,
                      "The maximum number of cell styles was exceeded. "
                      "You can define up to 4000 styles in a .xls workbook",
                      options_.max_cell_styles);
    }
    return result.value();
}

size_t Workbook::getNumCellStyles() const {
    return model().getNumCellStyles();
}

// ========== 图片 ==========

size_t Workbook::getNumberOfPictures() {
    return model().getNumPictures();
}

uint32_t Workbook::getPictureReferenceCount(uint32_t pib) {
    return model().getPictureRefCount(pib);
}

// ========== 工作簿属性 ==========

bool Workbook::isHidden() const {
    return model().isHidden();
}

void Workbook::setHidden(bool hidden) {
    model().setHidden(hidden);
}

void Workbook::writeProtectWorkbook(const std::string& password, const std::string& user_name) {
    model().writeProtect(password, user_name);
}

void Workbook::unwriteProtectWorkbook() {
    model().unwriteProtect();
}

bool Workbook::isWriteProtected() const {
    return model().isWriteProtected();
}

} // namespace core
} // namespace fastxls
