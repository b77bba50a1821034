#include "fastxls/cfb/CompoundFile.hpp"
#include "fastxls/cfb/CompoundFileReader.hpp"
#include "fastxls/cfb/CompoundFileWriter.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"
#include "fastxls/utils/Unicode.hpp"

#include <algorithm>
#include <functional>
#include <ostream>
#include <fmt/format.h>

namespace fastxls {
namespace cfb {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) {
            parts.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return parts;
}

Entry* findChild(Entry& parent, const std::string& name) {
    for (Entry& child : parent.children) {
        if (utils::equalsIgnoreCase(child.name, name)) {
            return &child;
        }
    }
    return nullptr;
}

} // namespace

CompoundFile::CompoundFile(Entry root, uint16_t major_version, SourceKind source)
    : root_(std::move(root))
    , major_version_(major_version)
    , source_(source) {
}

CompoundFile::~CompoundFile() {
    close();
}

std::unique_ptr<CompoundFile> CompoundFile::open(std::vector<uint8_t> bytes) {
    CompoundFileReader reader(bytes);
    Entry root = reader.read();
    CFB_INFO("Opened compound document from buffer ({} bytes, v{})", bytes.size(), reader.getMajorVersion());
    return std::unique_ptr<CompoundFile>(new CompoundFile(std::move(root), reader.getMajorVersion(), SourceKind::Buffer));
}

std::unique_ptr<CompoundFile> CompoundFile::open(const core::Path& path, core::OpenMode mode) {
    const bool writable = mode == core::OpenMode::ReadWrite;
    utils::FileWrapper file(path, writable ? utils::FileWrapper::Mode::Update : utils::FileWrapper::Mode::Read);
    const std::vector<uint8_t> bytes = file.readAll();

    CompoundFileReader reader(bytes);
    Entry root = reader.read();

    std::unique_ptr<CompoundFile> doc(new CompoundFile(
        std::move(root), reader.getMajorVersion(),
        writable ? SourceKind::ReadWriteFile : SourceKind::ReadOnlyFile));
    doc->path_ = path;
    if (writable) {
        doc->file_ = std::move(file);
    }
    CFB_INFO("Opened compound document {} ({} bytes, v{}, {})", path.string(), bytes.size(),
             reader.getMajorVersion(), writable ? "read-write" : "read-only");
    return doc;
}

std::unique_ptr<CompoundFile> CompoundFile::create(const ContainerOptions& options) {
    if (options.major_version != 3 && options.major_version != 4) {
        FASTXLS_THROW(core::ParameterException,
                      fmt::format("Unsupported compound document major version {}", options.major_version),
                      "major_version");
    }
    Entry root;
    root.name = "Root Entry";
    root.type = EntryType::Root;
    CFB_DEBUG("Created empty compound document v{}", options.major_version);
    return std::unique_ptr<CompoundFile>(new CompoundFile(std::move(root), options.major_version, SourceKind::Created));
}

const Entry* CompoundFile::findEntry(const std::string& name) const {
    return const_cast<CompoundFile*>(this)->findEntry(name);
}

Entry* CompoundFile::findEntry(const std::string& name) {
    Entry* current = &root_;
    for (const std::string& part : splitPath(name)) {
        if (!current->isStorage()) {
            return nullptr;
        }
        current = findChild(*current, part);
        if (!current) {
            return nullptr;
        }
    }
    return current == &root_ ? nullptr : current;
}

bool CompoundFile::hasStream(const std::string& name) const {
    const Entry* entry = findEntry(name);
    return entry && entry->type == EntryType::Stream;
}

std::vector<uint8_t> CompoundFile::getStream(const std::string& name) const {
    const Entry* entry = findEntry(name);
    if (!entry || entry->type != EntryType::Stream) {
        FASTXLS_THROW(core::ParameterException, "No such stream in compound document", name);
    }
    return entry->data;
}

void CompoundFile::replaceStream(const std::string& name, std::vector<uint8_t> data) {
    std::vector<std::string> parts = splitPath(name);
    if (parts.empty()) {
        FASTXLS_THROW(core::ParameterException, "Stream name must not be empty", "name");
    }

    Entry* parent = &root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Entry* next = findChild(*parent, parts[i]);
        if (!next) {
            Entry storage;
            storage.name = parts[i];
            storage.type = EntryType::Storage;
            parent->children.push_back(std::move(storage));
            next = &parent->children.back();
        } else if (!next->isStorage()) {
            FASTXLS_THROW(core::ParameterException,
                          fmt::format("'{}' is a stream, not a storage", parts[i]), name);
        }
        parent = next;
    }

    const size_t size = data.size();
    Entry* existing = findChild(*parent, parts.back());
    if (existing) {
        if (existing->type != EntryType::Stream) {
            FASTXLS_THROW(core::ParameterException, "Cannot replace a storage with a stream", name);
        }
        existing->data = std::move(data);
    } else {
        Entry stream;
        stream.name = parts.back();
        stream.type = EntryType::Stream;
        stream.data = std::move(data);
        parent->children.push_back(std::move(stream));
    }
    CFB_DEBUG("Stream '{}' set to {} bytes", name, size);
}

bool CompoundFile::removeEntry(const std::string& name) {
    std::vector<std::string> parts = splitPath(name);
    if (parts.empty()) {
        return false;
    }
    Entry* parent = &root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        parent = findChild(*parent, parts[i]);
        if (!parent || !parent->isStorage()) {
            return false;
        }
    }
    auto it = std::find_if(parent->children.begin(), parent->children.end(),
                           [&](const Entry& e) { return utils::equalsIgnoreCase(e.name, parts.back()); });
    if (it == parent->children.end()) {
        return false;
    }
    parent->children.erase(it);
    CFB_DEBUG("Removed entry '{}'", name);
    return true;
}

std::vector<EntryInfo> CompoundFile::listEntries() const {
    std::vector<EntryInfo> result;
    std::function<void(const Entry&, const std::string&)> visit = [&](const Entry& parent, const std::string& prefix) {
        for (const Entry& child : parent.children) {
            std::string path = prefix.empty() ? child.name : prefix + "/" + child.name;
            result.push_back({path, child.type, child.data.size()});
            if (child.isStorage()) {
                visit(child, path);
            }
        }
    };
    visit(root_, "");
    return result;
}

std::vector<uint8_t> CompoundFile::toBytes() const {
    CompoundFileWriter writer(major_version_);
    return writer.write(root_);
}

void CompoundFile::writeTo(std::ostream& out) const {
    const std::vector<uint8_t> bytes = toBytes();
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        FASTXLS_THROW(core::FileException, "Failed to write compound document to stream", "<stream>",
                      core::ErrorCode::FileWriteError);
    }
}

void CompoundFile::writeTo(const core::Path& path) const {
    const std::vector<uint8_t> bytes = toBytes();
    utils::FileWrapper file(path, utils::FileWrapper::Mode::Write);
    file.writeAll(bytes);
    CFB_INFO("Wrote compound document to {} ({} bytes)", path.string(), bytes.size());
}

void CompoundFile::commit() {
    if (source_ != SourceKind::ReadWriteFile) {
        FASTXLS_THROW(core::InvalidStateException,
                      "Cannot commit in place: the compound document was not opened from a read-write file");
    }
    if (!file_) {
        FASTXLS_THROW(core::InvalidStateException, "Cannot commit in place: the compound document has been closed");
    }

    // 先完整序列化，成功后才触碰文件
    const std::vector<uint8_t> bytes = toBytes();
    file_.writeAll(bytes);
    if (path_.fileSize() != bytes.size() && !path_.resize(bytes.size())) {
        FASTXLS_THROW(core::FileException, "Failed to truncate file after in-place write", path_.string(),
                      core::ErrorCode::FileWriteError);
    }
    CFB_INFO("Committed compound document in place to {} ({} bytes)", path_.string(), bytes.size());
}

void CompoundFile::close() {
    if (file_) {
        file_.close();
        CFB_DEBUG("Closed compound document handle {}", path_.string());
    }
    open_ = false;
}

} // namespace cfb
} // namespace fastxls
