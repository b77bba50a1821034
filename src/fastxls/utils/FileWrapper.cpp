#include "fastxls/utils/FileWrapper.hpp"

namespace fastxls {
namespace utils {

FileWrapper::FileWrapper(const core::Path& path, Mode mode)
    : filename_(path.string()) {
    FILE* raw_file = nullptr;
    switch (mode) {
        case Mode::Read:   raw_file = path.openForRead(true); break;
        case Mode::Write:  raw_file = path.openForWrite(true); break;
        case Mode::Update: raw_file = path.openForUpdate(); break;
    }

    if (!raw_file) {
        FASTXLS_THROW(core::FileException, "Failed to open file", filename_,
                      mode == Mode::Read ? core::ErrorCode::FileNotFound : core::ErrorCode::FileAccessDenied);
    }
    file_.reset(raw_file);
}

std::vector<uint8_t> FileWrapper::readAll() {
    FASTXLS_THROW_IF(!file_, core::FileException, "File is not open", filename_, core::ErrorCode::FileReadError);

    if (std::fseek(file_.get(), 0, SEEK_END) != 0) {
        FASTXLS_THROW(core::FileException, "Failed to seek", filename_, core::ErrorCode::FileReadError);
    }
    long size = std::ftell(file_.get());
    if (size < 0 || std::fseek(file_.get(), 0, SEEK_SET) != 0) {
        FASTXLS_THROW(core::FileException, "Failed to determine file size", filename_, core::ErrorCode::FileReadError);
    }

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!data.empty() && std::fread(data.data(), 1, data.size(), file_.get()) != data.size()) {
        FASTXLS_THROW(core::FileException, "Short read", filename_, core::ErrorCode::FileReadError);
    }
    return data;
}

void FileWrapper::writeAll(const std::vector<uint8_t>& data) {
    FASTXLS_THROW_IF(!file_, core::FileException, "File is not open", filename_, core::ErrorCode::FileWriteError);

    if (std::fseek(file_.get(), 0, SEEK_SET) != 0) {
        FASTXLS_THROW(core::FileException, "Failed to seek", filename_, core::ErrorCode::FileWriteError);
    }
    if (!data.empty() && std::fwrite(data.data(), 1, data.size(), file_.get()) != data.size()) {
        FASTXLS_THROW(core::FileException, "Short write", filename_, core::ErrorCode::FileWriteError);
    }
    flush();
}

void FileWrapper::flush() {
    if (file_ && std::fflush(file_.get()) != 0) {
        FASTXLS_THROW(core::FileException, "Failed to flush", filename_, core::ErrorCode::FileWriteError);
    }
}

} // namespace utils
} // namespace fastxls
