#include "fastxls/record/RecordCodec.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <numeric>
#include <optional>
#include <type_traits>

namespace fastxls {
namespace record {

namespace {

constexpr size_t kHeaderSize = 4;

template<typename T>
constexpr bool usesFragmentHints() {
    return std::is_same_v<T, UnknownRecord> || std::is_same_v<T, DrawingGroupRecord> ||
           std::is_same_v<T, DrawingRecord>;
}

} // namespace

std::vector<Record> RecordCodec::decode(const std::vector<uint8_t>& stream) {
    return decode(stream.data(), stream.size());
}

std::vector<Record> RecordCodec::decode(const uint8_t* data, size_t size) {
    std::vector<Record> records;
    size_t pos = 0;
    int depth = 0;
    bool finished = false;  // 已遇到使嵌套深度归零的 EOF

    while (pos < size) {
        const size_t remaining = size - pos;
        if (remaining < kHeaderSize) {
            if (finished) {
                RECORD_WARN("Ignoring {} trailing bytes (partial record header) after the final EOF", remaining);
                break;
            }
            FASTXLS_THROW(core::FormatException,
                          fmt::format("Truncated record header at offset {} ({} bytes left)", pos, remaining));
        }

        const uint16_t record_sid = utils::readU16LE(data + pos);
        const uint16_t length = utils::readU16LE(data + pos + 2);
        if (finished && record_sid != sid::BOF) {
            RECORD_WARN("Ignoring {} trailing bytes after the final EOF (offset {}, next sid 0x{:04X})",
                        remaining, pos, record_sid);
            break;
        }
        if (length > remaining - kHeaderSize) {
            if (finished) {
                RECORD_WARN("Ignoring {} trailing bytes after the final EOF (offset {}, truncated BOF)",
                            remaining, pos);
                break;
            }
            FASTXLS_THROW(core::FormatException,
                          fmt::format("Record 0x{:04X} at offset {} declares {} bytes but only {} remain",
                                      record_sid, pos, length, remaining - kHeaderSize));
        }

        std::vector<uint8_t> payload(data + pos + kHeaderSize, data + pos + kHeaderSize + length);
        std::vector<uint16_t> fragments{length};
        pos += kHeaderSize + length;

        // CONTINUE 合并到前一条记录
        if (record_sid != sid::CONTINUE && record_sid != sid::EOF_) {
            while (size - pos >= kHeaderSize && utils::readU16LE(data + pos) == sid::CONTINUE) {
                const uint16_t continue_length = utils::readU16LE(data + pos + 2);
                if (continue_length > size - pos - kHeaderSize) {
                    FASTXLS_THROW(core::FormatException,
                                  fmt::format("CONTINUE of record 0x{:04X} at offset {} declares {} bytes but only {} remain",
                                              record_sid, pos, continue_length, size - pos - kHeaderSize));
                }
                payload.insert(payload.end(), data + pos + kHeaderSize,
                               data + pos + kHeaderSize + continue_length);
                fragments.push_back(continue_length);
                pos += kHeaderSize + continue_length;
            }
        }

        if (record_sid == sid::BOF) {
            ++depth;
            finished = false;
        } else if (record_sid == sid::EOF_) {
            if (depth > 0) {
                --depth;
            }
            finished = depth == 0;
        }

        FASTXLS_LOG_RECORD_TRACE("sid=0x{:04X} size={} fragments={}", record_sid, payload.size(), fragments.size());
        records.push_back(parseRecord(record_sid, std::move(payload), std::move(fragments)));
    }

    if (!finished) {
        RECORD_WARN("Workbook stream ended without a final EOF record ({} records)", records.size());
    }
    RECORD_DEBUG("Decoded {} records from {} bytes", records.size(), size);
    return records;
}

Record RecordCodec::parseRecord(uint16_t record_sid, std::vector<uint8_t> data, std::vector<uint16_t> fragments) {
    try {
        utils::ByteReader in(data);
        std::optional<Record> typed;
        switch (record_sid) {
            case sid::BOF:          typed = BOFRecord::parse(in); break;
            case sid::EOF_:         typed = EOFRecord::parse(in); break;
            case sid::WINDOW1:      typed = Window1Record::parse(in); break;
            case sid::BOUNDSHEET:   typed = BoundSheetRecord::parse(in); break;
            case sid::WINDOW2:      typed = Window2Record::parse(in); break;
            case sid::DIMENSIONS:   typed = DimensionsRecord::parse(in); break;
            case sid::SUPBOOK:      typed = SupBookRecord::parse(in); break;
            case sid::EXTERNSHEET:  typed = ExternSheetRecord::parse(in); break;
            case sid::NAME:         typed = NameRecord::parse(in); break;
            case sid::XF:           typed = XFRecord::parse(in); break;
            case sid::FORMULA:      typed = FormulaRecord::parse(in); break;
            case sid::NUMBER:       typed = NumberRecord::parse(in); break;
            case sid::LABEL:        typed = LabelRecord::parse(in); break;
            case sid::WRITEPROT:    typed = WriteProtectRecord::parse(in); break;
            case sid::FILESHARING:  typed = FileSharingRecord::parse(in); break;
            case sid::WRITEACCESS:  typed = WriteAccessRecord::parse(in); break;
            case sid::MSODRAWINGGROUP: {
                DrawingGroupRecord group = DrawingGroupRecord::parse(in);
                group.fragments = fragments;
                typed = std::move(group);
                break;
            }
            case sid::MSODRAWING: {
                DrawingRecord drawing = DrawingRecord::parse(in);
                drawing.fragments = fragments;
                typed = std::move(drawing);
                break;
            }
            default:
                break;
        }
        if (typed) {
            if (in.atEnd()) {
                return std::move(*typed);
            }
            RECORD_WARN("Record 0x{:04X} has {} unparsed trailing bytes, keeping it opaque",
                        record_sid, in.remaining());
        }
    } catch (const core::FormatException& e) {
        RECORD_WARN("Record 0x{:04X} ({} bytes) kept opaque: {}", record_sid, data.size(), e.what());
    }

    UnknownRecord unknown;
    unknown.record_sid = record_sid;
    unknown.data = std::move(data);
    unknown.fragments = std::move(fragments);
    return unknown;
}

std::vector<size_t> RecordCodec::fragmentSizes(const Record& record) {
    const size_t total = dataSizeOf(record);

    // 原样保留的记录沿用读入时的分片边界（例如 SST 的字符串不能在任意位置切开）
    const std::vector<uint16_t>* hints = std::visit([](const auto& r) -> const std::vector<uint16_t>* {
        using T = std::decay_t<decltype(r)>;
        if constexpr (usesFragmentHints<T>()) {
            return &r.fragments;
        } else {
            return nullptr;
        }
    }, record);
    if (hints && !hints->empty() &&
        std::accumulate(hints->begin(), hints->end(), size_t{0}) == total) {
        return std::vector<size_t>(hints->begin(), hints->end());
    }

    std::vector<size_t> sizes;
    size_t left = total;
    do {
        const size_t chunk = std::min(left, kMaxRecordDataSize);
        sizes.push_back(chunk);
        left -= chunk;
    } while (left > 0);
    return sizes;
}

size_t RecordCodec::encodedSize(const Record& record) {
    return dataSizeOf(record) + kHeaderSize * fragmentSizes(record).size();
}

size_t RecordCodec::encodedSize(const std::vector<Record>& records) {
    size_t total = 0;
    for (const Record& record : records) {
        total += encodedSize(record);
    }
    return total;
}

void RecordCodec::writeRecord(const Record& record, utils::ByteWriter& out, utils::ByteWriter& scratch) {
    scratch.clear();
    serializePayload(record, scratch);

    const uint16_t record_sid = sidOf(record);
    const size_t declared = dataSizeOf(record);
    if (scratch.size() != declared) {
        FASTXLS_THROW(core::SizeMismatchException,
                      fmt::format("Record 0x{:04X} declared {} bytes but serialized {}",
                                  record_sid, declared, scratch.size()),
                      record_sid, declared, scratch.size());
    }

    const std::vector<uint8_t>& payload = scratch.data();
    size_t offset = 0;
    bool first = true;
    for (size_t chunk : fragmentSizes(record)) {
        out.writeU16(first ? record_sid : sid::CONTINUE);
        out.writeU16(static_cast<uint16_t>(chunk));
        out.writeBytes(payload.data() + offset, chunk);
        offset += chunk;
        first = false;
    }
}

std::vector<uint8_t> RecordCodec::encode(const std::vector<Record>& records) {
    utils::ByteWriter out;
    encodeInto(records, out);
    return out.take();
}

size_t RecordCodec::encodeInto(const std::vector<Record>& records, utils::ByteWriter& out) {
    const size_t start = out.size();
    const size_t total = encodedSize(records);
    out.reserve(start + total);

    utils::ByteWriter scratch;
    size_t expected = 0;
    try {
        for (const Record& record : records) {
            expected += encodedSize(record);
            writeRecord(record, out, scratch);
            const size_t written = out.size() - start;
            if (written != expected) {
                FASTXLS_THROW(core::SizeMismatchException,
                              fmt::format("Record stream drifted after sid 0x{:04X}: expected {} bytes, wrote {}",
                                          sidOf(record), expected, written),
                              sidOf(record), expected, written);
            }
        }
    } catch (const core::FastXLSException&) {
        out.truncate(start);
        throw;
    }

    RECORD_DEBUG("Encoded {} records into {} bytes", records.size(), total);
    return total;
}

} // namespace record
} // namespace fastxls
