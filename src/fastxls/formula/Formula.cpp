#include "fastxls/formula/Formula.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

namespace fastxls {
namespace formula {

namespace {

// 记号被截断时同样视为无法解析
core::Result<Ptg> tryReadPtg(utils::ByteReader& reader) {
    try {
        return readPtg(reader);
    } catch (const core::FormatException& e) {
        return core::makeError(core::ErrorCode::InvalidFormula, e.what());
    }
}

} // namespace

Formula::Formula(std::vector<Ptg> tokens) : tokens_(std::move(tokens)) {
}

Formula Formula::read(utils::ByteReader& reader, uint16_t cce) {
    Formula result;
    std::vector<uint8_t> bytes = reader.readBytes(cce);

    utils::ByteReader tokens(bytes);
    std::vector<Ptg> parsed;
    while (!tokens.atEnd()) {
        core::Result<Ptg> ptg = tryReadPtg(tokens);
        if (!ptg) {
            FORMULA_DEBUG("Keeping formula of {} bytes opaque: {}", cce, ptg.error().message);
            result.raw_ = std::move(bytes);
            result.opaque_ = true;
            return result;
        }
        parsed.push_back(std::move(ptg.value()));
    }
    result.tokens_ = std::move(parsed);
    return result;
}

void Formula::write(utils::ByteWriter& writer) const {
    if (opaque_) {
        writer.writeBytes(raw_);
        return;
    }
    for (const Ptg& ptg : tokens_) {
        writePtg(ptg, writer);
    }
}

uint16_t Formula::encodedSize() const {
    if (opaque_) {
        return static_cast<uint16_t>(raw_.size());
    }
    size_t size = 0;
    for (const Ptg& ptg : tokens_) {
        size += ptgSize(ptg);
    }
    return static_cast<uint16_t>(size);
}

size_t Formula::degradeReferences(const std::function<bool(uint16_t)>& is_deleted) {
    if (opaque_) {
        return 0;
    }
    size_t count = 0;
    for (Ptg& ptg : tokens_) {
        if (auto* ref = std::get_if<Ref3dPtg>(&ptg)) {
            if (is_deleted(ref->extern_index)) {
                RefErr3dPtg err;
                err.cls = ref->cls;
                err.extern_index = ref->extern_index;
                err.cell = ref->cell;
                ptg = err;
                ++count;
            }
        } else if (auto* area = std::get_if<Area3dPtg>(&ptg)) {
            if (is_deleted(area->extern_index)) {
                AreaErr3dPtg err;
                err.cls = area->cls;
                err.extern_index = area->extern_index;
                err.first = area->first;
                err.last = area->last;
                ptg = err;
                ++count;
            }
        }
    }
    return count;
}

size_t Formula::replaceExternIndex(uint16_t from, uint16_t to) {
    if (opaque_) {
        return 0;
    }
    size_t count = 0;
    for (Ptg& ptg : tokens_) {
        if (auto* ref = std::get_if<Ref3dPtg>(&ptg)) {
            if (ref->extern_index == from) {
                ref->extern_index = to;
                ++count;
            }
        } else if (auto* area = std::get_if<Area3dPtg>(&ptg)) {
            if (area->extern_index == from) {
                area->extern_index = to;
                ++count;
            }
        }
    }
    return count;
}

size_t Formula::removeNameIndex(uint16_t index) {
    if (opaque_) {
        return 0;
    }
    size_t count = 0;
    for (Ptg& ptg : tokens_) {
        auto* name = std::get_if<NamePtg>(&ptg);
        if (!name) {
            continue;
        }
        if (name->index == index) {
            // 两者都是 5 字节，IF/CHOOSE 的跳转偏移不受影响
            ptg = RefErrPtg{name->cls};
            ++count;
        } else if (name->index > index) {
            --name->index;
            ++count;
        }
    }
    return count;
}

bool Formula::usesExternIndex(uint16_t extern_index) const {
    for (const Ptg& ptg : tokens_) {
        if (const auto* ref = std::get_if<Ref3dPtg>(&ptg)) {
            if (ref->extern_index == extern_index) return true;
        } else if (const auto* area = std::get_if<Area3dPtg>(&ptg)) {
            if (area->extern_index == extern_index) return true;
        } else if (const auto* ref_err = std::get_if<RefErr3dPtg>(&ptg)) {
            if (ref_err->extern_index == extern_index) return true;
        } else if (const auto* area_err = std::get_if<AreaErr3dPtg>(&ptg)) {
            if (area_err->extern_index == extern_index) return true;
        }
    }
    return false;
}

bool Formula::operator==(const Formula& other) const {
    if (opaque_ != other.opaque_) {
        return false;
    }
    if (opaque_) {
        return raw_ == other.raw_;
    }
    if (tokens_.size() != other.tokens_.size()) {
        return false;
    }
    for (size_t i = 0; i < tokens_.size(); ++i) {
        if (!ptgEquals(tokens_[i], other.tokens_[i])) {
            return false;
        }
    }
    return true;
}

} // namespace formula
} // namespace fastxls
