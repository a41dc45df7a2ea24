#include "polypatch/delta_engine.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <unordered_map>
#include <vector>

#include <zlib.h>

#include "polypatch/byte_order.hpp"

namespace polypatch {

namespace {

// zlib cannot expand input by more than about 1032:1.
constexpr std::uint64_t kMaxInflateRatio = 1032;

class RollingChecksum {
public:
    RollingChecksum(const std::uint8_t* data, const std::size_t count) {
        Reset(data, count);
    }

    void Reset(const std::uint8_t* data, const std::size_t count) {
        a_ = 0;
        b_ = 0;
        window_ = static_cast<std::uint32_t>(count);
        for (std::size_t i = 0; i < count; ++i) {
            a_ += data[i];
            b_ += a_;
        }
        a_ &= kMask;
        b_ &= kMask;
    }

    void Roll(const std::uint8_t out, const std::uint8_t in) {
        a_ = (a_ - out + in) & kMask;
        b_ = (b_ - window_ * out + a_) & kMask;
    }

    std::uint32_t Sum() const {
        return (b_ << 16U) | a_;
    }

private:
    static constexpr std::uint32_t kMask = 0xFFFFU;

    std::uint32_t a_ = 0;
    std::uint32_t b_ = 0;
    std::uint32_t window_ = 0;
};

void PushInsert(std::vector<DeltaInstruction>& out, const std::size_t literal_offset, const std::size_t length) {
    if (length == 0) {
        return;
    }
    DeltaInstruction insn;
    insn.code = DeltaInstruction::Code::Insert;
    insn.length = length;
    insn.literal_offset = literal_offset;
    out.push_back(insn);
}

void PushCopy(std::vector<DeltaInstruction>& out, const std::size_t offset, const std::size_t length) {
    if (!out.empty() && out.back().code == DeltaInstruction::Code::Copy &&
        out.back().offset + out.back().length == offset) {
        out.back().length += length;
        return;
    }
    DeltaInstruction insn;
    insn.code = DeltaInstruction::Code::Copy;
    insn.offset = offset;
    insn.length = length;
    out.push_back(insn);
}

}  // namespace

PatchStatus DeltaEngine::ComputeBlockInstructions(
    const std::vector<std::uint8_t>& source,
    const std::vector<std::uint8_t>& target,
    const std::size_t block_size,
    std::vector<DeltaInstruction>& out_instructions) {
    out_instructions.clear();
    if (block_size == 0 || block_size > std::numeric_limits<std::uint16_t>::max()) {
        return PatchStatus::InvalidArgument;
    }
    if (source.size() < block_size || target.size() < block_size) {
        ComputeLiteralInstructions(target, out_instructions);
        return PatchStatus::Ok;
    }

    // First offset of every full source block, keyed by weak checksum.
    std::unordered_map<std::uint32_t, std::size_t> blocks;
    blocks.reserve(source.size() / block_size + 1);
    for (std::size_t off = 0; off + block_size <= source.size(); off += block_size) {
        const RollingChecksum sum(source.data() + off, block_size);
        blocks.emplace(sum.Sum(), off);
    }

    std::size_t pos = 0;
    std::size_t literal_start = 0;
    RollingChecksum rolling(target.data(), block_size);
    while (pos + block_size <= target.size()) {
        const auto found = blocks.find(rolling.Sum());
        if (found != blocks.end() &&
            std::memcmp(source.data() + found->second, target.data() + pos, block_size) == 0) {
            std::size_t src = found->second;
            std::size_t len = block_size;
            while (src + len < source.size() && pos + len < target.size() &&
                   source[src + len] == target[pos + len]) {
                ++len;
            }
            // Pull matching bytes back out of the pending literal.
            while (src > 0 && pos > literal_start && source[src - 1] == target[pos - 1]) {
                --src;
                --pos;
                ++len;
            }

            PushInsert(out_instructions, literal_start, pos - literal_start);
            PushCopy(out_instructions, src, len);
            pos += len;
            literal_start = pos;
            if (pos + block_size <= target.size()) {
                rolling.Reset(target.data() + pos, block_size);
            }
            continue;
        }

        if (pos + block_size < target.size()) {
            rolling.Roll(target[pos], target[pos + block_size]);
        }
        ++pos;
    }

    PushInsert(out_instructions, literal_start, target.size() - literal_start);
    return PatchStatus::Ok;
}

void DeltaEngine::ComputeLiteralInstructions(
    const std::vector<std::uint8_t>& target,
    std::vector<DeltaInstruction>& out_instructions) {
    out_instructions.clear();
    PushInsert(out_instructions, 0, target.size());
}

PatchStatus DeltaEngine::EncodePayload(
    const std::vector<DeltaInstruction>& instructions,
    const std::vector<std::uint8_t>& target,
    const bool compress,
    const int compression_level,
    std::vector<std::uint8_t>& out_payload) {
    out_payload.clear();

    std::vector<std::uint8_t> body;
    AppendLittle64(body, static_cast<std::uint64_t>(target.size()));
    for (const auto& insn : instructions) {
        body.push_back(static_cast<std::uint8_t>(insn.code));
        if (insn.code == DeltaInstruction::Code::Copy) {
            AppendLittle64(body, insn.offset);
            AppendLittle64(body, insn.length);
            continue;
        }
        if (insn.literal_offset > target.size() || insn.length > target.size() - insn.literal_offset) {
            return PatchStatus::DiffError;
        }
        AppendLittle64(body, insn.length);
        const auto begin = target.begin() + static_cast<std::ptrdiff_t>(insn.literal_offset);
        body.insert(body.end(), begin, begin + static_cast<std::ptrdiff_t>(insn.length));
    }

    if (compress && body.size() <= std::numeric_limits<uLong>::max()) {
        uLongf packed_size = compressBound(static_cast<uLong>(body.size()));
        std::vector<std::uint8_t> packed(static_cast<std::size_t>(packed_size));
        const int rc = compress2(
            packed.data(),
            &packed_size,
            body.data(),
            static_cast<uLong>(body.size()),
            compression_level);
        if (rc != Z_OK) {
            return PatchStatus::DiffError;
        }
        packed.resize(static_cast<std::size_t>(packed_size));
        if (packed.size() + sizeof(std::uint64_t) < body.size()) {
            out_payload.reserve(1 + sizeof(std::uint64_t) + packed.size());
            out_payload.push_back(kPayloadZlib);
            AppendLittle64(out_payload, static_cast<std::uint64_t>(body.size()));
            out_payload.insert(out_payload.end(), packed.begin(), packed.end());
            return PatchStatus::Ok;
        }
    }

    out_payload.reserve(1 + body.size());
    out_payload.push_back(kPayloadRaw);
    out_payload.insert(out_payload.end(), body.begin(), body.end());
    return PatchStatus::Ok;
}

PatchStatus DeltaEngine::Inflate(const std::vector<std::uint8_t>& payload, std::vector<std::uint8_t>& out_body) {
    out_body.clear();
    std::size_t pos = 1;
    std::uint64_t body_size = 0;
    if (!ReadLittle64(payload, pos, body_size)) {
        return PatchStatus::DiffError;
    }
    const std::uint64_t packed_size = static_cast<std::uint64_t>(payload.size() - pos);
    if (packed_size == 0 || body_size > packed_size * kMaxInflateRatio + 64U ||
        body_size > std::numeric_limits<uLong>::max() || packed_size > std::numeric_limits<uLong>::max()) {
        return PatchStatus::DiffError;
    }

    out_body.resize(static_cast<std::size_t>(body_size));
    uLongf out_size = static_cast<uLongf>(body_size);
    const int rc = uncompress(
        out_body.data(),
        &out_size,
        payload.data() + pos,
        static_cast<uLong>(packed_size));
    if (rc != Z_OK || static_cast<std::uint64_t>(out_size) != body_size) {
        out_body.clear();
        return PatchStatus::DiffError;
    }
    return PatchStatus::Ok;
}

PatchStatus DeltaEngine::ApplyPayload(
    const std::vector<std::uint8_t>& source,
    const std::vector<std::uint8_t>& payload,
    std::vector<std::uint8_t>& out_target) {
    out_target.clear();
    const PatchStatus status = Replay(source, payload, out_target);
    if (status != PatchStatus::Ok) {
        out_target.clear();
    }
    return status;
}

PatchStatus DeltaEngine::Replay(
    const std::vector<std::uint8_t>& source,
    const std::vector<std::uint8_t>& payload,
    std::vector<std::uint8_t>& out_target) {
    if (payload.empty()) {
        return PatchStatus::DiffError;
    }

    std::vector<std::uint8_t> inflated;
    const std::vector<std::uint8_t>* body = &payload;
    std::size_t pos = 1;
    if (payload[0] == kPayloadZlib) {
        const PatchStatus status = Inflate(payload, inflated);
        if (status != PatchStatus::Ok) {
            return status;
        }
        body = &inflated;
        pos = 0;
    } else if (payload[0] != kPayloadRaw) {
        return PatchStatus::DiffError;
    }

    std::uint64_t target_size = 0;
    if (!ReadLittle64(*body, pos, target_size)) {
        return PatchStatus::DiffError;
    }
    if (target_size > std::numeric_limits<std::size_t>::max()) {
        return PatchStatus::DiffError;
    }
    // Output is bounded by what the body and source can actually produce.
    out_target.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(
        target_size, static_cast<std::uint64_t>(body->size()) + static_cast<std::uint64_t>(source.size()))));

    while (pos < body->size()) {
        const std::uint8_t code = (*body)[pos++];
        if (code == static_cast<std::uint8_t>(DeltaInstruction::Code::Copy)) {
            std::uint64_t offset = 0;
            std::uint64_t length = 0;
            if (!ReadLittle64(*body, pos, offset) || !ReadLittle64(*body, pos, length)) {
                return PatchStatus::DiffError;
            }
            if (offset > source.size() || length > source.size() - offset ||
                length > target_size - out_target.size()) {
                return PatchStatus::DiffError;
            }
            const auto begin = source.begin() + static_cast<std::ptrdiff_t>(offset);
            out_target.insert(out_target.end(), begin, begin + static_cast<std::ptrdiff_t>(length));
        } else if (code == static_cast<std::uint8_t>(DeltaInstruction::Code::Insert)) {
            std::uint64_t length = 0;
            if (!ReadLittle64(*body, pos, length) || !HasBytes(*body, pos, length) ||
                length > target_size - out_target.size()) {
                return PatchStatus::DiffError;
            }
            const auto begin = body->begin() + static_cast<std::ptrdiff_t>(pos);
            out_target.insert(out_target.end(), begin, begin + static_cast<std::ptrdiff_t>(length));
            pos += static_cast<std::size_t>(length);
        } else {
            return PatchStatus::DiffError;
        }
    }

    if (static_cast<std::uint64_t>(out_target.size()) != target_size) {
        return PatchStatus::DiffError;
    }
    return PatchStatus::Ok;
}

}  // namespace polypatch
