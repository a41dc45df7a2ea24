#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace polypatch {

// Little-endian field helpers shared by the package codec and the block differ.
// Readers advance pos only on success and never read past in.size().

inline void AppendLittle16(std::vector<std::uint8_t>& out, const std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
}

inline void AppendLittle32(std::vector<std::uint8_t>& out, const std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 16U) & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 24U) & 0xFFU));
}

inline void AppendLittle64(std::vector<std::uint8_t>& out, const std::uint64_t value) {
    for (unsigned shift = 0; shift < 64U; shift += 8U) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
    }
}

inline bool ReadLittle16(const std::vector<std::uint8_t>& in, std::size_t& pos, std::uint16_t& value) {
    if (pos > in.size() || in.size() - pos < 2) {
        return false;
    }
    value = static_cast<std::uint16_t>(in[pos] | (static_cast<std::uint16_t>(in[pos + 1]) << 8U));
    pos += 2;
    return true;
}

inline bool ReadLittle32(const std::vector<std::uint8_t>& in, std::size_t& pos, std::uint32_t& value) {
    if (pos > in.size() || in.size() - pos < 4) {
        return false;
    }
    value = static_cast<std::uint32_t>(
        in[pos] |
        (static_cast<std::uint32_t>(in[pos + 1]) << 8U) |
        (static_cast<std::uint32_t>(in[pos + 2]) << 16U) |
        (static_cast<std::uint32_t>(in[pos + 3]) << 24U));
    pos += 4;
    return true;
}

inline bool ReadLittle64(const std::vector<std::uint8_t>& in, std::size_t& pos, std::uint64_t& value) {
    if (pos > in.size() || in.size() - pos < 8) {
        return false;
    }
    value = 0;
    for (unsigned i = 0; i < 8U; ++i) {
        value |= static_cast<std::uint64_t>(in[pos + i]) << (i * 8U);
    }
    pos += 8;
    return true;
}

// True when count bytes are available at pos.
inline bool HasBytes(const std::vector<std::uint8_t>& in, const std::size_t pos, const std::uint64_t count) {
    return pos <= in.size() && count <= static_cast<std::uint64_t>(in.size() - pos);
}

}  // namespace polypatch
