#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "polypatch/patch_status.hpp"

namespace polypatch {

constexpr std::size_t kFingerprintSize = 32;

using Fingerprint = std::array<std::uint8_t, kFingerprintSize>;

class FingerprintHasher {
public:
    // SHA-256 over the whole buffer.
    static PatchStatus Compute(const std::vector<std::uint8_t>& data, Fingerprint& out_fingerprint);

    static std::string ToHex(const Fingerprint& fingerprint);
};

}  // namespace polypatch
