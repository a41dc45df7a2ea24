#include "polypatch/fingerprint.hpp"

#include <string>
#include <vector>

#include "cryptlib.h"
#include "sha.h"

namespace polypatch {

static_assert(CryptoPP::SHA256::DIGESTSIZE == kFingerprintSize, "fingerprint size must match SHA-256");

PatchStatus FingerprintHasher::Compute(const std::vector<std::uint8_t>& data, Fingerprint& out_fingerprint) {
    out_fingerprint.fill(0U);
    try {
        CryptoPP::SHA256 hash;
        hash.CalculateDigest(out_fingerprint.data(), data.empty() ? nullptr : data.data(), data.size());
    } catch (const CryptoPP::Exception&) {
        out_fingerprint.fill(0U);
        return PatchStatus::DiffError;
    }
    return PatchStatus::Ok;
}

std::string FingerprintHasher::ToHex(const Fingerprint& fingerprint) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(fingerprint.size() * 2);
    for (const std::uint8_t value : fingerprint) {
        out.push_back(kHex[(value >> 4U) & 0x0FU]);
        out.push_back(kHex[value & 0x0FU]);
    }
    return out;
}

}  // namespace polypatch
