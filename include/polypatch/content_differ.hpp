#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "polypatch/fingerprint.hpp"
#include "polypatch/patch_status.hpp"

namespace polypatch {

struct Delta {
    Fingerprint before_fingerprint{};
    Fingerprint after_fingerprint{};
    std::vector<std::uint8_t> payload;
};

class IContentDiffer {
public:
    virtual ~IContentDiffer() = default;

    virtual PatchStatus Diff(
        const std::vector<std::uint8_t>& before,
        const std::vector<std::uint8_t>& after,
        Delta& out_delta) const = 0;

    // Reconstructs the post-image. Does not check fingerprints; callers do.
    virtual PatchStatus ApplyDelta(
        const std::vector<std::uint8_t>& before,
        const Delta& delta,
        std::vector<std::uint8_t>& out_after) const = 0;

    virtual PatchStatus ComputeFingerprint(const std::vector<std::uint8_t>& data, Fingerprint& out) const {
        return FingerprintHasher::Compute(data, out);
    }

    virtual std::string_view Name() const = 0;
};

}  // namespace polypatch
