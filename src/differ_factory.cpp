#include "polypatch/differ_factory.hpp"

#include <memory>
#include <string>
#include <vector>

#include "polypatch/delta_engine.hpp"

namespace polypatch {

namespace {

// Shared by every bundled differ: they only differ in how instructions are found.
class InstructionDiffer : public IContentDiffer {
public:
    explicit InstructionDiffer(const DifferOptions options) : options_(options) {}

    PatchStatus Diff(
        const std::vector<std::uint8_t>& before,
        const std::vector<std::uint8_t>& after,
        Delta& out_delta) const override {
        out_delta = Delta{};
        PatchStatus status = ComputeFingerprint(before, out_delta.before_fingerprint);
        if (status != PatchStatus::Ok) {
            return status;
        }
        status = ComputeFingerprint(after, out_delta.after_fingerprint);
        if (status != PatchStatus::Ok) {
            return status;
        }

        std::vector<DeltaInstruction> instructions;
        status = FindInstructions(before, after, instructions);
        if (status != PatchStatus::Ok) {
            return status;
        }
        return DeltaEngine::EncodePayload(
            instructions, after, options_.compress, options_.compression_level, out_delta.payload);
    }

    PatchStatus ApplyDelta(
        const std::vector<std::uint8_t>& before,
        const Delta& delta,
        std::vector<std::uint8_t>& out_after) const override {
        return DeltaEngine::ApplyPayload(before, delta.payload, out_after);
    }

protected:
    virtual PatchStatus FindInstructions(
        const std::vector<std::uint8_t>& before,
        const std::vector<std::uint8_t>& after,
        std::vector<DeltaInstruction>& out_instructions) const = 0;

    DifferOptions options_;
};

class BlockDiffer final : public InstructionDiffer {
public:
    explicit BlockDiffer(const DifferOptions options) : InstructionDiffer(options) {}

    std::string_view Name() const override {
        return "block";
    }

protected:
    PatchStatus FindInstructions(
        const std::vector<std::uint8_t>& before,
        const std::vector<std::uint8_t>& after,
        std::vector<DeltaInstruction>& out_instructions) const override {
        return DeltaEngine::ComputeBlockInstructions(before, after, options_.block_size, out_instructions);
    }
};

class LiteralDiffer final : public InstructionDiffer {
public:
    explicit LiteralDiffer(const DifferOptions options) : InstructionDiffer(options) {}

    std::string_view Name() const override {
        return "literal";
    }

protected:
    PatchStatus FindInstructions(
        const std::vector<std::uint8_t>& before,
        const std::vector<std::uint8_t>& after,
        std::vector<DeltaInstruction>& out_instructions) const override {
        (void)before;
        DeltaEngine::ComputeLiteralInstructions(after, out_instructions);
        return PatchStatus::Ok;
    }
};

}  // namespace

std::unique_ptr<IContentDiffer> DifferFactory::Create(
    const std::string_view differ_name,
    const DifferOptions& options,
    PatchStatus& out_status) {
    std::string normalized(differ_name);
    for (char& ch : normalized) {
        if (ch >= 'A' && ch <= 'Z') {
            ch = static_cast<char>(ch - 'A' + 'a');
        }
    }

    if (options.block_size == 0 || options.block_size > 65535U ||
        options.compression_level < 0 || options.compression_level > 9) {
        out_status = PatchStatus::InvalidArgument;
        return nullptr;
    }

    if (normalized == "block") {
        out_status = PatchStatus::Ok;
        return std::make_unique<BlockDiffer>(options);
    }
    if (normalized == "literal") {
        out_status = PatchStatus::Ok;
        return std::make_unique<LiteralDiffer>(options);
    }

    out_status = PatchStatus::InvalidArgument;
    return nullptr;
}

}  // namespace polypatch
