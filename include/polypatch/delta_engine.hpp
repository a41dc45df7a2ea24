#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "polypatch/patch_status.hpp"

namespace polypatch {

// Copy/insert instruction stream used by every bundled differ.
//
// payload := flags u8 | body                      (flags == kPayloadRaw)
//          | flags u8 | body_size u64 | zlib(body) (flags == kPayloadZlib)
// body    := target_size u64 | insn*
// insn    := 'C' offset u64 length u64   copy from the source buffer
//          | 'I' length u64 bytes        insert literal bytes
struct DeltaInstruction {
    enum class Code : std::uint8_t {
        Copy = 'C',
        Insert = 'I'
    };

    Code code = Code::Insert;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    // Insert bytes live in the target buffer at this offset while building.
    std::size_t literal_offset = 0;
};

class DeltaEngine {
public:
    static constexpr std::uint8_t kPayloadRaw = 0x00;
    static constexpr std::uint8_t kPayloadZlib = 0x01;

    // Rolling-checksum block matching, after xdelta.
    static PatchStatus ComputeBlockInstructions(
        const std::vector<std::uint8_t>& source,
        const std::vector<std::uint8_t>& target,
        std::size_t block_size,
        std::vector<DeltaInstruction>& out_instructions);

    static void ComputeLiteralInstructions(
        const std::vector<std::uint8_t>& target,
        std::vector<DeltaInstruction>& out_instructions);

    static PatchStatus EncodePayload(
        const std::vector<DeltaInstruction>& instructions,
        const std::vector<std::uint8_t>& target,
        bool compress,
        int compression_level,
        std::vector<std::uint8_t>& out_payload);

    static PatchStatus ApplyPayload(
        const std::vector<std::uint8_t>& source,
        const std::vector<std::uint8_t>& payload,
        std::vector<std::uint8_t>& out_target);

private:
    static PatchStatus Replay(
        const std::vector<std::uint8_t>& source,
        const std::vector<std::uint8_t>& payload,
        std::vector<std::uint8_t>& out_target);

    static PatchStatus Inflate(
        const std::vector<std::uint8_t>& payload,
        std::vector<std::uint8_t>& out_body);
};

}  // namespace polypatch
