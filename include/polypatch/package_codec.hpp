#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "polypatch/patch_package.hpp"
#include "polypatch/patch_status.hpp"

namespace polypatch {

struct PackageHeader {
    std::uint32_t format_version = 0;
    std::uint32_t entry_count = 0;
};

// Entry located inside an encoded package; payload bytes are not copied.
// For Modify, the payload range covers only the differ payload, the two
// fingerprints are copied into the record.
struct EntryRecord {
    EntryKind kind = EntryKind::Remove;
    std::string rel_path;
    std::size_t payload_offset = 0;
    std::uint64_t payload_size = 0;
    Fingerprint before_fingerprint{};
    Fingerprint after_fingerprint{};
};

class PackageCodec {
public:
    static constexpr const char* kPackageMagic = "PPKG";
    static constexpr std::size_t kPackageMagicSize = 4;
    static constexpr std::size_t kHeaderSize = kPackageMagicSize + 2 * sizeof(std::uint32_t);

    static PatchStatus Encode(const PatchPackage& package, std::vector<std::uint8_t>& out_bytes);

    static PatchStatus PeekHeader(const std::vector<std::uint8_t>& bytes, PackageHeader& out_header);

    // Entries are only parsed for supported_version; any other header
    // version is UnsupportedVersion.
    static PatchStatus Inspect(
        const std::vector<std::uint8_t>& bytes,
        PackageHeader& out_header,
        std::vector<EntryRecord>& out_records,
        std::uint32_t supported_version = kPatchFormatVersion);

    static PatchStatus Decode(
        const std::vector<std::uint8_t>& bytes,
        PatchPackage& out_package,
        std::uint32_t supported_version = kPatchFormatVersion);

    static PatchStatus ReadFile(const std::string& path, std::vector<std::uint8_t>& out_bytes);

    static PatchStatus WriteFile(const std::string& path, const std::vector<std::uint8_t>& bytes);

private:
    static bool ValidateRelativePath(const std::string& path);
};

}  // namespace polypatch
