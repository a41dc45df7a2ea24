#include "polypatch/package_codec.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#include "polypatch/byte_order.hpp"
#include "polypatch/file_io.hpp"

namespace polypatch {

namespace {

// Smallest possible encoded entry: kind, path length and a one byte path.
constexpr std::size_t kMinEntrySize = 1 + 2 + 1;

void AppendBytes(std::vector<std::uint8_t>& out, const std::vector<std::uint8_t>& bytes) {
    AppendLittle64(out, static_cast<std::uint64_t>(bytes.size()));
    out.insert(out.end(), bytes.begin(), bytes.end());
}

bool ReadFingerprint(const std::vector<std::uint8_t>& in, std::size_t& pos, Fingerprint& out) {
    if (!HasBytes(in, pos, out.size())) {
        return false;
    }
    std::copy_n(in.begin() + static_cast<std::ptrdiff_t>(pos), out.size(), out.begin());
    pos += out.size();
    return true;
}

bool ReadSizedPayload(const std::vector<std::uint8_t>& in, std::size_t& pos, EntryRecord& record) {
    std::uint64_t size = 0;
    if (!ReadLittle64(in, pos, size) || !HasBytes(in, pos, size)) {
        return false;
    }
    record.payload_offset = pos;
    record.payload_size = size;
    pos += static_cast<std::size_t>(size);
    return true;
}

std::vector<std::uint8_t> CopyPayload(const std::vector<std::uint8_t>& bytes, const EntryRecord& record) {
    const auto begin = bytes.begin() + static_cast<std::ptrdiff_t>(record.payload_offset);
    return std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(record.payload_size));
}

}  // namespace

PatchStatus PackageCodec::Encode(const PatchPackage& package, std::vector<std::uint8_t>& out_bytes) {
    out_bytes.clear();
    if (package.entries.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
        return PatchStatus::CorruptPackage;
    }

    out_bytes.insert(out_bytes.end(), kPackageMagic, kPackageMagic + kPackageMagicSize);
    AppendLittle32(out_bytes, package.format_version);
    AppendLittle32(out_bytes, static_cast<std::uint32_t>(package.entries.size()));

    for (const auto& entry : package.entries) {
        if (!ValidateRelativePath(entry.rel_path) ||
            entry.rel_path.size() > static_cast<std::size_t>(std::numeric_limits<std::uint16_t>::max())) {
            out_bytes.clear();
            return PatchStatus::InvalidPath;
        }
        out_bytes.push_back(static_cast<std::uint8_t>(KindOf(entry.operation)));
        AppendLittle16(out_bytes, static_cast<std::uint16_t>(entry.rel_path.size()));
        out_bytes.insert(out_bytes.end(), entry.rel_path.begin(), entry.rel_path.end());

        if (const auto* add = std::get_if<AddOp>(&entry.operation)) {
            AppendBytes(out_bytes, add->content);
        } else if (const auto* modify = std::get_if<ModifyOp>(&entry.operation)) {
            out_bytes.insert(
                out_bytes.end(), modify->delta.before_fingerprint.begin(), modify->delta.before_fingerprint.end());
            out_bytes.insert(
                out_bytes.end(), modify->delta.after_fingerprint.begin(), modify->delta.after_fingerprint.end());
            AppendBytes(out_bytes, modify->delta.payload);
        }
    }
    return PatchStatus::Ok;
}

PatchStatus PackageCodec::PeekHeader(const std::vector<std::uint8_t>& bytes, PackageHeader& out_header) {
    out_header = PackageHeader{};
    if (bytes.size() < kHeaderSize) {
        return PatchStatus::CorruptPackage;
    }
    if (std::memcmp(bytes.data(), kPackageMagic, kPackageMagicSize) != 0) {
        return PatchStatus::CorruptPackage;
    }
    std::size_t pos = kPackageMagicSize;
    if (!ReadLittle32(bytes, pos, out_header.format_version) || !ReadLittle32(bytes, pos, out_header.entry_count)) {
        return PatchStatus::CorruptPackage;
    }
    return PatchStatus::Ok;
}

PatchStatus PackageCodec::Inspect(
    const std::vector<std::uint8_t>& bytes,
    PackageHeader& out_header,
    std::vector<EntryRecord>& out_records,
    const std::uint32_t supported_version) {
    out_records.clear();

    const PatchStatus header_status = PeekHeader(bytes, out_header);
    if (header_status != PatchStatus::Ok) {
        return header_status;
    }
    if (out_header.format_version != supported_version) {
        return PatchStatus::UnsupportedVersion;
    }

    std::size_t pos = kHeaderSize;
    // The count is untrusted; never reserve more than the buffer could hold.
    out_records.reserve(std::min<std::size_t>(out_header.entry_count, (bytes.size() - pos) / kMinEntrySize));

    for (std::uint32_t i = 0; i < out_header.entry_count; ++i) {
        if (pos >= bytes.size()) {
            out_records.clear();
            return PatchStatus::CorruptPackage;
        }
        EntryRecord record;
        const std::uint8_t kind = bytes[pos++];
        if (kind != static_cast<std::uint8_t>(EntryKind::Add) &&
            kind != static_cast<std::uint8_t>(EntryKind::Remove) &&
            kind != static_cast<std::uint8_t>(EntryKind::Modify)) {
            out_records.clear();
            return PatchStatus::CorruptPackage;
        }
        record.kind = static_cast<EntryKind>(kind);

        std::uint16_t path_len = 0;
        if (!ReadLittle16(bytes, pos, path_len) || !HasBytes(bytes, pos, path_len)) {
            out_records.clear();
            return PatchStatus::CorruptPackage;
        }
        record.rel_path.assign(reinterpret_cast<const char*>(bytes.data() + pos), path_len);
        pos += path_len;
        if (!ValidateRelativePath(record.rel_path)) {
            out_records.clear();
            return PatchStatus::CorruptPackage;
        }

        bool ok = true;
        switch (record.kind) {
            case EntryKind::Add:
                ok = ReadSizedPayload(bytes, pos, record);
                break;
            case EntryKind::Remove:
                record.payload_offset = pos;
                break;
            case EntryKind::Modify:
                ok = ReadFingerprint(bytes, pos, record.before_fingerprint) &&
                     ReadFingerprint(bytes, pos, record.after_fingerprint) &&
                     ReadSizedPayload(bytes, pos, record);
                break;
        }
        if (!ok) {
            out_records.clear();
            return PatchStatus::CorruptPackage;
        }
        out_records.push_back(std::move(record));
    }

    if (pos != bytes.size()) {
        out_records.clear();
        return PatchStatus::CorruptPackage;
    }
    return PatchStatus::Ok;
}

PatchStatus PackageCodec::Decode(
    const std::vector<std::uint8_t>& bytes,
    PatchPackage& out_package,
    const std::uint32_t supported_version) {
    out_package = PatchPackage{};

    PackageHeader header;
    std::vector<EntryRecord> records;
    const PatchStatus status = Inspect(bytes, header, records, supported_version);
    if (status != PatchStatus::Ok) {
        return status;
    }

    out_package.format_version = header.format_version;
    out_package.entries.reserve(records.size());
    for (auto& record : records) {
        PatchEntry entry;
        entry.rel_path = std::move(record.rel_path);
        switch (record.kind) {
            case EntryKind::Add:
                entry.operation = AddOp{CopyPayload(bytes, record)};
                break;
            case EntryKind::Remove:
                entry.operation = RemoveOp{};
                break;
            case EntryKind::Modify: {
                ModifyOp modify;
                modify.delta.before_fingerprint = record.before_fingerprint;
                modify.delta.after_fingerprint = record.after_fingerprint;
                modify.delta.payload = CopyPayload(bytes, record);
                entry.operation = std::move(modify);
                break;
            }
        }
        out_package.entries.push_back(std::move(entry));
    }
    return PatchStatus::Ok;
}

PatchStatus PackageCodec::ReadFile(const std::string& path, std::vector<std::uint8_t>& out_bytes) {
    return FileIO::ReadAll(PathFromUtf8(path), out_bytes);
}

PatchStatus PackageCodec::WriteFile(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    return FileIO::WriteReplace(PathFromUtf8(path), bytes);
}

// Only structural checks; containment is decided when the entry is applied.
bool PackageCodec::ValidateRelativePath(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    return path.find('\0') == std::string::npos;
}

}  // namespace polypatch
