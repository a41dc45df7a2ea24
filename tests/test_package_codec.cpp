#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "polypatch/byte_order.hpp"
#include "polypatch/package_codec.hpp"
#include "polypatch/patch_package.hpp"
#include "test_support.hpp"

using namespace polypatch;

namespace {

PatchPackage SamplePackage() {
    PatchPackage package;

    ModifyOp modify;
    modify.delta.before_fingerprint.fill(0x11);
    modify.delta.after_fingerprint.fill(0x22);
    modify.delta.payload = Bytes("delta-bytes");

    package.entries.push_back(MakeEntry(AddOp{Bytes("fresh file")}, "docs/new.txt"));
    package.entries.push_back(MakeEntry(std::move(modify), "lib/changed.bin"));
    package.entries.push_back(MakeEntry(RemoveOp{}, "old.txt"));
    return package;
}

}  // namespace

TEST(PackageCodecTest, EncodesHeaderAndDecodesEntries) {
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(PackageCodec::Encode(SamplePackage(), bytes), PatchStatus::Ok);
    ASSERT_GE(bytes.size(), PackageCodec::kHeaderSize);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "PPKG");

    PackageHeader header;
    ASSERT_EQ(PackageCodec::PeekHeader(bytes, header), PatchStatus::Ok);
    EXPECT_EQ(header.format_version, kPatchFormatVersion);
    EXPECT_EQ(header.entry_count, 3U);

    PatchPackage decoded;
    ASSERT_EQ(PackageCodec::Decode(bytes, decoded), PatchStatus::Ok);
    ASSERT_EQ(decoded.entries.size(), 3U);

    const auto* add = std::get_if<AddOp>(&decoded.entries[0].operation);
    ASSERT_NE(add, nullptr);
    EXPECT_EQ(decoded.entries[0].rel_path, "docs/new.txt");
    EXPECT_EQ(add->content, Bytes("fresh file"));

    const auto* modify = std::get_if<ModifyOp>(&decoded.entries[1].operation);
    ASSERT_NE(modify, nullptr);
    EXPECT_EQ(modify->delta.before_fingerprint[0], 0x11);
    EXPECT_EQ(modify->delta.after_fingerprint[31], 0x22);
    EXPECT_EQ(modify->delta.payload, Bytes("delta-bytes"));

    EXPECT_TRUE(std::holds_alternative<RemoveOp>(decoded.entries[2].operation));
    EXPECT_EQ(decoded.entries[2].rel_path, "old.txt");
}

TEST(PackageCodecTest, EncodingIsDeterministic) {
    std::vector<std::uint8_t> first;
    std::vector<std::uint8_t> second;
    ASSERT_EQ(PackageCodec::Encode(SamplePackage(), first), PatchStatus::Ok);
    ASSERT_EQ(PackageCodec::Encode(SamplePackage(), second), PatchStatus::Ok);
    EXPECT_EQ(first, second);
}

TEST(PackageCodecTest, InspectLocatesPayloads) {
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(PackageCodec::Encode(SamplePackage(), bytes), PatchStatus::Ok);

    PackageHeader header;
    std::vector<EntryRecord> records;
    ASSERT_EQ(PackageCodec::Inspect(bytes, header, records), PatchStatus::Ok);
    ASSERT_EQ(records.size(), 3U);

    EXPECT_EQ(records[0].kind, EntryKind::Add);
    EXPECT_EQ(records[0].payload_size, 10U);
    const std::string add_payload(
        bytes.begin() + static_cast<std::ptrdiff_t>(records[0].payload_offset),
        bytes.begin() + static_cast<std::ptrdiff_t>(records[0].payload_offset + records[0].payload_size));
    EXPECT_EQ(add_payload, "fresh file");

    EXPECT_EQ(records[1].kind, EntryKind::Modify);
    EXPECT_EQ(records[1].payload_size, 11U);
    EXPECT_EQ(records[1].before_fingerprint[5], 0x11);

    EXPECT_EQ(records[2].kind, EntryKind::Remove);
    EXPECT_EQ(records[2].payload_size, 0U);
    EXPECT_EQ(KindLetter(records[2].kind), 'R');
}

TEST(PackageCodecTest, EmptyPackageIsHeaderOnly) {
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(PackageCodec::Encode(PatchPackage{}, bytes), PatchStatus::Ok);
    EXPECT_EQ(bytes.size(), PackageCodec::kHeaderSize);

    PatchPackage decoded;
    ASSERT_EQ(PackageCodec::Decode(bytes, decoded), PatchStatus::Ok);
    EXPECT_TRUE(decoded.entries.empty());
}

TEST(PackageCodecTest, RejectsBadMagicAndTruncation) {
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(PackageCodec::Encode(SamplePackage(), bytes), PatchStatus::Ok);
    PatchPackage decoded;

    std::vector<std::uint8_t> bad_magic = bytes;
    bad_magic[0] = 'X';
    EXPECT_EQ(PackageCodec::Decode(bad_magic, decoded), PatchStatus::CorruptPackage);

    const std::vector<std::uint8_t> short_header(bytes.begin(), bytes.begin() + 7);
    EXPECT_EQ(PackageCodec::Decode(short_header, decoded), PatchStatus::CorruptPackage);

    for (std::size_t cut = PackageCodec::kHeaderSize; cut < bytes.size(); cut += 7) {
        const std::vector<std::uint8_t> truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(cut));
        EXPECT_EQ(PackageCodec::Decode(truncated, decoded), PatchStatus::CorruptPackage) << "cut at " << cut;
        EXPECT_TRUE(decoded.entries.empty());
    }
}

TEST(PackageCodecTest, RejectsTrailingBytesAndUnknownKinds) {
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(PackageCodec::Encode(SamplePackage(), bytes), PatchStatus::Ok);
    PatchPackage decoded;

    std::vector<std::uint8_t> trailing = bytes;
    trailing.push_back(0);
    EXPECT_EQ(PackageCodec::Decode(trailing, decoded), PatchStatus::CorruptPackage);

    std::vector<std::uint8_t> unknown_kind = bytes;
    unknown_kind[PackageCodec::kHeaderSize] = 9;
    EXPECT_EQ(PackageCodec::Decode(unknown_kind, decoded), PatchStatus::CorruptPackage);

    // Claims more entries than are present.
    std::vector<std::uint8_t> overcount;
    overcount.insert(overcount.end(), bytes.begin(), bytes.begin() + 8);
    AppendLittle32(overcount, 1000000);
    overcount.insert(overcount.end(), bytes.begin() + 12, bytes.end());
    EXPECT_EQ(PackageCodec::Decode(overcount, decoded), PatchStatus::CorruptPackage);
}

TEST(PackageCodecTest, ReportsForeignVersion) {
    PatchPackage package = SamplePackage();
    package.format_version = 2;
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(PackageCodec::Encode(package, bytes), PatchStatus::Ok);

    PackageHeader header;
    ASSERT_EQ(PackageCodec::PeekHeader(bytes, header), PatchStatus::Ok);
    EXPECT_EQ(header.format_version, 2U);

    PatchPackage decoded;
    EXPECT_EQ(PackageCodec::Decode(bytes, decoded), PatchStatus::UnsupportedVersion);

    ASSERT_EQ(PackageCodec::Decode(bytes, decoded, 2), PatchStatus::Ok);
    EXPECT_EQ(decoded.format_version, 2U);
    EXPECT_EQ(decoded.entries.size(), 3U);
}

TEST(PackageCodecTest, KeepsEscapingPathsForTheApplier) {
    PatchPackage package;
    package.entries.push_back(MakeEntry(AddOp{Bytes("x")}, "../outside.txt"));
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(PackageCodec::Encode(package, bytes), PatchStatus::Ok);

    PatchPackage decoded;
    ASSERT_EQ(PackageCodec::Decode(bytes, decoded), PatchStatus::Ok);
    EXPECT_EQ(decoded.entries[0].rel_path, "../outside.txt");

    PatchPackage empty_path;
    empty_path.entries.push_back(PatchEntry{RemoveOp{}, ""});
    EXPECT_EQ(PackageCodec::Encode(empty_path, bytes), PatchStatus::InvalidPath);
}

TEST(PackageCodecTest, NormalizesBackslashSeparators) {
    const PatchEntry entry = MakeEntry(RemoveOp{}, "dir\\sub\\file.txt");
    EXPECT_EQ(entry.rel_path, "dir/sub/file.txt");
}
