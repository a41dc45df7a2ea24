#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "polypatch/package_codec.hpp"
#include "polypatch/patch_engine.hpp"
#include "test_support.hpp"

using namespace polypatch;

class PatchEngineTest : public TempTreeTest {
protected:
    void SetUp() override {
        TempTreeTest::SetUp();
        before_ = Dir("before");
        after_ = Dir("after");
        patch_ = base_ / "update.ppkg";

        WriteText(before_ / "readme.md", "# project\nold text\n");
        WriteText(before_ / "bin" / "tool.dat", NoiseText(20000, 5));
        WriteText(before_ / "legacy" / "remove-me.txt", "legacy");
        WriteText(before_ / "same.txt", "unchanged");

        WriteText(after_ / "readme.md", "# project\nnew text\n");
        WriteText(after_ / "bin" / "tool.dat", NoiseText(20000, 5).replace(12000, 6, "PATCH!"));
        WriteText(after_ / "lib" / "added.so", NoiseText(512, 9));
        WriteText(after_ / "same.txt", "unchanged");
    }

    fs::path before_;
    fs::path after_;
    fs::path patch_;
};

TEST_F(PatchEngineTest, RoundTripTurnsBeforeIntoAfter) {
    const fs::path target = base_ / "target";
    CopyTree(before_, target);

    PatchFailure failure;
    ASSERT_EQ(PatchEngine::CreatePatch(patch_.string(), before_.string(), after_.string(), EngineOptions{}, failure),
              PatchStatus::Ok)
        << failure.detail;
    ASSERT_TRUE(fs::exists(patch_));

    ASSERT_EQ(PatchEngine::ApplyPatch(patch_.string(), target.string(), EngineOptions{}, failure), PatchStatus::Ok)
        << failure.detail;
    EXPECT_EQ(Snapshot(target), Snapshot(after_));
    EXPECT_FALSE(fs::exists(target / "legacy"));

    // Applying again leaves the updated tree as it is.
    ASSERT_EQ(PatchEngine::ApplyPatch(patch_.string(), target.string(), EngineOptions{}, failure), PatchStatus::Ok)
        << failure.detail;
    EXPECT_EQ(Snapshot(target), Snapshot(after_));
}

TEST_F(PatchEngineTest, LiteralDifferAndWorkersProduceEquivalentPatches) {
    const fs::path target = base_ / "target";
    CopyTree(before_, target);

    EngineOptions options;
    options.differ = "literal";
    options.differ_options.compress = false;
    options.builder_options.worker_count = 3;

    PatchFailure failure;
    ASSERT_EQ(PatchEngine::CreatePatch(patch_.string(), before_.string(), after_.string(), options, failure),
              PatchStatus::Ok);
    ASSERT_EQ(PatchEngine::ApplyPatch(patch_.string(), target.string(), EngineOptions{}, failure), PatchStatus::Ok);
    EXPECT_EQ(Snapshot(target), Snapshot(after_));
}

TEST_F(PatchEngineTest, RejectsForeignVersionWithoutTouchingTarget) {
    const fs::path target = base_ / "target";
    CopyTree(before_, target);

    PatchFailure failure;
    ASSERT_EQ(PatchEngine::CreatePatch(patch_.string(), before_.string(), after_.string(), EngineOptions{}, failure),
              PatchStatus::Ok);

    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(PackageCodec::ReadFile(patch_.string(), bytes), PatchStatus::Ok);
    bytes[PackageCodec::kPackageMagicSize] = 7;
    ASSERT_EQ(PackageCodec::WriteFile(patch_.string(), bytes), PatchStatus::Ok);

    EXPECT_EQ(PatchEngine::ApplyPatch(patch_.string(), target.string(), EngineOptions{}, failure),
              PatchStatus::UnsupportedVersion);
    EXPECT_EQ(failure.expected, "1");
    EXPECT_EQ(failure.actual, "7");
    EXPECT_EQ(Snapshot(target), Snapshot(before_));
}

TEST_F(PatchEngineTest, RejectsGarbagePatchFile) {
    WriteText(patch_, "this is not a patch");
    PatchFailure failure;
    EXPECT_EQ(PatchEngine::ApplyPatch(patch_.string(), Dir("target").string(), EngineOptions{}, failure),
              PatchStatus::CorruptPackage);
    EXPECT_EQ(PatchEngine::ApplyPatch((base_ / "missing.ppkg").string(), Dir("target").string(), EngineOptions{},
                                      failure),
              PatchStatus::IoError);
}

TEST_F(PatchEngineTest, FailedBuildLeavesNoPatchFile) {
    PatchFailure failure;
    EXPECT_EQ(PatchEngine::CreatePatch(patch_.string(), (base_ / "absent").string(), after_.string(), EngineOptions{},
                                       failure),
              PatchStatus::IoError);
    EXPECT_FALSE(fs::exists(patch_));

    EngineOptions unknown;
    unknown.differ = "bsdiff";
    EXPECT_EQ(PatchEngine::CreatePatch(patch_.string(), before_.string(), after_.string(), unknown, failure),
              PatchStatus::InvalidArgument);
    EXPECT_FALSE(fs::exists(patch_));
}

TEST_F(PatchEngineTest, InspectListsEntries) {
    PatchFailure failure;
    ASSERT_EQ(PatchEngine::CreatePatch(patch_.string(), before_.string(), after_.string(), EngineOptions{}, failure),
              PatchStatus::Ok);

    PackageHeader header;
    std::vector<EntryRecord> records;
    ASSERT_EQ(PatchEngine::InspectPatch(patch_.string(), header, records, failure), PatchStatus::Ok);
    EXPECT_EQ(header.format_version, kPatchFormatVersion);
    ASSERT_EQ(header.entry_count, 4U);
    ASSERT_EQ(records.size(), 4U);

    EXPECT_EQ(records[0].rel_path, "bin/tool.dat");
    EXPECT_EQ(records[0].kind, EntryKind::Modify);
    // A six byte edit must not ship the whole 20000 byte file.
    EXPECT_LT(records[0].payload_size, 2000U);
    EXPECT_EQ(records[1].rel_path, "legacy/remove-me.txt");
    EXPECT_EQ(records[1].kind, EntryKind::Remove);
    EXPECT_EQ(records[2].rel_path, "lib/added.so");
    EXPECT_EQ(records[2].kind, EntryKind::Add);
    EXPECT_EQ(records[2].payload_size, 512U);
    EXPECT_EQ(records[3].rel_path, "readme.md");
    EXPECT_EQ(records[3].kind, EntryKind::Modify);
}

TEST_F(PatchEngineTest, ReportsApplyProgress) {
    const fs::path target = base_ / "target";
    CopyTree(before_, target);

    PatchFailure failure;
    ASSERT_EQ(PatchEngine::CreatePatch(patch_.string(), before_.string(), after_.string(), EngineOptions{}, failure),
              PatchStatus::Ok);

    std::size_t last_done = 0;
    std::size_t last_total = 0;
    EngineOptions options;
    options.progress = [&](const std::size_t done, const std::size_t total) {
        last_done = done;
        last_total = total;
    };
    ASSERT_EQ(PatchEngine::ApplyPatch(patch_.string(), target.string(), options, failure), PatchStatus::Ok);
    EXPECT_EQ(last_total, 4U);
    EXPECT_EQ(last_done, 4U);
}

TEST_F(PatchEngineTest, HonorsConfiguredFormatVersion) {
    const fs::path target = base_ / "target";
    CopyTree(before_, target);

    EngineOptions options;
    options.builder_options.format_version = 2;
    options.applier_options.supported_version = 2;

    PatchFailure failure;
    ASSERT_EQ(PatchEngine::CreatePatch(patch_.string(), before_.string(), after_.string(), options, failure),
              PatchStatus::Ok);

    // A default applier still refuses it, with the version context intact.
    EXPECT_EQ(PatchEngine::ApplyPatch(patch_.string(), target.string(), EngineOptions{}, failure),
              PatchStatus::UnsupportedVersion);
    EXPECT_EQ(failure.expected, "1");
    EXPECT_EQ(failure.actual, "2");
    EXPECT_EQ(Snapshot(target), Snapshot(before_));

    ASSERT_EQ(PatchEngine::ApplyPatch(patch_.string(), target.string(), options, failure), PatchStatus::Ok)
        << failure.detail;
    EXPECT_EQ(Snapshot(target), Snapshot(after_));
}

#ifndef _WIN32
TEST_F(PatchEngineTest, BackslashInFileNameIsAnInvalidPath) {
    WriteText(after_ / "a\\b.txt", "x");

    PatchFailure failure;
    EXPECT_EQ(PatchEngine::CreatePatch(patch_.string(), before_.string(), after_.string(), EngineOptions{}, failure),
              PatchStatus::InvalidPath);
    EXPECT_EQ(failure.rel_path, "a\\b.txt");
    EXPECT_FALSE(fs::exists(patch_));
}
#endif

// Entries are ordered by path, so "x" is added before "x/y" is removed and
// the directory is still in the way.
TEST_F(PatchEngineTest, DirectoryReplacedByFileStopsAtTheAdd) {
    const fs::path before = Dir("dir-before");
    const fs::path after = Dir("dir-after");
    const fs::path target = base_ / "dir-target";
    WriteText(before / "x" / "y", "nested");
    WriteText(after / "x", "flat");
    CopyTree(before, target);

    PatchFailure failure;
    ASSERT_EQ(PatchEngine::CreatePatch(patch_.string(), before.string(), after.string(), EngineOptions{}, failure),
              PatchStatus::Ok);

    PackageHeader header;
    std::vector<EntryRecord> records;
    ASSERT_EQ(PatchEngine::InspectPatch(patch_.string(), header, records, failure), PatchStatus::Ok);
    ASSERT_EQ(records.size(), 2U);
    EXPECT_EQ(records[0].kind, EntryKind::Add);
    EXPECT_EQ(records[0].rel_path, "x");
    EXPECT_EQ(records[1].kind, EntryKind::Remove);
    EXPECT_EQ(records[1].rel_path, "x/y");

    EXPECT_EQ(PatchEngine::ApplyPatch(patch_.string(), target.string(), EngineOptions{}, failure),
              PatchStatus::IoError);
    EXPECT_EQ(failure.rel_path, "x");
    EXPECT_EQ(ReadText(target / "x" / "y"), "nested");
}
