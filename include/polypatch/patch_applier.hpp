#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "polypatch/content_differ.hpp"
#include "polypatch/patch_package.hpp"
#include "polypatch/patch_status.hpp"

namespace polypatch {

struct ApplierOptions {
    std::uint32_t supported_version = kPatchFormatVersion;
    // Accept a Modify whose destination already holds the post-image.
    bool tolerate_applied = true;
};

class PatchApplier {
public:
    PatchApplier(const ApplierOptions& options, const IContentDiffer& differ);

    // Entries are applied in order. On failure, earlier entries stay applied
    // and the failing entry has not been written.
    PatchStatus Apply(
        const PatchPackage& package,
        const std::string& target_root,
        PatchFailure& out_failure,
        const std::function<void(std::size_t, std::size_t)>& progress = {}) const;

    PatchStatus CheckVersion(std::uint32_t format_version, PatchFailure& out_failure) const;

private:
    PatchStatus ResolveEntryPath(
        const std::filesystem::path& root,
        const std::string& rel_path,
        std::filesystem::path& out_path,
        PatchFailure& out_failure) const;

    PatchStatus ApplyAdd(const AddOp& op, const std::filesystem::path& dest, const std::string& rel_path,
                         PatchFailure& out_failure) const;
    PatchStatus ApplyRemove(const std::filesystem::path& root, const std::filesystem::path& dest,
                            const std::string& rel_path, PatchFailure& out_failure) const;
    PatchStatus ApplyModify(const ModifyOp& op, const std::filesystem::path& dest, const std::string& rel_path,
                            PatchFailure& out_failure) const;

    ApplierOptions options_;
    const IContentDiffer& differ_;
};

}  // namespace polypatch
