#include "polypatch/patch_engine.hpp"

#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace polypatch {

namespace {

std::unique_ptr<IContentDiffer> CreateDiffer(const EngineOptions& options, PatchFailure& out_failure,
                                             PatchStatus& out_status) {
    std::unique_ptr<IContentDiffer> differ = DifferFactory::Create(options.differ, options.differ_options, out_status);
    if (out_status != PatchStatus::Ok) {
        out_failure.detail = "unknown differ or invalid differ options: " + options.differ;
    }
    return differ;
}

}  // namespace

PatchStatus PatchEngine::CreatePatch(
    const std::string& patch_location,
    const std::string& before_dir,
    const std::string& after_dir,
    const EngineOptions& options,
    PatchFailure& out_failure) {
    out_failure.Clear();

    PatchStatus status = PatchStatus::Ok;
    const std::unique_ptr<IContentDiffer> differ = CreateDiffer(options, out_failure, status);
    if (status != PatchStatus::Ok) {
        return status;
    }

    try {
        PatchPackage package;
        const PatchBuilder builder(options.builder_options, *differ);
        status = builder.Build(before_dir, after_dir, package, out_failure, options.progress);
        if (status != PatchStatus::Ok) {
            return status;
        }

        std::vector<std::uint8_t> bytes;
        status = PackageCodec::Encode(package, bytes);
        if (status != PatchStatus::Ok) {
            return Fail(out_failure, status, "", "cannot encode patch package");
        }
        status = PackageCodec::WriteFile(patch_location, bytes);
        if (status != PatchStatus::Ok) {
            return Fail(out_failure, status, "", "cannot write patch file " + patch_location);
        }
    } catch (const std::exception& e) {
        return Fail(out_failure, PatchStatus::IoError, "", e.what());
    }
    return PatchStatus::Ok;
}

PatchStatus PatchEngine::ApplyPatch(
    const std::string& patch_location,
    const std::string& target_dir,
    const EngineOptions& options,
    PatchFailure& out_failure) {
    out_failure.Clear();

    PatchStatus status = PatchStatus::Ok;
    const std::unique_ptr<IContentDiffer> differ = CreateDiffer(options, out_failure, status);
    if (status != PatchStatus::Ok) {
        return status;
    }
    const PatchApplier applier(options.applier_options, *differ);

    try {
        std::vector<std::uint8_t> bytes;
        status = PackageCodec::ReadFile(patch_location, bytes);
        if (status != PatchStatus::Ok) {
            return Fail(out_failure, status, "", "cannot read patch file " + patch_location);
        }

        // Reject foreign versions before the body is parsed or the target touched.
        PackageHeader header;
        status = PackageCodec::PeekHeader(bytes, header);
        if (status != PatchStatus::Ok) {
            return Fail(out_failure, status, "", "not a patch package: " + patch_location);
        }
        status = applier.CheckVersion(header.format_version, out_failure);
        if (status != PatchStatus::Ok) {
            return status;
        }

        PatchPackage package;
        status = PackageCodec::Decode(bytes, package, options.applier_options.supported_version);
        if (status != PatchStatus::Ok) {
            return Fail(out_failure, status, "", "malformed patch package: " + patch_location);
        }
        bytes.clear();
        bytes.shrink_to_fit();

        return applier.Apply(package, target_dir, out_failure, options.progress);
    } catch (const std::exception& e) {
        return Fail(out_failure, PatchStatus::IoError, "", e.what());
    }
}

PatchStatus PatchEngine::InspectPatch(
    const std::string& patch_location,
    PackageHeader& out_header,
    std::vector<EntryRecord>& out_records,
    PatchFailure& out_failure) {
    out_failure.Clear();
    try {
        std::vector<std::uint8_t> bytes;
        PatchStatus status = PackageCodec::ReadFile(patch_location, bytes);
        if (status != PatchStatus::Ok) {
            return Fail(out_failure, status, "", "cannot read patch file " + patch_location);
        }
        status = PackageCodec::Inspect(bytes, out_header, out_records);
        if (status != PatchStatus::Ok) {
            return Fail(out_failure, status, "", "cannot inspect patch package: " + patch_location);
        }
    } catch (const std::exception& e) {
        return Fail(out_failure, PatchStatus::IoError, "", e.what());
    }
    return PatchStatus::Ok;
}

}  // namespace polypatch
