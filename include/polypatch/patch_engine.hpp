#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "polypatch/differ_factory.hpp"
#include "polypatch/package_codec.hpp"
#include "polypatch/patch_applier.hpp"
#include "polypatch/patch_builder.hpp"
#include "polypatch/patch_status.hpp"

namespace polypatch {

struct EngineOptions {
    std::string differ = "block";
    DifferOptions differ_options;
    BuilderOptions builder_options;
    ApplierOptions applier_options;
    std::function<void(std::size_t, std::size_t)> progress;
};

class PatchEngine {
public:
    static PatchStatus CreatePatch(
        const std::string& patch_location,
        const std::string& before_dir,
        const std::string& after_dir,
        const EngineOptions& options,
        PatchFailure& out_failure);

    static PatchStatus ApplyPatch(
        const std::string& patch_location,
        const std::string& target_dir,
        const EngineOptions& options,
        PatchFailure& out_failure);

    static PatchStatus InspectPatch(
        const std::string& patch_location,
        PackageHeader& out_header,
        std::vector<EntryRecord>& out_records,
        PatchFailure& out_failure);
};

}  // namespace polypatch
