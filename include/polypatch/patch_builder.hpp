#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "polypatch/content_differ.hpp"
#include "polypatch/patch_package.hpp"
#include "polypatch/patch_status.hpp"

namespace polypatch {

struct BuilderOptions {
    std::uint32_t format_version = kPatchFormatVersion;
    std::size_t worker_count = 1;
};

class PatchBuilder {
public:
    PatchBuilder(const BuilderOptions& options, const IContentDiffer& differ);

    // Nothing is written; the package is assembled fully in memory.
    PatchStatus Build(
        const std::string& before_root,
        const std::string& after_root,
        PatchPackage& out_package,
        PatchFailure& out_failure,
        const std::function<void(std::size_t, std::size_t)>& progress = {}) const;

private:
    BuilderOptions options_;
    const IContentDiffer& differ_;
};

}  // namespace polypatch
