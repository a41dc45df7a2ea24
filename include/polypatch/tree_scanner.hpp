#pragma once

#include <set>
#include <string>

#include "polypatch/patch_status.hpp"

namespace polypatch {

class TreeScanner {
public:
    // Collects every regular file below root as a '/'-separated relative path.
    // Symlinks (to files or directories) are skipped and never followed.
    static PatchStatus Scan(
        const std::string& root,
        std::set<std::string>& out_paths,
        PatchFailure& out_failure);
};

}  // namespace polypatch
