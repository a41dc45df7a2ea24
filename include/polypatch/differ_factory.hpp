#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "polypatch/content_differ.hpp"
#include "polypatch/patch_status.hpp"

namespace polypatch {

struct DifferOptions {
    std::size_t block_size = 64;
    bool compress = true;
    int compression_level = 6;
};

class DifferFactory {
public:
    static std::unique_ptr<IContentDiffer> Create(
        std::string_view differ_name,
        const DifferOptions& options,
        PatchStatus& out_status);
};

}  // namespace polypatch
