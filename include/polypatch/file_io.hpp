#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "polypatch/patch_status.hpp"

namespace polypatch {

std::filesystem::path PathFromUtf8(const std::string& value);

std::string Utf8FromPath(const std::filesystem::path& value);

class FileIO {
public:
    static PatchStatus ReadAll(const std::filesystem::path& path, std::vector<std::uint8_t>& out_bytes);

    // Writes to a random sibling name, then renames over path. The destination
    // either keeps its old content or holds all of bytes.
    static PatchStatus WriteReplace(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes);

    static std::string RandomHexName(std::size_t bytes);
};

}  // namespace polypatch
