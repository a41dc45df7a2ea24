#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "polypatch/content_differ.hpp"

namespace polypatch {

constexpr std::uint32_t kPatchFormatVersion = 1;

struct AddOp {
    std::vector<std::uint8_t> content;
};

struct RemoveOp {};

struct ModifyOp {
    Delta delta;
};

using PatchOperation = std::variant<AddOp, RemoveOp, ModifyOp>;

// Wire tags; part of format version 1.
enum class EntryKind : std::uint8_t {
    Add = 1,
    Remove = 2,
    Modify = 3
};

struct PatchEntry {
    PatchOperation operation;
    std::string rel_path;
};

struct PatchPackage {
    std::uint32_t format_version = kPatchFormatVersion;
    std::vector<PatchEntry> entries;
};

// Replaces host separators with '/'.
std::string NormalizeRelativePath(std::string rel_path);

PatchEntry MakeEntry(PatchOperation operation, std::string rel_path);

EntryKind KindOf(const PatchOperation& operation);

char KindLetter(EntryKind kind);

}  // namespace polypatch
