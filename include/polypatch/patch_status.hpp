#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace polypatch {

enum class PatchStatus {
    Ok = 0,
    IoError,
    DiffError,
    CorruptPackage,
    UnsupportedVersion,
    PathEscape,
    SymlinkRefused,
    IntegrityMismatch,
    InvalidPath,
    InvalidArgument
};

inline std::string_view ToString(const PatchStatus status) {
    switch (status) {
        case PatchStatus::Ok:
            return "Ok";
        case PatchStatus::IoError:
            return "IoError";
        case PatchStatus::DiffError:
            return "DiffError";
        case PatchStatus::CorruptPackage:
            return "CorruptPackage";
        case PatchStatus::UnsupportedVersion:
            return "UnsupportedVersion";
        case PatchStatus::PathEscape:
            return "PathEscape";
        case PatchStatus::SymlinkRefused:
            return "SymlinkRefused";
        case PatchStatus::IntegrityMismatch:
            return "IntegrityMismatch";
        case PatchStatus::InvalidPath:
            return "InvalidPath";
        case PatchStatus::InvalidArgument:
            return "InvalidArgument";
    }
    return "UnknownStatus";
}

// Context for a failed operation. Fields that do not apply stay empty.
struct PatchFailure {
    std::string rel_path;
    std::string detail;
    std::string expected;
    std::string actual;

    void Clear() {
        rel_path.clear();
        detail.clear();
        expected.clear();
        actual.clear();
    }
};

inline PatchStatus Fail(
    PatchFailure& failure,
    const PatchStatus status,
    std::string rel_path,
    std::string detail) {
    failure.rel_path = std::move(rel_path);
    failure.detail = std::move(detail);
    return status;
}

std::string Describe(PatchStatus status, const PatchFailure& failure);

}  // namespace polypatch
