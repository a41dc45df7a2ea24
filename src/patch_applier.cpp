#include "polypatch/patch_applier.hpp"

#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>
#include <vector>

#include "polypatch/file_io.hpp"

namespace polypatch {

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

// Both paths must be absolute and lexically normal.
bool IsStrictlyInside(const std::filesystem::path& path, const std::filesystem::path& root) {
    auto path_it = path.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it, ++path_it) {
        if (path_it == path.end() || *path_it != *root_it) {
            return false;
        }
    }
    for (; path_it != path.end(); ++path_it) {
        if (!path_it->empty()) {
            return true;
        }
    }
    return false;
}

std::filesystem::path NormalizeRoot(const std::filesystem::path& root, std::error_code& ec) {
    std::filesystem::path normal = std::filesystem::absolute(root, ec).lexically_normal();
    if (normal.has_relative_path() && normal.filename().empty()) {
        normal = normal.parent_path();
    }
    return normal;
}

// Empty directories left behind by a removal are best-effort cleanup.
void RemoveEmptyParents(const std::filesystem::path& file, const std::filesystem::path& root) {
    std::filesystem::path dir = file.parent_path();
    while (IsStrictlyInside(dir, root)) {
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(dir, ec);
        if (ec || !std::filesystem::is_directory(status) || !std::filesystem::is_empty(dir, ec) || ec) {
            break;
        }
        if (!std::filesystem::remove(dir, ec) || ec) {
            break;
        }
        dir = dir.parent_path();
    }
}

}  // namespace

PatchApplier::PatchApplier(const ApplierOptions& options, const IContentDiffer& differ)
    : options_(options), differ_(differ) {}

PatchStatus PatchApplier::CheckVersion(const std::uint32_t format_version, PatchFailure& out_failure) const {
    if (format_version != options_.supported_version) {
        out_failure.detail = "unsupported patch format version";
        out_failure.expected = std::to_string(options_.supported_version);
        out_failure.actual = std::to_string(format_version);
        return PatchStatus::UnsupportedVersion;
    }
    return PatchStatus::Ok;
}

PatchStatus PatchApplier::Apply(
    const PatchPackage& package,
    const std::string& target_root,
    PatchFailure& out_failure,
    const std::function<void(std::size_t, std::size_t)>& progress) const {
    out_failure.Clear();

    std::error_code ec;
    const std::filesystem::path root = NormalizeRoot(PathFromUtf8(target_root), ec);
    if (ec) {
        return Fail(out_failure, PatchStatus::IoError, "", "cannot resolve target " + target_root);
    }
    const auto root_status = std::filesystem::symlink_status(root, ec);
    if (root_status.type() == std::filesystem::file_type::not_found) {
        return Fail(out_failure, PatchStatus::IoError, "", "target does not exist: " + target_root);
    }
    if (ec) {
        return Fail(out_failure, PatchStatus::IoError, "", ec.message());
    }
    if (std::filesystem::is_symlink(root_status)) {
        return Fail(out_failure, PatchStatus::SymlinkRefused, "", "target must not be a symlink: " + target_root);
    }
    if (!std::filesystem::is_directory(root_status)) {
        return Fail(out_failure, PatchStatus::IoError, "", "target is not a directory: " + target_root);
    }

    const PatchStatus version_status = CheckVersion(package.format_version, out_failure);
    if (version_status != PatchStatus::Ok) {
        return version_status;
    }

    const std::size_t total = package.entries.size();
    if (progress) {
        progress(0, total);
    }
    for (std::size_t i = 0; i < total; ++i) {
        const PatchEntry& entry = package.entries[i];

        std::filesystem::path dest;
        PatchStatus status = ResolveEntryPath(root, entry.rel_path, dest, out_failure);
        if (status != PatchStatus::Ok) {
            out_failure.rel_path = entry.rel_path;
            return status;
        }

        try {
            status = std::visit(
                [&](const auto& op) -> PatchStatus {
                    using Op = std::decay_t<decltype(op)>;
                    if constexpr (std::is_same_v<Op, AddOp>) {
                        return ApplyAdd(op, dest, entry.rel_path, out_failure);
                    } else if constexpr (std::is_same_v<Op, RemoveOp>) {
                        return ApplyRemove(root, dest, entry.rel_path, out_failure);
                    } else if constexpr (std::is_same_v<Op, ModifyOp>) {
                        return ApplyModify(op, dest, entry.rel_path, out_failure);
                    } else {
                        static_assert(kAlwaysFalse<Op>, "unhandled patch operation");
                    }
                },
                entry.operation);
        } catch (const std::exception& e) {
            status = Fail(out_failure, PatchStatus::IoError, entry.rel_path, e.what());
        }
        if (status != PatchStatus::Ok) {
            out_failure.rel_path = entry.rel_path;
            return status;
        }

        if (progress) {
            progress(i + 1, total);
        }
    }
    return PatchStatus::Ok;
}

PatchStatus PatchApplier::ResolveEntryPath(
    const std::filesystem::path& root,
    const std::string& rel_path,
    std::filesystem::path& out_path,
    PatchFailure& out_failure) const {
    const std::filesystem::path rel = PathFromUtf8(rel_path);
    if (rel.has_root_name() || rel.has_root_directory()) {
        return Fail(out_failure, PatchStatus::PathEscape, rel_path, "entry path is absolute");
    }

    const std::filesystem::path joined = (root / rel).lexically_normal();
    if (!IsStrictlyInside(joined, root)) {
        return Fail(out_failure, PatchStatus::PathEscape, rel_path, "entry path escapes the target directory");
    }
    if (joined.filename().empty()) {
        return Fail(out_failure, PatchStatus::InvalidPath, rel_path, "entry path names a directory");
    }

    // Walk from the target root down; anything below the first missing
    // component does not exist either.
    std::filesystem::path current;
    auto joined_it = joined.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it, ++joined_it) {
        current /= *joined_it;
    }
    while (true) {
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(current, ec);
        if (status.type() == std::filesystem::file_type::not_found) {
            break;
        }
        if (ec) {
            return Fail(out_failure, PatchStatus::IoError, rel_path, "cannot stat " + Utf8FromPath(current));
        }
        if (std::filesystem::is_symlink(status)) {
            return Fail(
                out_failure,
                PatchStatus::SymlinkRefused,
                rel_path,
                "refusing to traverse symlink " + Utf8FromPath(current));
        }
        if (joined_it == joined.end()) {
            break;
        }
        current /= *joined_it;
        ++joined_it;
    }

    out_path = joined;
    return PatchStatus::Ok;
}

PatchStatus PatchApplier::ApplyAdd(
    const AddOp& op,
    const std::filesystem::path& dest,
    const std::string& rel_path,
    PatchFailure& out_failure) const {
    std::error_code ec;
    std::filesystem::create_directories(dest.parent_path(), ec);
    if (ec) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, "cannot create parent directories: " + ec.message());
    }

    const auto status = std::filesystem::symlink_status(dest, ec);
    if (status.type() != std::filesystem::file_type::not_found) {
        if (ec) {
            return Fail(out_failure, PatchStatus::IoError, rel_path, ec.message());
        }
        if (std::filesystem::is_symlink(status)) {
            return Fail(out_failure, PatchStatus::SymlinkRefused, rel_path, "refusing to overwrite symlink");
        }
        if (std::filesystem::is_directory(status)) {
            return Fail(out_failure, PatchStatus::IoError, rel_path, "a directory is in the way");
        }
    }

    if (FileIO::WriteReplace(dest, op.content) != PatchStatus::Ok) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, "cannot write added file");
    }
    return PatchStatus::Ok;
}

PatchStatus PatchApplier::ApplyRemove(
    const std::filesystem::path& root,
    const std::filesystem::path& dest,
    const std::string& rel_path,
    PatchFailure& out_failure) const {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(dest, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return PatchStatus::Ok;
    }
    if (ec) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, ec.message());
    }
    if (std::filesystem::is_symlink(status)) {
        return Fail(out_failure, PatchStatus::SymlinkRefused, rel_path, "refusing to remove symlink");
    }
    if (std::filesystem::is_directory(status)) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, "expected a file, found a directory");
    }

    std::filesystem::remove(dest, ec);
    if (ec) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, "cannot remove file: " + ec.message());
    }
    RemoveEmptyParents(dest, root);
    return PatchStatus::Ok;
}

PatchStatus PatchApplier::ApplyModify(
    const ModifyOp& op,
    const std::filesystem::path& dest,
    const std::string& rel_path,
    PatchFailure& out_failure) const {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(dest, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, "file to modify is missing");
    }
    if (ec) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, ec.message());
    }
    if (std::filesystem::is_symlink(status)) {
        return Fail(out_failure, PatchStatus::SymlinkRefused, rel_path, "refusing to modify symlink");
    }
    if (!std::filesystem::is_regular_file(status)) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, "file to modify is not a regular file");
    }

    std::vector<std::uint8_t> current;
    if (FileIO::ReadAll(dest, current) != PatchStatus::Ok) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, "cannot read file for modification");
    }

    Fingerprint current_fp{};
    if (differ_.ComputeFingerprint(current, current_fp) != PatchStatus::Ok) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, "cannot fingerprint current content");
    }
    if (current_fp != op.delta.before_fingerprint) {
        if (options_.tolerate_applied && current_fp == op.delta.after_fingerprint) {
            return PatchStatus::Ok;
        }
        out_failure.expected = FingerprintHasher::ToHex(op.delta.before_fingerprint);
        out_failure.actual = FingerprintHasher::ToHex(current_fp);
        return Fail(out_failure, PatchStatus::IntegrityMismatch, rel_path, "file changed since patch was built");
    }

    std::vector<std::uint8_t> updated;
    const PatchStatus delta_status = differ_.ApplyDelta(current, op.delta, updated);
    if (delta_status != PatchStatus::Ok) {
        return Fail(out_failure, PatchStatus::DiffError, rel_path, "delta could not be applied");
    }

    Fingerprint updated_fp{};
    if (differ_.ComputeFingerprint(updated, updated_fp) != PatchStatus::Ok) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, "cannot fingerprint reconstructed content");
    }
    if (updated_fp != op.delta.after_fingerprint) {
        out_failure.expected = FingerprintHasher::ToHex(op.delta.after_fingerprint);
        out_failure.actual = FingerprintHasher::ToHex(updated_fp);
        return Fail(out_failure, PatchStatus::IntegrityMismatch, rel_path, "reconstruction corrupted");
    }

    if (FileIO::WriteReplace(dest, updated) != PatchStatus::Ok) {
        return Fail(out_failure, PatchStatus::IoError, rel_path, "cannot write modified file");
    }
    return PatchStatus::Ok;
}

}  // namespace polypatch
