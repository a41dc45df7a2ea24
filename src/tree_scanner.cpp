#include "polypatch/tree_scanner.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <system_error>

#include "polypatch/file_io.hpp"
#include "polypatch/patch_package.hpp"

namespace polypatch {

namespace {

// rel is the generic form straight from the filesystem. A backslash would be
// read back as a separator, so it is refused here rather than normalized.
bool IsRepresentable(const std::string& rel) {
    if (rel.empty() || rel.front() == '/' || rel.back() == '/') {
        return false;
    }
    if (rel.find_first_of("\\:") != std::string::npos || rel.find("//") != std::string::npos) {
        return false;
    }
    return rel != ".." && rel.rfind("../", 0) != 0;
}

}  // namespace

PatchStatus TreeScanner::Scan(
    const std::string& root,
    std::set<std::string>& out_paths,
    PatchFailure& out_failure) {
    out_paths.clear();

    const std::filesystem::path base = PathFromUtf8(root);
    std::error_code ec;
    if (!std::filesystem::is_directory(base, ec) || ec) {
        return Fail(out_failure, PatchStatus::IoError, "", "not a directory: " + root);
    }

    std::filesystem::recursive_directory_iterator it(base, ec);
    if (ec) {
        return Fail(out_failure, PatchStatus::IoError, "", "cannot open directory " + root + ": " + ec.message());
    }
    const std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        const auto status = it->symlink_status(ec);
        if (ec) {
            return Fail(out_failure, PatchStatus::IoError, Utf8FromPath(it->path()), ec.message());
        }
        if (std::filesystem::is_regular_file(status)) {
            const std::string rel = Utf8FromPath(it->path().lexically_relative(base));
            if (!IsRepresentable(rel)) {
                return Fail(
                    out_failure,
                    PatchStatus::InvalidPath,
                    rel,
                    "file name cannot be stored in a patch: " + Utf8FromPath(it->path()));
            }
            out_paths.insert(NormalizeRelativePath(rel));
        }

        it.increment(ec);
        if (ec) {
            return Fail(out_failure, PatchStatus::IoError, "", "traversal of " + root + " failed: " + ec.message());
        }
    }
    return PatchStatus::Ok;
}

}  // namespace polypatch
