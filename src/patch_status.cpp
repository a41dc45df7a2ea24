#include "polypatch/patch_status.hpp"

#include <string>

namespace polypatch {

std::string Describe(const PatchStatus status, const PatchFailure& failure) {
    std::string out(ToString(status));
    if (!failure.rel_path.empty()) {
        out += " [" + failure.rel_path + "]";
    }
    if (!failure.detail.empty()) {
        out += ": " + failure.detail;
    }
    if (!failure.expected.empty() || !failure.actual.empty()) {
        out += " (expected " + failure.expected + ", actual " + failure.actual + ")";
    }
    return out;
}

}  // namespace polypatch
