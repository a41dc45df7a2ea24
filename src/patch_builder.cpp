#include "polypatch/patch_builder.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <iterator>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "polypatch/file_io.hpp"
#include "polypatch/tree_scanner.hpp"

namespace polypatch {

namespace {

struct BuildSlot {
    std::optional<PatchEntry> entry;
    PatchStatus status = PatchStatus::Ok;
    PatchFailure failure;
};

}  // namespace

PatchBuilder::PatchBuilder(const BuilderOptions& options, const IContentDiffer& differ)
    : options_(options), differ_(differ) {}

PatchStatus PatchBuilder::Build(
    const std::string& before_root,
    const std::string& after_root,
    PatchPackage& out_package,
    PatchFailure& out_failure,
    const std::function<void(std::size_t, std::size_t)>& progress) const {
    out_package = PatchPackage{};
    out_failure.Clear();

    std::set<std::string> before_paths;
    PatchStatus status = TreeScanner::Scan(before_root, before_paths, out_failure);
    if (status != PatchStatus::Ok) {
        return status;
    }
    std::set<std::string> after_paths;
    status = TreeScanner::Scan(after_root, after_paths, out_failure);
    if (status != PatchStatus::Ok) {
        return status;
    }

    std::vector<std::string> paths;
    paths.reserve(before_paths.size() + after_paths.size());
    std::set_union(
        before_paths.begin(), before_paths.end(),
        after_paths.begin(), after_paths.end(),
        std::back_inserter(paths));

    const std::filesystem::path before_base = PathFromUtf8(before_root);
    const std::filesystem::path after_base = PathFromUtf8(after_root);
    std::vector<BuildSlot> slots(paths.size());

    auto process = [&](const std::size_t index) {
        const std::string& rel = paths[index];
        BuildSlot& slot = slots[index];
        const bool in_before = before_paths.count(rel) != 0;
        const bool in_after = after_paths.count(rel) != 0;

        if (in_before && !in_after) {
            slot.entry = MakeEntry(RemoveOp{}, rel);
            return;
        }
        if (!in_after) {
            return;
        }

        std::vector<std::uint8_t> after_bytes;
        if (FileIO::ReadAll(after_base / PathFromUtf8(rel), after_bytes) != PatchStatus::Ok) {
            slot.status = Fail(slot.failure, PatchStatus::IoError, rel, "cannot read file from " + after_root);
            return;
        }
        if (!in_before) {
            slot.entry = MakeEntry(AddOp{std::move(after_bytes)}, rel);
            return;
        }

        std::vector<std::uint8_t> before_bytes;
        if (FileIO::ReadAll(before_base / PathFromUtf8(rel), before_bytes) != PatchStatus::Ok) {
            slot.status = Fail(slot.failure, PatchStatus::IoError, rel, "cannot read file from " + before_root);
            return;
        }
        if (before_bytes == after_bytes) {
            return;
        }

        ModifyOp modify;
        const PatchStatus diff_status = differ_.Diff(before_bytes, after_bytes, modify.delta);
        if (diff_status != PatchStatus::Ok) {
            slot.status = Fail(
                slot.failure,
                PatchStatus::DiffError,
                rel,
                std::string(differ_.Name()) + " differ failed: " + std::string(ToString(diff_status)));
            return;
        }
        slot.entry = MakeEntry(std::move(modify), rel);
    };

    auto guarded = [&](const std::size_t index) {
        try {
            process(index);
        } catch (const std::exception& e) {
            slots[index].entry.reset();
            slots[index].status = Fail(slots[index].failure, PatchStatus::IoError, paths[index], e.what());
        }
        return slots[index].status == PatchStatus::Ok;
    };

    const std::size_t total = paths.size();
    if (progress) {
        progress(0, total);
    }

    const std::size_t workers = std::min(std::max<std::size_t>(options_.worker_count, 1), std::max<std::size_t>(total, 1));
    if (workers <= 1) {
        for (std::size_t i = 0; i < total; ++i) {
            if (!guarded(i)) {
                out_failure = slots[i].failure;
                return slots[i].status;
            }
            if (progress) {
                progress(i + 1, total);
            }
        }
    } else {
        // Indices are claimed in increasing order, so every index below a
        // failing one has been claimed and finishes before the workers join.
        std::atomic<std::size_t> next{0};
        std::atomic<std::size_t> done{0};
        std::atomic<bool> failed{false};
        std::mutex progress_mutex;

        auto worker = [&]() {
            while (!failed.load()) {
                const std::size_t index = next.fetch_add(1);
                if (index >= total) {
                    break;
                }
                if (!guarded(index)) {
                    failed.store(true);
                    break;
                }
                const std::size_t finished = done.fetch_add(1) + 1;
                if (progress) {
                    const std::lock_guard<std::mutex> lock(progress_mutex);
                    progress(finished, total);
                }
            }
        };

        std::vector<std::thread> pool;
        pool.reserve(workers);
        bool spawn_failed = false;
        for (std::size_t i = 0; i < workers; ++i) {
            try {
                pool.emplace_back(worker);
            } catch (const std::system_error&) {
                if (pool.empty()) {
                    spawn_failed = true;
                }
                break;
            }
        }
        for (auto& thread : pool) {
            thread.join();
        }
        if (spawn_failed) {
            return Fail(out_failure, PatchStatus::IoError, "", "cannot start diff workers");
        }

        for (auto& slot : slots) {
            if (slot.status != PatchStatus::Ok) {
                out_failure = slot.failure;
                return slot.status;
            }
        }
    }

    out_package.format_version = options_.format_version;
    for (auto& slot : slots) {
        if (slot.entry.has_value()) {
            out_package.entries.push_back(std::move(*slot.entry));
        }
    }
    return PatchStatus::Ok;
}

}  // namespace polypatch
