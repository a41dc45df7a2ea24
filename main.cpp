#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>
#endif

#include "polypatch/patch_engine.hpp"
#include "polypatch/patch_status.hpp"

namespace {

struct CreateOptions {
    bool help = false;
    bool log = false;
    std::optional<std::string> patch;
    std::optional<std::string> before;
    std::optional<std::string> after;
    std::string differ = "block";
    std::size_t jobs = 1;
    std::size_t block_size = 64;
    bool compress = true;
};

struct ApplyOptions {
    bool help = false;
    bool log = false;
    bool strict = false;
    std::optional<std::string> patch;
    std::optional<std::string> target;
};

struct InspectOptions {
    bool help = false;
    std::optional<std::string> patch;
};

std::string UnquotePathArg(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    const char first = value.front();
    const char last = value.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

#ifdef _WIN32
bool WideToUtf8(const wchar_t* input, std::string& out) {
    out.clear();
    if (input == nullptr) {
        return false;
    }
    const int required = WideCharToMultiByte(CP_UTF8, 0, input, -1, nullptr, 0, nullptr, nullptr);
    if (required <= 0) {
        return false;
    }
    std::vector<char> converted(static_cast<std::size_t>(required), '\0');
    const int written = WideCharToMultiByte(CP_UTF8, 0, input, -1, converted.data(), required, nullptr, nullptr);
    if (written <= 0) {
        return false;
    }
    out.assign(converted.data(), static_cast<std::size_t>(written - 1));
    return true;
}

bool BuildUtf8ArgsFromCommandLine(std::vector<std::string>& out_args) {
    out_args.clear();
    int wide_argc = 0;
    LPWSTR* wide_argv = CommandLineToArgvW(GetCommandLineW(), &wide_argc);
    if (wide_argv == nullptr || wide_argc <= 0) {
        return false;
    }

    out_args.reserve(static_cast<std::size_t>(wide_argc));
    bool ok = true;
    for (int i = 0; i < wide_argc; ++i) {
        std::string converted;
        if (!WideToUtf8(wide_argv[i], converted)) {
            ok = false;
            break;
        }
        out_args.push_back(std::move(converted));
    }
    LocalFree(wide_argv);
    return ok;
}
#endif

void CliLog(const bool enabled, const std::string& message) {
    if (!enabled) {
        return;
    }
    std::cerr << "[log] " << message << "\n";
}

// Prints "\r[log] <label>: N%" whenever the percentage changes.
std::function<void(std::size_t, std::size_t)> MakeProgressPrinter(const bool enabled, const std::string& label) {
    if (!enabled) {
        return {};
    }
    auto last_percent = std::make_shared<int>(-1);
    return [label, last_percent](const std::size_t done, const std::size_t total) {
        const int percent = total == 0 ? 100 : static_cast<int>((done * 100U) / total);
        if (percent == *last_percent) {
            return;
        }
        *last_percent = percent;
        std::cerr << "\r[log] " << label << ": " << percent << "%" << std::flush;
        if (percent >= 100) {
            std::cerr << "\n";
        }
    };
}

bool ParseCount(const std::string& value, const std::size_t max, std::size_t& out) {
    std::size_t idx = 0;
    try {
        const unsigned long long parsed = std::stoull(value, &idx);
        if (idx != value.size() || parsed == 0 || parsed > static_cast<unsigned long long>(max)) {
            return false;
        }
        out = static_cast<std::size_t>(parsed);
    } catch (const std::logic_error&) {
        return false;
    }
    return true;
}

bool ParseCreateArgs(const int argc, char* argv[], CreateOptions& opts, std::string& error) {
    for (int i = 2; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--log") {
            opts.log = true;
        } else if (arg == "--no-compress") {
            opts.compress = false;
        } else if (arg == "--patch") {
            if (!require_value(value)) {
                return false;
            }
            opts.patch = UnquotePathArg(std::move(value));
        } else if (arg == "--before") {
            if (!require_value(value)) {
                return false;
            }
            opts.before = UnquotePathArg(std::move(value));
        } else if (arg == "--after") {
            if (!require_value(value)) {
                return false;
            }
            opts.after = UnquotePathArg(std::move(value));
        } else if (arg == "--differ") {
            if (!require_value(opts.differ)) {
                return false;
            }
        } else if (arg == "--jobs") {
            if (!require_value(value)) {
                return false;
            }
            if (!ParseCount(value, 256, opts.jobs)) {
                error = "Invalid value for --jobs";
                return false;
            }
        } else if (arg == "--block-size") {
            if (!require_value(value)) {
                return false;
            }
            if (!ParseCount(value, std::numeric_limits<std::uint16_t>::max(), opts.block_size)) {
                error = "Invalid value for --block-size";
                return false;
            }
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }

    if (opts.help) {
        return true;
    }
    if (!opts.patch.has_value()) {
        error = "Missing required argument --patch";
        return false;
    }
    if (!opts.before.has_value() || !opts.after.has_value()) {
        error = "Provide both --before and --after";
        return false;
    }
    return true;
}

bool ParseApplyArgs(const int argc, char* argv[], ApplyOptions& opts, std::string& error) {
    for (int i = 2; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--log") {
            opts.log = true;
        } else if (arg == "--strict") {
            opts.strict = true;
        } else if (arg == "--patch") {
            if (!require_value(value)) {
                return false;
            }
            opts.patch = UnquotePathArg(std::move(value));
        } else if (arg == "--target") {
            if (!require_value(value)) {
                return false;
            }
            opts.target = UnquotePathArg(std::move(value));
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }

    if (opts.help) {
        return true;
    }
    if (!opts.patch.has_value()) {
        error = "Missing required argument --patch";
        return false;
    }
    if (!opts.target.has_value()) {
        error = "Missing required argument --target";
        return false;
    }
    return true;
}

bool ParseInspectArgs(const int argc, char* argv[], InspectOptions& opts, std::string& error) {
    for (int i = 2; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--patch") {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            opts.patch = UnquotePathArg(argv[++i]);
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }
    if (!opts.help && !opts.patch.has_value()) {
        error = "Missing required argument --patch";
        return false;
    }
    return true;
}

void PrintHelp(std::ostream& out) {
    out << "polypatch - binary patches for versioned directory trees\n\n";
    out << "Usage:\n";
    out << "  polypatch create --patch <file> --before <dir> --after <dir>\n";
    out << "           [--jobs N] [--differ block|literal] [--block-size N] [--no-compress] [--log]\n";
    out << "  polypatch apply --patch <file> --target <dir> [--strict] [--log]\n";
    out << "  polypatch inspect --patch <file>\n\n";

    out << "Options:\n";
    out << "  --patch <file>       Patch file to write (create) or read (apply, inspect)\n";
    out << "  --before <dir>       Tree the patch starts from\n";
    out << "  --after <dir>        Tree the patch leads to\n";
    out << "  --target <dir>       Tree to patch in place; must match --before\n";
    out << "  --jobs <N>           Diff files on N threads (default 1)\n";
    out << "  --differ <name>      block (default) or literal\n";
    out << "  --block-size <N>     Match block size for the block differ (default 64)\n";
    out << "  --no-compress        Store deltas without zlib compression\n";
    out << "  --strict             Fail on files that already hold the patched content\n";
    out << "  --log                Show minimal runtime logs/progress\n";
    out << "  --help, -h           Show this help\n\n";

    out << "Examples:\n";
    out << "  polypatch create --patch 0.5.1-0.5.2.patch --before game-0.5.1 --after game-0.5.2 --jobs 8\n";
    out << "  polypatch apply --patch 0.5.1-0.5.2.patch --target ~/.game/current --log\n";
    out << "  polypatch inspect --patch 0.5.1-0.5.2.patch\n\n";

    out << "Notes:\n";
    out << "  - apply is not transactional: a failure leaves earlier files patched.\n";
    out << "    Patch a copy and swap it into place if you need all-or-nothing updates.\n";
    out << "  - Symlinks are never followed or written through.\n";
}

void ReportFailure(const polypatch::PatchStatus status, const polypatch::PatchFailure& failure) {
    std::cerr << polypatch::Describe(status, failure) << "\n";
}

int CreateFlow(const CreateOptions& opts) {
    polypatch::EngineOptions engine;
    engine.differ = opts.differ;
    engine.differ_options.block_size = opts.block_size;
    engine.differ_options.compress = opts.compress;
    engine.builder_options.worker_count = opts.jobs;
    engine.progress = MakeProgressPrinter(opts.log, "Diffing");

    CliLog(opts.log, "Creating patch " + *opts.patch + " from " + *opts.before + " to " + *opts.after);
    polypatch::PatchFailure failure;
    const polypatch::PatchStatus status =
        polypatch::PatchEngine::CreatePatch(*opts.patch, *opts.before, *opts.after, engine, failure);
    if (status != polypatch::PatchStatus::Ok) {
        ReportFailure(status, failure);
        return 1;
    }

    polypatch::PackageHeader header;
    std::vector<polypatch::EntryRecord> records;
    if (opts.log &&
        polypatch::PatchEngine::InspectPatch(*opts.patch, header, records, failure) == polypatch::PatchStatus::Ok) {
        CliLog(true, "Wrote " + std::to_string(records.size()) + " entries");
    }
    return 0;
}

int ApplyFlow(const ApplyOptions& opts) {
    polypatch::EngineOptions engine;
    engine.applier_options.tolerate_applied = !opts.strict;
    engine.progress = MakeProgressPrinter(opts.log, "Applying");

    CliLog(opts.log, "Applying " + *opts.patch + " to " + *opts.target);
    polypatch::PatchFailure failure;
    const polypatch::PatchStatus status =
        polypatch::PatchEngine::ApplyPatch(*opts.patch, *opts.target, engine, failure);
    if (status != polypatch::PatchStatus::Ok) {
        if (opts.log) {
            std::cerr << "\n";
        }
        ReportFailure(status, failure);
        return 1;
    }
    CliLog(opts.log, "Done");
    return 0;
}

int InspectFlow(const InspectOptions& opts) {
    polypatch::PackageHeader header;
    std::vector<polypatch::EntryRecord> records;
    polypatch::PatchFailure failure;
    const polypatch::PatchStatus status = polypatch::PatchEngine::InspectPatch(*opts.patch, header, records, failure);
    if (status != polypatch::PatchStatus::Ok) {
        if (status == polypatch::PatchStatus::UnsupportedVersion) {
            std::cout << "version " << header.format_version << "\n";
        }
        ReportFailure(status, failure);
        return 1;
    }

    std::cout << "version " << header.format_version << "\n";
    std::cout << "entries " << header.entry_count << "\n";
    for (const auto& record : records) {
        std::cout << polypatch::KindLetter(record.kind) << " " << record.payload_size << " " << record.rel_path << "\n";
    }
    return 0;
}

}  // namespace

int RunCliMain(const int argc, char* argv[]) {
    const std::string command = argc >= 2 ? std::string(argv[1]) : std::string();
    std::string error;

    if (command == "create") {
        CreateOptions opts;
        if (!ParseCreateArgs(argc, argv, opts, error)) {
            std::cerr << error << "\n";
            return 1;
        }
        if (opts.help) {
            PrintHelp(std::cout);
            return 0;
        }
        return CreateFlow(opts);
    }
    if (command == "apply") {
        ApplyOptions opts;
        if (!ParseApplyArgs(argc, argv, opts, error)) {
            std::cerr << error << "\n";
            return 1;
        }
        if (opts.help) {
            PrintHelp(std::cout);
            return 0;
        }
        return ApplyFlow(opts);
    }
    if (command == "inspect") {
        InspectOptions opts;
        if (!ParseInspectArgs(argc, argv, opts, error)) {
            std::cerr << error << "\n";
            return 1;
        }
        if (opts.help) {
            PrintHelp(std::cout);
            return 0;
        }
        return InspectFlow(opts);
    }
    if (command == "--help" || command == "-h") {
        PrintHelp(std::cout);
        return 0;
    }

    PrintHelp(std::cerr);
    return 1;
}

#ifdef _WIN32
int main(const int argc, char* argv[]) {
    std::vector<std::string> utf8_args;
    if (BuildUtf8ArgsFromCommandLine(utf8_args)) {
        std::vector<char*> utf8_argv;
        utf8_argv.reserve(utf8_args.size());
        for (auto& arg : utf8_args) {
            utf8_argv.push_back(arg.data());
        }
        return RunCliMain(static_cast<int>(utf8_argv.size()), utf8_argv.data());
    }
    return RunCliMain(argc, argv);
}
#else
int main(const int argc, char* argv[]) {
    return RunCliMain(argc, argv);
}
#endif
