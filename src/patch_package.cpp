#include "polypatch/patch_package.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <variant>

namespace polypatch {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

std::string NormalizeRelativePath(std::string rel_path) {
    std::replace(rel_path.begin(), rel_path.end(), '\\', '/');
    return rel_path;
}

PatchEntry MakeEntry(PatchOperation operation, std::string rel_path) {
    PatchEntry entry;
    entry.operation = std::move(operation);
    entry.rel_path = NormalizeRelativePath(std::move(rel_path));
    return entry;
}

EntryKind KindOf(const PatchOperation& operation) {
    return std::visit(
        Overloaded{
            [](const AddOp&) { return EntryKind::Add; },
            [](const RemoveOp&) { return EntryKind::Remove; },
            [](const ModifyOp&) { return EntryKind::Modify; },
        },
        operation);
}

char KindLetter(const EntryKind kind) {
    switch (kind) {
        case EntryKind::Add:
            return 'A';
        case EntryKind::Remove:
            return 'R';
        case EntryKind::Modify:
            return 'M';
    }
    return '?';
}

}  // namespace polypatch
