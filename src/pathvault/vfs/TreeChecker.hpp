#pragma once
#include "core/Error.hpp"
#include "vfs/VfsContext.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace PV {

struct ConsistencyIssue {
    enum class Kind {
        PathMismatch,     // path != path(parent) + "/" + name
        MissingParent,    // folder_id names no directory
        DuplicatePath,    // another directory has the same path
        MissingPhysical,  // no physical directory at path
        IllegalTimestamp  // updated_at < created_at
    };

    Kind        kind;
    std::string id;
    std::string path;
    std::string detail;
};

auto consistencyIssueKindToString(ConsistencyIssue::Kind kind) -> std::string_view;

struct ConsistencyReport {
    std::size_t                   directoriesChecked = 0;
    std::vector<ConsistencyIssue> issues;

    auto clean() const -> bool { return issues.empty(); }
};

// Reads every directory document and reports invariant violations. Repairs nothing.
auto checkTreeConsistency(VfsContext const& ctx) -> Expected<ConsistencyReport>;

} // namespace PV
