#include "vfs/TreeChecker.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"
#include "store/Selector.hpp"
#include "vfs/DirectoryNode.hpp"

#include <unordered_map>

namespace PV {

auto consistencyIssueKindToString(ConsistencyIssue::Kind kind) -> std::string_view {
    switch (kind) {
    case ConsistencyIssue::Kind::PathMismatch:
        return "path_mismatch";
    case ConsistencyIssue::Kind::MissingParent:
        return "missing_parent";
    case ConsistencyIssue::Kind::DuplicatePath:
        return "duplicate_path";
    case ConsistencyIssue::Kind::MissingPhysical:
        return "missing_physical";
    case ConsistencyIssue::Kind::IllegalTimestamp:
        return "illegal_timestamp";
    }
    return "unknown";
}

auto checkTreeConsistency(VfsContext const& ctx) -> Expected<ConsistencyReport> {
    auto docs = ctx.documents().find(ctx.docType(), Selector::Equal(Field::Type, kDirType));
    if (!docs)
        return std::unexpected(docs.error());

    std::vector<DirectoryNode> dirs;
    dirs.reserve(docs->size());
    for (auto const& doc : *docs) {
        auto node = directoryFromJson(doc);
        if (!node)
            return std::unexpected(node.error());
        dirs.push_back(std::move(*node));
    }

    std::unordered_map<std::string, DirectoryNode const*> byId;
    std::unordered_map<std::string, std::string>          firstByPath;
    for (auto const& dir : dirs)
        byId.emplace(dir.id, &dir);

    ConsistencyReport report;
    report.directoriesChecked = dirs.size();
    auto const root           = rootDirectory();

    for (auto const& dir : dirs) {
        DirectoryNode const* parent = nullptr;
        if (dir.parentID == kRootDirID) {
            parent = &root;
        } else if (auto it = byId.find(dir.parentID); it != byId.end()) {
            parent = it->second;
        }

        if (parent == nullptr) {
            report.issues.push_back({ConsistencyIssue::Kind::MissingParent, dir.id, dir.path, "folder_id " + dir.parentID + " not found"});
        } else if (auto expected = join_path(parent->path, dir.name); expected != dir.path) {
            report.issues.push_back({ConsistencyIssue::Kind::PathMismatch, dir.id, dir.path, "expected " + expected});
        }

        if (auto [it, inserted] = firstByPath.emplace(dir.path, dir.id); !inserted)
            report.issues.push_back({ConsistencyIssue::Kind::DuplicatePath, dir.id, dir.path, "also used by " + it->second});

        auto exists = ctx.physical().stat(dir.path);
        if (!exists) {
            report.issues.push_back({ConsistencyIssue::Kind::MissingPhysical, dir.id, dir.path, describeError(exists.error())});
        } else if (!*exists) {
            report.issues.push_back({ConsistencyIssue::Kind::MissingPhysical, dir.id, dir.path, "no physical directory"});
        }

        if (dir.updatedAt < dir.createdAt)
            report.issues.push_back({ConsistencyIssue::Kind::IllegalTimestamp, dir.id, dir.path, "updated_at precedes created_at"});
    }

    pv_log("checkTreeConsistency checked " + std::to_string(report.directoriesChecked) + " directories, " + std::to_string(report.issues.size())
                   + " issues",
           "TreeChecker");
    return report;
}

} // namespace PV
