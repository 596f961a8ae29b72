#pragma once
#include "core/CancellationToken.hpp"
#include "core/Error.hpp"
#include "core/Timestamp.hpp"
#include "vfs/ChildrenFetcher.hpp"
#include "vfs/DirectoryNode.hpp"
#include "vfs/VfsContext.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PV {

// Sparse update for modifyDirectoryMetadata. Absent fields keep their value.
struct DirectoryPatch {
    std::optional<std::string>              name;
    std::optional<std::string>              parentID;
    std::optional<std::vector<std::string>> tags; // Merged into the current set
    std::optional<Timestamp>                updatedAt;
};

/**
 * Creates the physical directory, then its document. Returns the node with
 * id, revision and path filled in.
 *
 * Fails InvalidName / ParentMissing before touching either store, and
 * AlreadyExists when the physical path is taken. When the document cannot be
 * written the physical directory is removed again on a best-effort basis; a
 * crash in between leaves a physical directory without a document.
 * When invalidate is non-null, the parent's listing is dropped from it.
 */
auto createDirectory(VfsContext const&        ctx,
                     DirectoryNode            node,
                     CancellationToken const& cancel     = {},
                     ChildrenCache*           invalidate = nullptr) -> Expected<DirectoryNode>;

// NotFound for an unknown id, NotADirectory for a file document. With a
// non-null withChildren, the listing is fetched and stored under the id.
auto getDirectory(VfsContext const& ctx, std::string_view id, ChildrenCache* withChildren = nullptr) -> Expected<DirectoryNode>;

// Exact match on the cleaned path; "/" is the root. When several documents
// share a path (a broken invariant) the first in store order is returned.
auto getDirectoryByPath(VfsContext const& ctx, std::string_view path, ChildrenCache* withChildren = nullptr) -> Expected<DirectoryNode>;

/**
 * Renames, moves, retags or touches a directory.
 *
 * Order of effects:
 *  1. validation (InvalidName, ParentMissing, IllegalTimestamp): no mutation
 *  2. if the path changes: the physical rename (InvalidPath, ForbiddenMove,
 *     AlreadyExists), then the descendant fan-out (PartialFailure)
 *  3. the node's own document, compare-and-swap on current.rev (Conflict)
 *
 * A failure in step 2 or 3 does not undo earlier steps. When invalidate is
 * non-null, a successful change drops the parent's listing from it; a path
 * change also drops the new parent's listing and every listing that names a
 * directory in the moved subtree.
 */
auto modifyDirectoryMetadata(VfsContext const&        ctx,
                             DirectoryNode const&     current,
                             DirectoryPatch const&    patch,
                             CancellationToken const& cancel     = {},
                             ChildrenCache*           invalidate = nullptr) -> Expected<DirectoryNode>;

} // namespace PV
