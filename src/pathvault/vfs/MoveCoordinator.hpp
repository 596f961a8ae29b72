#pragma once
#include "core/CancellationToken.hpp"
#include "core/Error.hpp"
#include "vfs/VfsContext.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace PV {

struct MoveReport {
    std::size_t descendantsMatched = 0; // Documents found below the old path
    std::size_t descendantsUpdated = 0; // Of those, rewritten successfully
};

/**
 * MoveCoordinator — relocates a directory subtree across both stores
 *
 * A move is the physical rename followed by a fan-out that rewrites the
 * "path" of every descendant document, one unit of work per document, at
 * most options().fanoutConcurrency of them in flight on the context's
 * executor. Units that fail are collected into a single PartialFailure once
 * every dispatched unit has finished.
 *
 * Nothing is rolled back: after a PartialFailure the physical subtree and
 * every successfully rewritten descendant stay at the new location.
 */
class MoveCoordinator {
public:
    explicit MoveCoordinator(VfsContext const& ctx)
        : ctx(ctx) {}

    auto move(std::string_view oldPath, std::string_view newPath, CancellationToken const& cancel = {}) -> Expected<MoveReport>;

    // InvalidPath unless both paths are absolute, ForbiddenMove when newPath
    // is oldPath or lies below it, AlreadyExists when newPath is taken.
    auto safeRename(std::string_view oldPath, std::string_view newPath) -> std::optional<Error>;

    auto updateDescendantPaths(std::string_view oldPath, std::string_view newPath, CancellationToken const& cancel = {})
            -> Expected<MoveReport>;

private:
    VfsContext const& ctx;
};

} // namespace PV
