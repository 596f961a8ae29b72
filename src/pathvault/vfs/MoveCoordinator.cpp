#include "vfs/MoveCoordinator.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"
#include "store/Selector.hpp"
#include "task/TaskGroup.hpp"
#include "vfs/DirectoryNode.hpp"

#include <atomic>
#include <string>

namespace PV {

namespace {

auto rewriteDescendant(VfsContext const& ctx, std::string const& id, std::string const& oldPath, std::string const& newPath)
        -> std::optional<Error> {
    // Re-read so a concurrent change since the query is observed, then
    // compare-and-swap on that revision.
    auto doc = ctx.documents().get(ctx.docType(), id);
    if (!doc)
        return Error{doc.error().code, "descendant " + id + ": " + doc.error().message.value_or("")};

    auto it = doc->find(Field::Path);
    if (it == doc->end() || !it->is_string())
        return Error{Error::Code::MalformedInput, "descendant " + id + " has no path"};
    auto const current = it->get<std::string>();
    if (!is_strict_descendant(current, oldPath))
        return Error{Error::Code::Conflict, "descendant " + id + " left " + oldPath + " (now at " + current + ")"};

    (*doc)[Field::Path] = rebase_path(current, oldPath, newPath);
    auto rev            = ctx.documents().update(ctx.docType(), std::move(*doc));
    if (!rev)
        return Error{rev.error().code, "descendant " + id + ": " + rev.error().message.value_or("")};
    return std::nullopt;
}

} // namespace

auto MoveCoordinator::move(std::string_view oldPath, std::string_view newPath, CancellationToken const& cancel) -> Expected<MoveReport> {
    pv_log("MoveCoordinator::move " + std::string(oldPath) + " -> " + std::string(newPath), "MoveCoordinator");
    if (cancel.isCancelled())
        return std::unexpected(Error{Error::Code::Cancelled, "move cancelled before rename"});

    if (auto error = this->safeRename(oldPath, newPath))
        return std::unexpected(*error);

    return this->updateDescendantPaths(oldPath, newPath, cancel);
}

auto MoveCoordinator::safeRename(std::string_view oldPath, std::string_view newPath) -> std::optional<Error> {
    auto const from = clean_path(oldPath);
    auto const to   = clean_path(newPath);

    if (!is_absolute(from) || !is_absolute(to))
        return Error{Error::Code::InvalidPath, "paths should be absolute: " + from + ", " + to};
    if (from == "/")
        return Error{Error::Code::ForbiddenMove, "the root directory cannot be moved"};
    if (to == from || is_strict_descendant(to, from))
        return Error{Error::Code::ForbiddenMove, "cannot move " + from + " into its own subtree at " + to};

    auto exists = ctx.physical().stat(to);
    if (!exists)
        return exists.error();
    if (*exists)
        return Error{Error::Code::AlreadyExists, "destination exists: " + to};

    if (auto error = ctx.physical().rename(from, to)) {
        pv_log("MoveCoordinator::safeRename " + from + " -> " + to + " failed: " + describeError(*error), "MoveCoordinator", "Error");
        return error;
    }
    return std::nullopt;
}

auto MoveCoordinator::updateDescendantPaths(std::string_view oldPath, std::string_view newPath, CancellationToken const& cancel)
        -> Expected<MoveReport> {
    auto const from = clean_path(oldPath);
    auto const to   = clean_path(newPath);
    if (from == "/")
        return std::unexpected(Error{Error::Code::ForbiddenMove, "the root directory cannot be moved"});

    auto descendants = ctx.documents().find(ctx.docType(), Selector::StartsWith(Field::Path, from + "/"));
    if (!descendants)
        return std::unexpected(descendants.error());

    MoveReport report;
    report.descendantsMatched = descendants->size();
    if (descendants->empty())
        return report;

    std::atomic<std::size_t> updated{0};
    std::vector<Error>       failures;
    {
        TaskGroup group(ctx.executor(), ctx.options().fanoutConcurrency);
        for (auto const& doc : *descendants) {
            auto id = doc.value(kDocIdField, std::string{});
            if (cancel.isCancelled()) {
                group.recordSkipped(Error{Error::Code::Cancelled, "descendant " + id + " skipped"});
                continue;
            }
            // A refused unit is recorded by the group itself.
            (void)group.dispatch([this, id, &from, &to, &updated]() -> std::optional<Error> {
                if (auto error = rewriteDescendant(ctx, id, from, to))
                    return error;
                updated.fetch_add(1, std::memory_order_relaxed);
                return std::nullopt;
            });
        }
        group.wait();
        failures = group.errors();
    }

    report.descendantsUpdated = updated.load();
    if (!failures.empty()) {
        pv_log("MoveCoordinator::updateDescendantPaths " + std::to_string(failures.size()) + " of " + std::to_string(report.descendantsMatched)
                       + " descendants failed under " + from,
               "MoveCoordinator", "Error");
        auto message = std::to_string(failures.size()) + " of " + std::to_string(report.descendantsMatched)
                       + " descendant path updates failed moving " + from + " to " + to;
        return std::unexpected(Error{Error::Code::PartialFailure, std::move(message), std::move(failures)});
    }
    pv_log("MoveCoordinator::updateDescendantPaths rewrote " + std::to_string(report.descendantsUpdated) + " descendants", "MoveCoordinator");
    return report;
}

} // namespace PV
