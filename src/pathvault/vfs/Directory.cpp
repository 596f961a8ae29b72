#include "vfs/Directory.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"
#include "store/Selector.hpp"
#include "vfs/MoveCoordinator.hpp"
#include "vfs/PathResolver.hpp"

namespace PV {

namespace {

auto attachChildren(VfsContext const& ctx, DirectoryNode node, ChildrenCache* withChildren) -> Expected<DirectoryNode> {
    if (withChildren == nullptr)
        return node;
    auto children = fetchChildren(ctx, node);
    if (!children)
        return std::unexpected(children.error());
    withChildren->put(node.id, std::move(*children));
    return node;
}

} // namespace

auto createDirectory(VfsContext const& ctx, DirectoryNode node, CancellationToken const& cancel, ChildrenCache* invalidate)
        -> Expected<DirectoryNode> {
    pv_log("createDirectory " + node.name + " under " + node.parentID, "Directory");
    if (cancel.isCancelled())
        return std::unexpected(Error{Error::Code::Cancelled, "create cancelled"});

    auto resolved = computeChildPath(ctx, node.name, node.parentID);
    if (!resolved) {
        pv_log("createDirectory " + node.name + " rejected: " + describeError(resolved.error()), "Directory", "Error");
        return std::unexpected(resolved.error());
    }

    if (auto error = ctx.physical().mkdir(resolved->path)) {
        pv_log("createDirectory mkdir " + resolved->path + " failed: " + describeError(*error), "Directory", "Error");
        return std::unexpected(*error);
    }

    node.parentID = resolved->parent.id;
    node.path     = resolved->path;
    node.rev.clear();
    if (node.updatedAt < node.createdAt)
        node.updatedAt = node.createdAt;

    auto ref = ctx.documents().create(ctx.docType(), directoryToJson(node));
    if (!ref) {
        auto failure = ref.error();
        if (auto removeError = ctx.physical().remove(node.path)) {
            pv_log("createDirectory could not remove orphaned " + node.path + ": " + describeError(*removeError), "Directory", "Error");
            failure.causes.push_back(*removeError);
        }
        return std::unexpected(std::move(failure));
    }

    node.id  = std::move(ref->id);
    node.rev = std::move(ref->rev);
    if (invalidate != nullptr)
        invalidate->invalidate(node.parentID);
    return node;
}

auto getDirectory(VfsContext const& ctx, std::string_view id, ChildrenCache* withChildren) -> Expected<DirectoryNode> {
    if (id == kRootDirID)
        return attachChildren(ctx, rootDirectory(), withChildren);

    auto doc = ctx.documents().get(ctx.docType(), id);
    if (!doc)
        return std::unexpected(doc.error());
    if (auto const type = documentType(*doc); type != kDirType)
        return std::unexpected(Error{Error::Code::NotADirectory, std::string(id) + " is a '" + type + "' document"});

    auto node = directoryFromJson(*doc);
    if (!node)
        return std::unexpected(node.error());
    return attachChildren(ctx, std::move(*node), withChildren);
}

auto getDirectoryByPath(VfsContext const& ctx, std::string_view path, ChildrenCache* withChildren) -> Expected<DirectoryNode> {
    auto const cleaned = clean_path(path);
    if (!is_absolute(cleaned))
        return std::unexpected(Error{Error::Code::InvalidPath, "path must be absolute: " + std::string(path)});
    if (cleaned == "/")
        return attachChildren(ctx, rootDirectory(), withChildren);

    auto docs = ctx.documents().find(ctx.docType(),
                                     Selector::All({Selector::Equal(Field::Type, kDirType), Selector::Equal(Field::Path, cleaned)}),
                                     FindOptions{.limit = 1});
    if (!docs)
        return std::unexpected(docs.error());
    if (docs->empty())
        return std::unexpected(Error{Error::Code::NotFound, "no directory at " + cleaned});

    auto node = directoryFromJson(docs->front());
    if (!node)
        return std::unexpected(node.error());
    return attachChildren(ctx, std::move(*node), withChildren);
}

auto modifyDirectoryMetadata(VfsContext const&        ctx,
                             DirectoryNode const&     current,
                             DirectoryPatch const&    patch,
                             CancellationToken const& cancel,
                             ChildrenCache*           invalidate) -> Expected<DirectoryNode> {
    auto const reject = [&](Error error) -> Expected<DirectoryNode> {
        pv_log("modifyDirectoryMetadata " + current.id + " rejected: " + describeError(error), "Directory", "Error");
        return std::unexpected(std::move(error));
    };

    if (current.isRoot())
        return reject(Error{Error::Code::ForbiddenMove, "the root directory cannot be modified"});

    auto path      = current.path;
    auto name      = current.name;
    auto tags      = current.tags;
    auto parentID  = current.parentID;
    auto updatedAt = current.updatedAt;

    if (patch.parentID && normalizeParentID(*patch.parentID) != parentID) {
        auto resolved = computeChildPath(ctx, patch.name.value_or(name), *patch.parentID);
        if (!resolved)
            return reject(resolved.error());
        parentID = resolved->parent.id;
        path     = std::move(resolved->path);
    }

    if (patch.name) {
        if (auto invalid = validate_name(*patch.name, ctx.options().maxNameLength))
            return reject(*invalid);
        name = *patch.name;
        path = join_path(dir_name(path), name);
    }

    if (patch.tags)
        tags = appendTags(tags, *patch.tags);

    if (patch.updatedAt)
        updatedAt = *patch.updatedAt;
    if (updatedAt < current.createdAt)
        return reject(Error{Error::Code::IllegalTimestamp, "updated_at precedes created_at of " + current.id});

    if (cancel.isCancelled())
        return reject(Error{Error::Code::Cancelled, "modify cancelled"});

    if (path != current.path) {
        // Fail a stale caller before the physical rename rather than after it.
        auto stored = ctx.documents().get(ctx.docType(), current.id);
        if (!stored)
            return reject(stored.error());
        if (stored->value(kDocRevField, std::string{}) != current.rev)
            return reject(Error{Error::Code::Conflict, "stale revision for " + current.id});

        pv_log("modifyDirectoryMetadata moving " + current.path + " -> " + path, "Directory");
        auto moved = MoveCoordinator(ctx).move(current.path, path, cancel);
        // Listings below the old path are stale once the rename happened, even
        // if part of the fan-out failed.
        if (invalidate != nullptr) {
            invalidate->invalidateBelow(current.path);
            invalidate->invalidate(current.id);
            invalidate->invalidate(current.parentID);
            invalidate->invalidate(parentID);
        }
        if (!moved)
            return std::unexpected(moved.error());
    }

    DirectoryNode updated = current;
    updated.name          = std::move(name);
    updated.parentID      = std::move(parentID);
    updated.path          = std::move(path);
    updated.tags          = std::move(tags);
    updated.updatedAt     = updatedAt;

    auto rev = ctx.documents().update(ctx.docType(), directoryToJson(updated));
    if (!rev) {
        pv_log("modifyDirectoryMetadata update of " + current.id + " failed: " + describeError(rev.error()), "Directory", "Error");
        return std::unexpected(rev.error());
    }
    updated.rev = std::move(*rev);
    if (invalidate != nullptr)
        invalidate->invalidate(current.parentID);
    return updated;
}

} // namespace PV
