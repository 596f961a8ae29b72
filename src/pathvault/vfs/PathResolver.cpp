#include "vfs/PathResolver.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"

namespace PV {

auto resolveParent(VfsContext const& ctx, std::string_view parentID) -> Expected<DirectoryNode> {
    auto const id = normalizeParentID(parentID);
    if (id == kRootDirID)
        return rootDirectory();

    auto doc = ctx.documents().get(ctx.docType(), id);
    if (!doc) {
        if (doc.error().code == Error::Code::NotFound)
            return std::unexpected(Error{Error::Code::ParentMissing, "parent directory does not exist: " + id});
        return std::unexpected(doc.error());
    }
    if (documentType(*doc) != kDirType)
        return std::unexpected(Error{Error::Code::ParentMissing, "parent is not a directory: " + id});
    return directoryFromJson(*doc);
}

auto computeChildPath(VfsContext const& ctx, std::string_view name, std::string_view parentID) -> Expected<ResolvedPath> {
    if (auto invalid = validate_name(name, ctx.options().maxNameLength)) {
        pv_log("computeChildPath rejected name: " + describeError(*invalid), "PathResolver");
        return std::unexpected(*invalid);
    }

    auto parent = resolveParent(ctx, parentID);
    if (!parent) {
        pv_log("computeChildPath failed to resolve parent " + std::string(parentID) + ": " + describeError(parent.error()), "PathResolver");
        return std::unexpected(parent.error());
    }

    auto path = join_path(parent->path, name);
    return ResolvedPath{std::move(path), std::move(*parent)};
}

} // namespace PV
