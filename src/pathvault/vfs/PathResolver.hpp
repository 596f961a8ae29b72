#pragma once
#include "core/Error.hpp"
#include "vfs/DirectoryNode.hpp"
#include "vfs/VfsContext.hpp"

#include <string>
#include <string_view>

namespace PV {

struct ResolvedPath {
    std::string   path;
    DirectoryNode parent;
};

// Loads the directory parentID names. The root id (or an empty id) yields the
// synthetic root. ParentMissing when no directory document has that id.
auto resolveParent(VfsContext const& ctx, std::string_view parentID) -> Expected<DirectoryNode>;

// Canonical path of a child called name below parentID. InvalidName when the
// name is unusable, ParentMissing when the parent does not resolve.
auto computeChildPath(VfsContext const& ctx, std::string_view name, std::string_view parentID) -> Expected<ResolvedPath>;

} // namespace PV
