#pragma once
#include "core/Error.hpp"
#include "vfs/DirectoryNode.hpp"
#include "vfs/FileNode.hpp"
#include "vfs/VfsContext.hpp"

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace PV {

struct DirectoryChildren {
    std::vector<FileNode>      files;
    std::vector<DirectoryNode> dirs;
};

// Direct children of parent, split by type, each in store order. At most
// options().childrenPageSize documents are read; there is no continuation.
auto fetchChildren(VfsContext const& ctx, DirectoryNode const& parent) -> Expected<DirectoryChildren>;

/**
 * ChildrenCache — side table of fetched listings keyed by directory id
 *
 * Lives apart from the DirectoryNode values so nodes stay plain values. The
 * owner decides its lifetime; createDirectory and modifyDirectoryMetadata
 * drop the entries they make stale when they are handed the cache.
 *
 * Concurrency: the entries map is sharded and locks per submap.
 */
class ChildrenCache {
public:
    auto put(std::string const& id, DirectoryChildren children) -> void;
    auto get(std::string_view id) const -> std::optional<DirectoryChildren>;
    auto contains(std::string_view id) const -> bool;
    auto invalidate(std::string_view id) -> void;
    // Drops every listing that names a directory at path or below it.
    auto invalidateBelow(std::string_view path) -> std::size_t;
    auto clear() -> void;
    auto size() const -> std::size_t;

private:
    static constexpr int DefaultSubmaps = 4;

    using Entries = phmap::parallel_node_hash_map<std::string,
                                                  DirectoryChildren,
                                                  phmap::priv::hash_default_hash<std::string>,
                                                  phmap::priv::hash_default_eq<std::string>,
                                                  std::allocator<std::pair<const std::string, DirectoryChildren>>,
                                                  DefaultSubmaps,
                                                  std::mutex>;

    Entries entries;
};

} // namespace PV
