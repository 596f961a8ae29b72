#include "vfs/ChildrenFetcher.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"
#include "store/Selector.hpp"

#include <algorithm>

namespace PV {

auto fetchChildren(VfsContext const& ctx, DirectoryNode const& parent) -> Expected<DirectoryChildren> {
    auto docs = ctx.documents().find(ctx.docType(),
                                     Selector::Equal(Field::FolderID, parent.id),
                                     FindOptions{.limit = ctx.options().childrenPageSize});
    if (!docs)
        return std::unexpected(docs.error());

    DirectoryChildren children;
    for (auto const& doc : *docs) {
        auto const type = documentType(doc);
        if (type == kDirType) {
            auto dir = directoryFromJson(doc);
            if (!dir)
                return std::unexpected(dir.error());
            children.dirs.push_back(std::move(*dir));
        } else if (type == kFileType) {
            auto file = fileFromJson(doc);
            if (!file)
                return std::unexpected(file.error());
            children.files.push_back(std::move(*file));
        } else {
            pv_log("fetchChildren skipping document of type '" + type + "' under " + parent.id, "ChildrenFetcher");
        }
    }
    return children;
}

auto ChildrenCache::put(std::string const& id, DirectoryChildren children) -> void {
    entries.insert_or_assign(id, std::move(children));
}

auto ChildrenCache::get(std::string_view id) const -> std::optional<DirectoryChildren> {
    std::optional<DirectoryChildren> found;
    entries.if_contains(std::string(id), [&found](auto const& entry) { found = entry.second; });
    return found;
}

auto ChildrenCache::contains(std::string_view id) const -> bool {
    return entries.contains(std::string(id));
}

auto ChildrenCache::invalidate(std::string_view id) -> void {
    entries.erase(std::string(id));
}

auto ChildrenCache::invalidateBelow(std::string_view path) -> std::size_t {
    auto const within = [path](DirectoryNode const& dir) { return dir.path == path || is_strict_descendant(dir.path, path); };

    std::vector<std::string> stale;
    entries.for_each([&](auto const& entry) {
        if (std::any_of(entry.second.dirs.begin(), entry.second.dirs.end(), within))
            stale.push_back(entry.first);
    });
    for (auto const& id : stale)
        entries.erase(id);
    return stale.size();
}

auto ChildrenCache::clear() -> void {
    entries.clear();
}

auto ChildrenCache::size() const -> std::size_t {
    return entries.size();
}

} // namespace PV
