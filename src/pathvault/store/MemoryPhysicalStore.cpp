#include "store/MemoryPhysicalStore.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"

namespace PV {

MemoryPhysicalStore::MemoryPhysicalStore() {
    entries.insert("/");
}

auto MemoryPhysicalStore::hasChildrenLocked(std::string const& path) const -> bool {
    auto const prefix = path == "/" ? path : path + "/";
    auto       it     = entries.lower_bound(prefix);
    if (it != entries.end() && *it == "/")
        ++it;
    return it != entries.end() && it->starts_with(prefix);
}

auto MemoryPhysicalStore::mkdir(std::string_view path) -> std::optional<Error> {
    if (auto invalid = validate_absolute_path(path))
        return invalid;

    std::string const           key{path};
    std::lock_guard<std::mutex> lock(mutex);
    if (entries.contains(key))
        return Error{Error::Code::AlreadyExists, "entry exists: " + key};
    if (!entries.contains(dir_name(key)))
        return Error{Error::Code::NotFound, "parent directory missing: " + dir_name(key)};
    entries.insert(key);
    return std::nullopt;
}

auto MemoryPhysicalStore::stat(std::string_view path) -> Expected<bool> {
    if (auto invalid = validate_absolute_path(path))
        return std::unexpected(*invalid);
    std::lock_guard<std::mutex> lock(mutex);
    return entries.contains(std::string(path));
}

auto MemoryPhysicalStore::remove(std::string_view path) -> std::optional<Error> {
    if (auto invalid = validate_absolute_path(path))
        return invalid;
    std::string const key{path};
    if (key == "/")
        return Error{Error::Code::InvalidPath, "cannot remove the root"};

    std::lock_guard<std::mutex> lock(mutex);
    if (!entries.contains(key))
        return Error{Error::Code::NotFound, "no such entry: " + key};
    if (hasChildrenLocked(key))
        return Error{Error::Code::IOError, "directory not empty: " + key};
    entries.erase(key);
    return std::nullopt;
}

auto MemoryPhysicalStore::rename(std::string_view from, std::string_view to) -> std::optional<Error> {
    if (auto invalid = validate_absolute_path(from))
        return invalid;
    if (auto invalid = validate_absolute_path(to))
        return invalid;
    std::string const source{from};
    std::string const target{to};
    if (source == "/" || is_strict_descendant(target, source))
        return Error{Error::Code::InvalidPath, "cannot move " + source + " below itself"};

    std::lock_guard<std::mutex> lock(mutex);
    if (!entries.contains(source))
        return Error{Error::Code::NotFound, "no such entry: " + source};
    if (entries.contains(target))
        return Error{Error::Code::AlreadyExists, "entry exists: " + target};
    if (!entries.contains(dir_name(target)))
        return Error{Error::Code::NotFound, "parent directory missing: " + dir_name(target)};

    // Descendants share the "source/" prefix, so they are contiguous in the ordered set.
    auto const               prefix = source + "/";
    std::vector<std::string> moved{source};
    for (auto it = entries.lower_bound(prefix); it != entries.end() && it->starts_with(prefix); ++it)
        moved.push_back(*it);
    for (auto const& entry : moved) {
        entries.erase(entry);
        entries.insert(entry == source ? target : rebase_path(entry, source, target));
    }
    pv_log("MemoryPhysicalStore::rename " + source + " -> " + target + " (" + std::to_string(moved.size()) + " entries)", "PhysicalStore");
    return std::nullopt;
}

auto MemoryPhysicalStore::list() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex);
    return {entries.begin(), entries.end()};
}

} // namespace PV
