#pragma once
#include "core/Error.hpp"

#include <optional>
#include <string_view>

namespace PV {

/**
 * PhysicalStore — hierarchical storage addressed by absolute VFS path
 *
 * Mirrors the directory tree described by the metadata documents. rename()
 * relocates a whole subtree and is expected to be atomic and exclusive at
 * the backend; no locking is layered on top of it.
 */
class PhysicalStore {
public:
    virtual ~PhysicalStore() = default;

    // AlreadyExists when an entry is present, NotFound when the parent is missing.
    virtual auto mkdir(std::string_view path) -> std::optional<Error> = 0;

    virtual auto stat(std::string_view path) -> Expected<bool> = 0;

    // Removes an empty directory. NotFound if absent.
    virtual auto remove(std::string_view path) -> std::optional<Error> = 0;

    // NotFound if from is missing or to's parent is missing, AlreadyExists if to exists.
    virtual auto rename(std::string_view from, std::string_view to) -> std::optional<Error> = 0;
};

} // namespace PV
