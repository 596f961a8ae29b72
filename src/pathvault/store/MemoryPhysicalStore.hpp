#pragma once
#include "store/PhysicalStore.hpp"

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace PV {

// Directory tree held as an ordered set of absolute paths. "/" always exists.
class MemoryPhysicalStore final : public PhysicalStore {
public:
    MemoryPhysicalStore();

    auto mkdir(std::string_view path) -> std::optional<Error> override;
    auto stat(std::string_view path) -> Expected<bool> override;
    auto remove(std::string_view path) -> std::optional<Error> override;
    auto rename(std::string_view from, std::string_view to) -> std::optional<Error> override;

    auto list() const -> std::vector<std::string>;

private:
    auto hasChildrenLocked(std::string const& path) const -> bool;

    mutable std::mutex    mutex;
    std::set<std::string> entries;
};

} // namespace PV
