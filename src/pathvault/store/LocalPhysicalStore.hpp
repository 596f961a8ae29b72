#pragma once
#include "store/PhysicalStore.hpp"

#include <filesystem>
#include <string>

namespace PV {

// Maps VFS paths onto directories below a host root directory.
class LocalPhysicalStore final : public PhysicalStore {
public:
    explicit LocalPhysicalStore(std::filesystem::path root);

    auto mkdir(std::string_view path) -> std::optional<Error> override;
    auto stat(std::string_view path) -> Expected<bool> override;
    auto remove(std::string_view path) -> std::optional<Error> override;
    auto rename(std::string_view from, std::string_view to) -> std::optional<Error> override;

    auto root() const -> std::filesystem::path const& { return root_; }

private:
    auto hostPath(std::string_view path) const -> Expected<std::filesystem::path>;

    std::filesystem::path root_;
};

} // namespace PV
