#pragma once
#include "core/Error.hpp"
#include "core/Timestamp.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace PV {

// Leaf metadata. Only the fields a directory listing needs are modelled here.
struct FileNode {
    std::string              id;
    std::string              rev;
    std::string              name;
    std::string              parentID;
    std::uint64_t            size = 0;
    std::string              mime;
    std::vector<std::string> tags;
    Timestamp                createdAt{};
    Timestamp                updatedAt{};

    bool operator==(FileNode const&) const = default;
};

auto fileToJson(FileNode const& node) -> nlohmann::json;
auto fileFromJson(nlohmann::json const& doc) -> Expected<FileNode>;

} // namespace PV
