#pragma once
#include "core/Error.hpp"
#include "core/Timestamp.hpp"
#include "path/PathUtils.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace PV {

// Well-known id of the tree root. Never persisted; synthesized on lookup.
inline constexpr char kRootDirID[] = "pathvault.files.root-dir";

// Values of the "type" discriminator shared by file and directory documents.
inline constexpr char kDirType[]  = "directory";
inline constexpr char kFileType[] = "file";

namespace Field {
inline constexpr char Type[]      = "type";
inline constexpr char Name[]      = "name";
inline constexpr char FolderID[]  = "folder_id";
inline constexpr char Path[]      = "path";
inline constexpr char Tags[]      = "tags";
inline constexpr char CreatedAt[] = "created_at";
inline constexpr char UpdatedAt[] = "updated_at";
inline constexpr char Size[]      = "size";
inline constexpr char Mime[]      = "mime";
} // namespace Field

struct DirectoryNode {
    std::string              id;
    std::string              rev;
    std::string              name;
    std::string              parentID;
    std::string              path;
    std::vector<std::string> tags;
    Timestamp                createdAt{};
    Timestamp                updatedAt{};

    auto isRoot() const -> bool { return id == kRootDirID; }

    bool operator==(DirectoryNode const&) const = default;
};

/**
 * Validating constructor. Fails InvalidName for an empty name, a name with a
 * path separator or control character, "." / "..", or one longer than
 * maxNameLength. An empty parentID defaults to the root. createdAt and
 * updatedAt are set to the current time; path is left for createDirectory.
 */
auto makeDirectoryNode(std::string              name,
                       std::string              parentID      = {},
                       std::vector<std::string> tags          = {},
                       std::size_t              maxNameLength = kDefaultMaxNameLength) -> Expected<DirectoryNode>;

auto rootDirectory() -> DirectoryNode;

auto normalizeParentID(std::string_view parentID) -> std::string;

// Keeps the order of current, appends unseen tags from added, drops empties.
auto appendTags(std::vector<std::string> const& current, std::vector<std::string> const& added) -> std::vector<std::string>;

auto documentType(nlohmann::json const& doc) -> std::string;

auto directoryToJson(DirectoryNode const& node) -> nlohmann::json;
auto directoryFromJson(nlohmann::json const& doc) -> Expected<DirectoryNode>;

} // namespace PV
