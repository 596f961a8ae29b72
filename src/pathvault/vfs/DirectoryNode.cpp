#include "vfs/DirectoryNode.hpp"
#include "store/DocumentStore.hpp"
#include "vfs/JsonFields.hpp"

#include <unordered_set>

namespace PV {

auto makeDirectoryNode(std::string              name,
                       std::string              parentID,
                       std::vector<std::string> tags,
                       std::size_t              maxNameLength) -> Expected<DirectoryNode> {
    if (auto invalid = validate_name(name, maxNameLength))
        return std::unexpected(*invalid);

    auto const created = now();
    DirectoryNode node;
    node.name      = std::move(name);
    node.parentID  = normalizeParentID(parentID);
    node.tags      = appendTags({}, tags);
    node.createdAt = created;
    node.updatedAt = created;
    return node;
}

auto rootDirectory() -> DirectoryNode {
    DirectoryNode root;
    root.id   = kRootDirID;
    root.path = "/";
    return root;
}

auto normalizeParentID(std::string_view parentID) -> std::string {
    if (parentID.empty())
        return kRootDirID;
    return std::string(parentID);
}

auto appendTags(std::vector<std::string> const& current, std::vector<std::string> const& added) -> std::vector<std::string> {
    std::vector<std::string>        merged;
    std::unordered_set<std::string> seen;
    merged.reserve(current.size() + added.size());
    for (auto const* source : {&current, &added}) {
        for (auto const& tag : *source) {
            if (tag.empty() || !seen.insert(tag).second)
                continue;
            merged.push_back(tag);
        }
    }
    return merged;
}

auto documentType(nlohmann::json const& doc) -> std::string {
    auto it = doc.find(Field::Type);
    if (it == doc.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

auto directoryToJson(DirectoryNode const& node) -> nlohmann::json {
    nlohmann::json doc{
        {Field::Type, kDirType},
        {Field::Name, node.name},
        {Field::FolderID, node.parentID},
        {Field::Path, node.path},
        {Field::Tags, node.tags},
        {Field::CreatedAt, formatTimestamp(node.createdAt)},
        {Field::UpdatedAt, formatTimestamp(node.updatedAt)},
    };
    if (!node.id.empty())
        doc[kDocIdField] = node.id;
    if (!node.rev.empty())
        doc[kDocRevField] = node.rev;
    return doc;
}

auto directoryFromJson(nlohmann::json const& doc) -> Expected<DirectoryNode> {
    if (!doc.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "directory document must be an object"});
    if (documentType(doc) != kDirType)
        return std::unexpected(Error{Error::Code::NotADirectory, "document type is '" + documentType(doc) + "'"});

    DirectoryNode node;
    auto          id = detail::readString(doc, kDocIdField);
    if (!id)
        return std::unexpected(id.error());
    node.id = std::move(*id);

    auto rev = detail::readOptionalString(doc, kDocRevField);
    if (!rev)
        return std::unexpected(rev.error());
    node.rev = std::move(*rev);

    auto name = detail::readString(doc, Field::Name);
    if (!name)
        return std::unexpected(name.error());
    node.name = std::move(*name);

    auto folder = detail::readOptionalString(doc, Field::FolderID);
    if (!folder)
        return std::unexpected(folder.error());
    node.parentID = normalizeParentID(*folder);

    auto path = detail::readString(doc, Field::Path);
    if (!path)
        return std::unexpected(path.error());
    node.path = std::move(*path);

    auto tags = detail::readTags(doc);
    if (!tags)
        return std::unexpected(tags.error());
    node.tags = std::move(*tags);

    auto created = detail::readTimestamp(doc, Field::CreatedAt);
    if (!created)
        return std::unexpected(created.error());
    node.createdAt = *created;

    auto updated = detail::readTimestamp(doc, Field::UpdatedAt);
    if (!updated)
        return std::unexpected(updated.error());
    node.updatedAt = *updated;

    return node;
}

} // namespace PV
