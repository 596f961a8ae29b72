#include "vfs/FileNode.hpp"
#include "store/DocumentStore.hpp"
#include "vfs/DirectoryNode.hpp"
#include "vfs/JsonFields.hpp"

namespace PV {

auto fileToJson(FileNode const& node) -> nlohmann::json {
    nlohmann::json doc{
        {Field::Type, kFileType},
        {Field::Name, node.name},
        {Field::FolderID, node.parentID},
        {Field::Size, node.size},
        {Field::Mime, node.mime},
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

auto fileFromJson(nlohmann::json const& doc) -> Expected<FileNode> {
    if (!doc.is_object() || documentType(doc) != kFileType)
        return std::unexpected(Error{Error::Code::MalformedInput, "not a file document"});

    FileNode node;
    auto     id = detail::readString(doc, kDocIdField);
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

    if (auto it = doc.find(Field::Size); it != doc.end()) {
        if (!it->is_number_unsigned())
            return std::unexpected(Error{Error::Code::MalformedInput, "size must be an unsigned integer"});
        node.size = it->get<std::uint64_t>();
    }

    auto mime = detail::readOptionalString(doc, Field::Mime);
    if (!mime)
        return std::unexpected(mime.error());
    node.mime = std::move(*mime);

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
