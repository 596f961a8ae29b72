#pragma once
#include "core/Error.hpp"
#include "core/Timestamp.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace PV::detail {

inline auto readString(nlohmann::json const& doc, char const* field) -> Expected<std::string> {
    auto it = doc.find(field);
    if (it == doc.end() || !it->is_string())
        return std::unexpected(Error{Error::Code::MalformedInput, std::string("missing string field: ") + field});
    return it->get<std::string>();
}

// Absent or null reads as empty, anything else must be a string.
inline auto readOptionalString(nlohmann::json const& doc, char const* field) -> Expected<std::string> {
    auto it = doc.find(field);
    if (it == doc.end() || it->is_null())
        return std::string{};
    if (!it->is_string())
        return std::unexpected(Error{Error::Code::MalformedInput, std::string("field is not a string: ") + field});
    return it->get<std::string>();
}

inline auto readTimestamp(nlohmann::json const& doc, char const* field) -> Expected<Timestamp> {
    auto text = readString(doc, field);
    if (!text)
        return std::unexpected(text.error());
    return parseTimestamp(*text);
}

inline auto readTags(nlohmann::json const& doc) -> Expected<std::vector<std::string>> {
    std::vector<std::string> tags;
    auto                     it = doc.find("tags");
    if (it == doc.end() || it->is_null())
        return tags;
    if (!it->is_array())
        return std::unexpected(Error{Error::Code::MalformedInput, "tags must be an array"});
    for (auto const& tag : *it) {
        if (!tag.is_string())
            return std::unexpected(Error{Error::Code::MalformedInput, "tags must be strings"});
        tags.push_back(tag.get<std::string>());
    }
    return tags;
}

} // namespace PV::detail
