#include "path/PathUtils.hpp"

#include <vector>

namespace PV {

auto clean_path(std::string_view path) -> std::string {
    if (path.empty())
        return ".";

    bool const                    rooted = path.front() == kPathSeparator;
    std::vector<std::string_view> parts;

    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto const next    = path.find(kPathSeparator, pos);
        auto const end     = next == std::string_view::npos ? path.size() : next;
        auto const segment = path.substr(pos, end - pos);
        pos                = end + 1;

        if (segment.empty() || segment == ".")
            continue;
        if (segment == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!rooted) {
                parts.push_back(segment);
            }
            continue;
        }
        parts.push_back(segment);
    }

    std::string out;
    if (rooted)
        out.push_back(kPathSeparator);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out.push_back(kPathSeparator);
        out.append(parts[i]);
    }
    if (out.empty())
        return ".";
    return out;
}

auto is_absolute(std::string_view path) -> bool {
    return !path.empty() && path.front() == kPathSeparator;
}

auto join_path(std::string_view dir, std::string_view name) -> std::string {
    std::string joined;
    joined.reserve(dir.size() + 1 + name.size());
    joined.append(dir);
    joined.push_back(kPathSeparator);
    joined.append(name);
    return clean_path(joined);
}

auto dir_name(std::string_view path) -> std::string {
    auto const slash = path.find_last_of(kPathSeparator);
    if (slash == std::string_view::npos)
        return ".";
    if (slash == 0)
        return std::string(1, kPathSeparator);
    return clean_path(path.substr(0, slash));
}

auto base_name(std::string_view path) -> std::string {
    if (path.empty())
        return ".";
    while (path.size() > 1 && path.back() == kPathSeparator)
        path.remove_suffix(1);
    if (path == "/")
        return std::string(path);
    auto const slash = path.find_last_of(kPathSeparator);
    if (slash == std::string_view::npos)
        return std::string(path);
    return std::string(path.substr(slash + 1));
}

auto is_strict_descendant(std::string_view path, std::string_view ancestor) -> bool {
    if (ancestor == "/")
        return path.size() > 1 && path.front() == kPathSeparator;
    return path.size() > ancestor.size() + 1 && path.starts_with(ancestor) && path[ancestor.size()] == kPathSeparator;
}

auto rebase_path(std::string_view path, std::string_view oldPrefix, std::string_view newPrefix) -> std::string {
    auto const tail = oldPrefix == "/" ? path.substr(1) : path.substr(oldPrefix.size() + 1);
    return join_path(newPrefix, tail);
}

auto validate_name(std::string_view name, std::size_t maxLength) -> std::optional<Error> {
    if (name.empty())
        return Error{Error::Code::InvalidName, "name is empty"};
    if (name.size() > maxLength)
        return Error{Error::Code::InvalidName, "name exceeds " + std::to_string(maxLength) + " bytes"};
    if (name == "." || name == "..")
        return Error{Error::Code::InvalidName, "name is a relative path element: " + std::string(name)};
    for (char c : name) {
        if (c == kPathSeparator)
            return Error{Error::Code::InvalidName, "name contains a path separator: " + std::string(name)};
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f)
            return Error{Error::Code::InvalidName, "name contains a control character"};
    }
    return std::nullopt;
}

auto validate_absolute_path(std::string_view path) -> std::optional<Error> {
    if (!is_absolute(path))
        return Error{Error::Code::InvalidPath, "path must be absolute: " + std::string(path)};
    if (path == "/")
        return std::nullopt;
    if (path.back() == kPathSeparator)
        return Error{Error::Code::InvalidPath, "path ends with a separator: " + std::string(path)};
    if (clean_path(path) != path)
        return Error{Error::Code::InvalidPath, "path is not canonical: " + std::string(path)};
    return std::nullopt;
}

} // namespace PV
