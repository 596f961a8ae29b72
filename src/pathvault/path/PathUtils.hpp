#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace PV {

inline constexpr char        kPathSeparator        = '/';
inline constexpr std::size_t kDefaultMaxNameLength = 255;

// Lexical canonicalization: collapses repeated separators, resolves "." and
// "..", and drops a trailing separator. An empty input cleans to ".".
auto clean_path(std::string_view path) -> std::string;

auto is_absolute(std::string_view path) -> bool;

// clean_path(dir + "/" + name)
auto join_path(std::string_view dir, std::string_view name) -> std::string;

// Everything before the final separator, cleaned. "/a" -> "/", "/" -> "/".
auto dir_name(std::string_view path) -> std::string;

// Final path element. "/a/b" -> "b", "/" -> "/".
auto base_name(std::string_view path) -> std::string;

// True when path lies strictly below ancestor (ancestor + "/" is a prefix).
auto is_strict_descendant(std::string_view path, std::string_view ancestor) -> bool;

// Replaces the oldPrefix of path with newPrefix. path must be a strict
// descendant of oldPrefix.
auto rebase_path(std::string_view path, std::string_view oldPrefix, std::string_view newPrefix) -> std::string;

auto validate_name(std::string_view name, std::size_t maxLength = kDefaultMaxNameLength) -> std::optional<Error>;

// Canonical absolute VFS path: leading "/", no trailing "/", no empty, "." or ".." segments.
auto validate_absolute_path(std::string_view path) -> std::optional<Error>;

} // namespace PV
