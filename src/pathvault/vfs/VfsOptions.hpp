#pragma once
#include "core/Error.hpp"
#include "path/PathUtils.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace PV {

struct VfsOptions {
    std::string docType           = "pathvault.files"; // Doctype of file and directory documents
    std::size_t childrenPageSize  = 10;                // Upper bound of one children listing
    std::size_t fanoutConcurrency = 8;                 // Descendant fix-ups in flight during a move
    std::size_t maxNameLength     = kDefaultMaxNameLength;
};

auto validateVfsOptions(VfsOptions const& options) -> std::optional<Error>;

// Keys: doc_type, children_page_size, fanout_concurrency, max_name_length.
// Absent keys keep the value from base; unknown keys are ignored.
auto loadVfsOptionsFromJson(std::string_view text, VfsOptions base = {}) -> Expected<VfsOptions>;

// PATHVAULT_DOC_TYPE, PATHVAULT_CHILDREN_PAGE_SIZE, PATHVAULT_FANOUT_CONCURRENCY,
// PATHVAULT_MAX_NAME_LENGTH override the matching fields when set.
auto applyVfsOptionsEnvironment(VfsOptions base = {}) -> Expected<VfsOptions>;

auto vfsOptionsToJson(VfsOptions const& options) -> nlohmann::json;

} // namespace PV
