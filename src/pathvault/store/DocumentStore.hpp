#pragma once
#include "core/Error.hpp"
#include "store/Selector.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace PV {

inline constexpr char kDocIdField[]  = "_id";
inline constexpr char kDocRevField[] = "_rev";

struct DocumentRef {
    std::string id;
    std::string rev;
};

struct FindOptions {
    std::size_t limit = 0; // 0 = unbounded
};

/**
 * DocumentStore — revisioned JSON document database
 *
 * Documents are JSON objects carrying "_id" and "_rev". Every successful
 * write assigns a fresh revision; update() is a compare-and-swap on the
 * supplied "_rev" and fails Conflict when it is stale. There are no
 * multi-document transactions.
 *
 * Implementations must be safe for concurrent use from many threads.
 */
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    // Assigns an id when doc has none. AlreadyExists on a duplicate id.
    virtual auto create(std::string_view doctype, nlohmann::json doc) -> Expected<DocumentRef> = 0;

    virtual auto get(std::string_view doctype, std::string_view id) -> Expected<nlohmann::json> = 0;

    // Returns the new revision. NotFound for an unknown id, Conflict on a stale "_rev".
    virtual auto update(std::string_view doctype, nlohmann::json doc) -> Expected<std::string> = 0;

    // Matches in store order, at most options.limit of them.
    virtual auto find(std::string_view doctype, Selector const& selector, FindOptions const& options = {})
            -> Expected<std::vector<nlohmann::json>> = 0;
};

} // namespace PV
