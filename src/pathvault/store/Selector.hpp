#pragma once
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace PV {

/**
 * Selector — field predicate over JSON documents
 *
 * A small subset of CouchDB's Mango selectors: exact equality on a top-level
 * field, string prefix match on a top-level field, and conjunction. A missing
 * field never matches.
 */
class Selector {
public:
    enum class Kind {
        Equal,
        StartsWith,
        All
    };

    static auto Equal(std::string field, nlohmann::json value) -> Selector;
    static auto StartsWith(std::string field, std::string prefix) -> Selector;
    static auto All(std::vector<Selector> selectors) -> Selector;

    auto matches(nlohmann::json const& doc) const -> bool;
    auto kind() const -> Kind { return kind_; }

private:
    Selector(Kind kind, std::string field, nlohmann::json operand);

    Kind                  kind_;
    std::string           field_;
    nlohmann::json        operand_;
    std::vector<Selector> children_;
};

} // namespace PV
