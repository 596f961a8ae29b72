#include "store/Selector.hpp"

namespace PV {

Selector::Selector(Kind kind, std::string field, nlohmann::json operand)
    : kind_(kind), field_(std::move(field)), operand_(std::move(operand)) {}

auto Selector::Equal(std::string field, nlohmann::json value) -> Selector {
    return Selector{Kind::Equal, std::move(field), std::move(value)};
}

auto Selector::StartsWith(std::string field, std::string prefix) -> Selector {
    return Selector{Kind::StartsWith, std::move(field), nlohmann::json(std::move(prefix))};
}

auto Selector::All(std::vector<Selector> selectors) -> Selector {
    Selector all{Kind::All, {}, nullptr};
    all.children_ = std::move(selectors);
    return all;
}

auto Selector::matches(nlohmann::json const& doc) const -> bool {
    switch (kind_) {
    case Kind::Equal: {
        auto it = doc.find(field_);
        return it != doc.end() && *it == operand_;
    }
    case Kind::StartsWith: {
        auto it = doc.find(field_);
        if (it == doc.end() || !it->is_string())
            return false;
        return it->get_ref<std::string const&>().starts_with(operand_.get_ref<std::string const&>());
    }
    case Kind::All:
        for (auto const& child : children_)
            if (!child.matches(doc))
                return false;
        return true;
    }
    return false;
}

} // namespace PV
