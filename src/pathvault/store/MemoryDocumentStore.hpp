#pragma once
#include "store/DocumentStore.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

namespace PV {

// Process-local DocumentStore. Documents are kept per doctype in creation order.
class MemoryDocumentStore final : public DocumentStore {
public:
    MemoryDocumentStore();

    auto create(std::string_view doctype, nlohmann::json doc) -> Expected<DocumentRef> override;
    auto get(std::string_view doctype, std::string_view id) -> Expected<nlohmann::json> override;
    auto update(std::string_view doctype, nlohmann::json doc) -> Expected<std::string> override;
    auto find(std::string_view doctype, Selector const& selector, FindOptions const& options = {})
            -> Expected<std::vector<nlohmann::json>> override;

    auto size(std::string_view doctype) const -> std::size_t;

private:
    struct Table {
        std::map<std::uint64_t, nlohmann::json>        bySequence;
        std::unordered_map<std::string, std::uint64_t> sequenceById;
    };

    auto nextRevision(std::string_view previous) -> std::string;
    auto randomHex(std::size_t digits) -> std::string;

    mutable std::mutex                           mutex;
    std::unordered_map<std::string, Table>       tables;
    std::uint64_t                                nextSequence = 0;
    std::mt19937_64                              rng;
};

} // namespace PV
