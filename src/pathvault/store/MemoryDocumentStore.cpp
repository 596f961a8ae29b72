#include "store/MemoryDocumentStore.hpp"
#include "log/TaggedLogger.hpp"

#include <charconv>
#include <system_error>

namespace PV {

MemoryDocumentStore::MemoryDocumentStore()
    : rng(std::random_device{}()) {}

auto MemoryDocumentStore::randomHex(std::size_t digits) -> std::string {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string           out;
    out.reserve(digits);
    while (out.size() < digits) {
        auto bits = rng();
        for (int i = 0; i < 16 && out.size() < digits; ++i) {
            out.push_back(kHex[bits & 0xf]);
            bits >>= 4;
        }
    }
    return out;
}

auto MemoryDocumentStore::nextRevision(std::string_view previous) -> std::string {
    std::uint64_t generation = 0;
    auto const    dash       = previous.find('-');
    if (dash != std::string_view::npos) {
        auto [ptr, ec] = std::from_chars(previous.data(), previous.data() + dash, generation);
        if (ec != std::errc{} || ptr != previous.data() + dash)
            generation = 0;
    }
    return std::to_string(generation + 1) + "-" + randomHex(32);
}

auto MemoryDocumentStore::create(std::string_view doctype, nlohmann::json doc) -> Expected<DocumentRef> {
    if (!doc.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "document must be a JSON object"});

    std::lock_guard<std::mutex> lock(mutex);
    auto&                       table = tables[std::string(doctype)];

    std::string id;
    if (auto it = doc.find(kDocIdField); it != doc.end() && it->is_string() && !it->get_ref<std::string const&>().empty()) {
        id = it->get<std::string>();
        if (table.sequenceById.contains(id))
            return std::unexpected(Error{Error::Code::AlreadyExists, "document already exists: " + id});
    } else {
        do {
            id = randomHex(32);
        } while (table.sequenceById.contains(id));
    }

    auto rev               = nextRevision({});
    doc[kDocIdField]       = id;
    doc[kDocRevField]      = rev;
    auto const sequence    = nextSequence++;
    table.sequenceById[id] = sequence;
    table.bySequence.emplace(sequence, std::move(doc));

    pv_log("MemoryDocumentStore::create " + std::string(doctype) + "/" + id + " rev=" + rev, "DocumentStore");
    return DocumentRef{std::move(id), std::move(rev)};
}

auto MemoryDocumentStore::get(std::string_view doctype, std::string_view id) -> Expected<nlohmann::json> {
    std::lock_guard<std::mutex> lock(mutex);
    auto                        tableIt = tables.find(std::string(doctype));
    if (tableIt == tables.end())
        return std::unexpected(Error{Error::Code::NotFound, "no such document: " + std::string(id)});
    auto seqIt = tableIt->second.sequenceById.find(std::string(id));
    if (seqIt == tableIt->second.sequenceById.end())
        return std::unexpected(Error{Error::Code::NotFound, "no such document: " + std::string(id)});
    return tableIt->second.bySequence.at(seqIt->second);
}

auto MemoryDocumentStore::update(std::string_view doctype, nlohmann::json doc) -> Expected<std::string> {
    if (!doc.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "document must be a JSON object"});
    auto idIt  = doc.find(kDocIdField);
    auto revIt = doc.find(kDocRevField);
    if (idIt == doc.end() || !idIt->is_string())
        return std::unexpected(Error{Error::Code::MalformedInput, "update requires _id"});
    if (revIt == doc.end() || !revIt->is_string())
        return std::unexpected(Error{Error::Code::MalformedInput, "update requires _rev"});
    auto const id       = idIt->get<std::string>();
    auto const supplied = revIt->get<std::string>();

    std::lock_guard<std::mutex> lock(mutex);
    auto                        tableIt = tables.find(std::string(doctype));
    if (tableIt == tables.end() || !tableIt->second.sequenceById.contains(id))
        return std::unexpected(Error{Error::Code::NotFound, "no such document: " + id});

    auto& stored = tableIt->second.bySequence.at(tableIt->second.sequenceById.at(id));
    auto  current = stored.at(kDocRevField).get<std::string>();
    if (current != supplied) {
        pv_log("MemoryDocumentStore::update conflict on " + id + " supplied=" + supplied + " current=" + current, "DocumentStore");
        return std::unexpected(Error{Error::Code::Conflict, "stale revision for " + id + ": " + supplied + " != " + current});
    }

    auto rev          = nextRevision(current);
    doc[kDocRevField] = rev;
    stored            = std::move(doc);
    return rev;
}

auto MemoryDocumentStore::find(std::string_view doctype, Selector const& selector, FindOptions const& options)
        -> Expected<std::vector<nlohmann::json>> {
    std::vector<nlohmann::json> matches;
    std::lock_guard<std::mutex> lock(mutex);
    auto                        tableIt = tables.find(std::string(doctype));
    if (tableIt == tables.end())
        return matches;
    for (auto const& [sequence, doc] : tableIt->second.bySequence) {
        if (!selector.matches(doc))
            continue;
        matches.push_back(doc);
        if (options.limit != 0 && matches.size() >= options.limit)
            break;
    }
    return matches;
}

auto MemoryDocumentStore::size(std::string_view doctype) const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex);
    auto                        tableIt = tables.find(std::string(doctype));
    return tableIt == tables.end() ? 0 : tableIt->second.sequenceById.size();
}

} // namespace PV
