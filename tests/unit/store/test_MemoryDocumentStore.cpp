#include "store/MemoryDocumentStore.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace PV;
using json = nlohmann::json;

namespace {
constexpr char kType[] = "test.docs";

auto generation(std::string const& rev) -> int {
    return std::stoi(rev.substr(0, rev.find('-')));
}
} // namespace

TEST_SUITE("store.memory_document_store") {
TEST_CASE("create assigns id and first revision") {
    MemoryDocumentStore store;
    auto                ref = store.create(kType, json{{"name", "a"}});
    REQUIRE(ref.has_value());
    CHECK(ref->id.size() == 32);
    CHECK(generation(ref->rev) == 1);
    CHECK(ref->rev.size() == 2 + 32);

    auto doc = store.get(kType, ref->id);
    REQUIRE(doc.has_value());
    CHECK((*doc)["name"] == "a");
    CHECK((*doc)[kDocIdField] == ref->id);
    CHECK((*doc)[kDocRevField] == ref->rev);
    CHECK(store.size(kType) == 1);
}

TEST_CASE("create keeps a supplied id and rejects duplicates") {
    MemoryDocumentStore store;
    auto                first = store.create(kType, json{{"_id", "fixed"}});
    REQUIRE(first.has_value());
    CHECK(first->id == "fixed");

    auto again = store.create(kType, json{{"_id", "fixed"}});
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == Error::Code::AlreadyExists);

    auto notObject = store.create(kType, json::array());
    REQUIRE_FALSE(notObject.has_value());
    CHECK(notObject.error().code == Error::Code::MalformedInput);
}

TEST_CASE("get of unknown id is NotFound") {
    MemoryDocumentStore store;
    auto                missing = store.get(kType, "nope");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);
}

TEST_CASE("update is a compare-and-swap on _rev") {
    MemoryDocumentStore store;
    auto                ref = store.create(kType, json{{"n", 1}});
    REQUIRE(ref.has_value());

    auto doc = *store.get(kType, ref->id);
    doc["n"] = 2;
    auto rev = store.update(kType, doc);
    REQUIRE(rev.has_value());
    CHECK(generation(*rev) == 2);
    CHECK(*rev != ref->rev);

    SUBCASE("Stale revision conflicts") {
        doc["n"]  = 3;
        auto stale = store.update(kType, doc);
        REQUIRE_FALSE(stale.has_value());
        CHECK(stale.error().code == Error::Code::Conflict);
        CHECK((*store.get(kType, ref->id))["n"] == 2);
    }
    SUBCASE("Missing _rev is malformed") {
        auto bare = json{{"_id", ref->id}, {"n", 4}};
        auto out  = store.update(kType, bare);
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error().code == Error::Code::MalformedInput);
    }
    SUBCASE("Unknown id is NotFound") {
        auto out = store.update(kType, json{{"_id", "ghost"}, {"_rev", "1-x"}});
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error().code == Error::Code::NotFound);
    }
}

TEST_CASE("find returns matches in creation order and honours the limit") {
    MemoryDocumentStore store;
    for (int i = 0; i < 5; ++i)
        REQUIRE(store.create(kType, json{{"group", i % 2 == 0 ? "even" : "odd"}, {"i", i}}).has_value());
    REQUIRE(store.create("other.type", json{{"group", "even"}}).has_value());

    auto even = store.find(kType, Selector::Equal("group", "even"));
    REQUIRE(even.has_value());
    REQUIRE(even->size() == 3);
    CHECK((*even)[0]["i"] == 0);
    CHECK((*even)[1]["i"] == 2);
    CHECK((*even)[2]["i"] == 4);

    auto limited = store.find(kType, Selector::Equal("group", "even"), FindOptions{.limit = 2});
    REQUIRE(limited.has_value());
    CHECK(limited->size() == 2);

    auto none = store.find("unknown.type", Selector::All({}));
    REQUIRE(none.has_value());
    CHECK(none->empty());
}

TEST_CASE("Concurrent updates of one document: exactly one wins per revision") {
    MemoryDocumentStore store;
    auto                ref = store.create(kType, json{{"n", 0}});
    REQUIRE(ref.has_value());
    auto const base = *store.get(kType, ref->id);

    std::atomic<int>         wins{0};
    std::atomic<int>         conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            auto doc = base;
            doc["n"] = i;
            auto rev = store.update(kType, doc);
            if (rev)
                ++wins;
            else if (rev.error().code == Error::Code::Conflict)
                ++conflicts;
        });
    }
    for (auto& t : threads)
        t.join();

    CHECK(wins == 1);
    CHECK(conflicts == 7);
}
}
