#include "VfsTestHelper.hpp"
#include "vfs/MoveCoordinator.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace PV;
using namespace std::chrono_literals;

namespace {

// Serves a frozen result for find() and tracks how many updates run at once.
class ObservingStore final : public DocumentStore {
public:
    explicit ObservingStore(DocumentStore& inner)
        : inner(inner) {}

    auto create(std::string_view doctype, nlohmann::json doc) -> Expected<DocumentRef> override {
        return inner.create(doctype, std::move(doc));
    }
    auto get(std::string_view doctype, std::string_view id) -> Expected<nlohmann::json> override {
        return inner.get(doctype, id);
    }
    auto update(std::string_view doctype, nlohmann::json doc) -> Expected<std::string> override {
        auto const now  = ++inFlight;
        auto       seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(delay);
        auto rev = inner.update(doctype, std::move(doc));
        --inFlight;
        return rev;
    }
    auto find(std::string_view doctype, Selector const& selector, FindOptions const& options = {})
            -> Expected<std::vector<nlohmann::json>> override {
        if (frozen)
            return *frozen;
        return inner.find(doctype, selector, options);
    }

    std::optional<std::vector<nlohmann::json>> frozen;
    std::chrono::milliseconds                  delay{0};
    std::atomic<int>                           inFlight{0};
    std::atomic<int>                           peak{0};

private:
    DocumentStore& inner;
};

} // namespace

TEST_SUITE("vfs.move_coordinator") {
TEST_CASE("safeRename checks paths before renaming") {
    VfsFixture      fx;
    MoveCoordinator mover{fx.ctx};
    for (auto p : {"/a", "/a/b", "/c"})
        REQUIRE_FALSE(fx.physical.mkdir(p).has_value());

    SUBCASE("Relative paths") {
        auto error = mover.safeRename("a", "/d");
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::InvalidPath);
    }
    SUBCASE("Destination inside the source") {
        auto error = mover.safeRename("/a", "/a/b");
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::ForbiddenMove);

        auto deeper = mover.safeRename("/a/", "/a/b/../b/z");
        REQUIRE(deeper.has_value());
        CHECK(deeper->code == Error::Code::ForbiddenMove);
    }
    SUBCASE("Onto itself or from the root") {
        auto same = mover.safeRename("/a", "/a");
        REQUIRE(same.has_value());
        CHECK(same->code == Error::Code::ForbiddenMove);

        auto root = mover.safeRename("/", "/z");
        REQUIRE(root.has_value());
        CHECK(root->code == Error::Code::ForbiddenMove);
    }
    SUBCASE("Occupied destination") {
        auto error = mover.safeRename("/a", "/c");
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::AlreadyExists);
    }
    SUBCASE("Missing source") {
        auto error = mover.safeRename("/nope", "/d");
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::NotFound);
    }
    CHECK(fx.physical.list() == std::vector<std::string>{"/", "/a", "/a/b", "/c"});

    SUBCASE("Sibling with a shared prefix is a legal target") {
        CHECK_FALSE(mover.safeRename("/a", "/ab").has_value());
        CHECK(fx.physical.list() == std::vector<std::string>{"/", "/ab", "/ab/b", "/c"});
    }
}

TEST_CASE("updateDescendantPaths rewrites only strict descendants") {
    VfsFixture fx;
    auto       docs     = fx.mkdir("docs");
    auto       photos   = fx.mkdir("photos", docs.id);
    auto       year     = fx.mkdir("2024", photos.id);
    auto       neighbor = fx.mkdir("docs-old");
    auto       inside   = fx.mkdir("x", neighbor.id);

    REQUIRE_FALSE(fx.physical.rename("/docs", "/archive").has_value());
    auto report = MoveCoordinator(fx.ctx).updateDescendantPaths("/docs", "/archive");
    REQUIRE(report.has_value());
    CHECK(report->descendantsMatched == 2);
    CHECK(report->descendantsUpdated == 2);

    CHECK(fx.reload(photos).path == "/archive/photos");
    CHECK(fx.reload(year).path == "/archive/photos/2024");
    CHECK(fx.reload(docs).path == "/docs");
    CHECK(fx.reload(neighbor).path == "/docs-old");
    CHECK(fx.reload(inside).path == "/docs-old/x");
}

TEST_CASE("A move without descendants reports zero") {
    VfsFixture fx;
    fx.mkdir("leaf");
    auto report = MoveCoordinator(fx.ctx).move("/leaf", "/renamed");
    REQUIRE(report.has_value());
    CHECK(report->descendantsMatched == 0);
    CHECK(report->descendantsUpdated == 0);
    CHECK(fx.exists("/renamed"));
}

TEST_CASE("Large subtrees are rewritten with bounded concurrency") {
    MemoryDocumentStore documents;
    ObservingStore      observing{documents};
    MemoryPhysicalStore physical;
    TaskPool            pool(8);
    VfsOptions          options;
    options.fanoutConcurrency = 3;
    VfsContext ctx{observing, physical, pool, options};

    auto root = makeDirectoryNode("big");
    REQUIRE(root.has_value());
    auto big = createDirectory(ctx, *root);
    REQUIRE(big.has_value());
    std::vector<DirectoryNode> kids;
    for (int i = 0; i < 40; ++i) {
        auto node = makeDirectoryNode("k" + std::to_string(i), big->id);
        REQUIRE(node.has_value());
        auto created = createDirectory(ctx, *node);
        REQUIRE(created.has_value());
        kids.push_back(*created);
    }

    observing.delay = 1ms;
    auto report     = MoveCoordinator(ctx).move("/big", "/huge");
    REQUIRE_MESSAGE(report.has_value(), describeError(report.error()));
    CHECK(report->descendantsMatched == 40);
    CHECK(report->descendantsUpdated == 40);
    CHECK(observing.peak.load() >= 1);
    CHECK(observing.peak.load() <= 3);

    for (auto const& kid : kids) {
        auto stored = getDirectory(ctx, kid.id);
        REQUIRE(stored.has_value());
        CHECK(stored->path == "/huge/" + kid.name);
    }
}

TEST_CASE("A descendant that left the subtree since the query is a conflict") {
    MemoryDocumentStore documents;
    ObservingStore      observing{documents};
    MemoryPhysicalStore physical;
    TaskPool            pool(2);
    VfsContext          ctx{observing, physical, pool};

    auto mk = [&](std::string const& name, std::string const& parent) {
        auto node = makeDirectoryNode(name, parent);
        REQUIRE(node.has_value());
        auto created = createDirectory(ctx, *node);
        REQUIRE(created.has_value());
        return *created;
    };
    auto docs   = mk("docs", "");
    auto stays  = mk("stays", docs.id);
    auto leaves = mk("leaves", docs.id);
    auto other  = mk("other", "");

    auto snapshot = documents.find(ctx.docType(), Selector::StartsWith(Field::Path, "/docs/"));
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->size() == 2);

    DirectoryPatch patch;
    patch.parentID = other.id;
    auto moved     = modifyDirectoryMetadata(ctx, leaves, patch);
    REQUIRE(moved.has_value());
    CHECK(moved->path == "/other/leaves");

    // The next fan-out still sees "leaves" below /docs.
    observing.frozen = *snapshot;

    REQUIRE_FALSE(physical.rename("/docs", "/archive").has_value());
    auto report = MoveCoordinator(ctx).updateDescendantPaths("/docs", "/archive");
    REQUIRE_FALSE(report.has_value());
    CHECK(report.error().code == Error::Code::PartialFailure);
    REQUIRE(report.error().causes.size() == 1);
    CHECK(report.error().causes[0].code == Error::Code::Conflict);

    observing.frozen.reset();
    CHECK(getDirectory(ctx, stays.id)->path == "/archive/stays");
    CHECK(getDirectory(ctx, leaves.id)->path == "/other/leaves");
}

TEST_CASE("Cancellation") {
    VfsFixture fx;
    auto       docs = fx.mkdir("docs");
    fx.mkdir("a", docs.id);
    fx.mkdir("b", docs.id);
    auto token = CancellationToken::Create();
    token.cancel();

    SUBCASE("Before the rename nothing happens") {
        auto report = MoveCoordinator(fx.ctx).move("/docs", "/archive", token);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code == Error::Code::Cancelled);
        CHECK(fx.exists("/docs"));
        CHECK_FALSE(fx.exists("/archive"));
    }
    SUBCASE("During the fan-out every remaining unit is skipped") {
        REQUIRE_FALSE(fx.physical.rename("/docs", "/archive").has_value());
        auto const updatesBefore = fx.faulty.updates.load();
        auto       report        = MoveCoordinator(fx.ctx).updateDescendantPaths("/docs", "/archive", token);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code == Error::Code::PartialFailure);
        REQUIRE(report.error().causes.size() == 2);
        for (auto const& cause : report.error().causes)
            CHECK(cause.code == Error::Code::Cancelled);
        CHECK(fx.faulty.updates.load() == updatesBefore);
    }
}
}
