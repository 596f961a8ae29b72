#include "VfsTestHelper.hpp"
#include "vfs/ChildrenFetcher.hpp"
#include "vfs/FileNode.hpp"

using namespace PV;

namespace {
auto addFile(VfsFixture& fx, std::string const& name, std::string const& parentID) -> std::string {
    FileNode file;
    file.name      = name;
    file.parentID  = parentID;
    file.size      = 3;
    file.mime      = "text/plain";
    file.createdAt = now();
    file.updatedAt = file.createdAt;
    auto ref       = fx.documents.create(fx.ctx.docType(), fileToJson(file));
    REQUIRE(ref.has_value());
    return ref->id;
}
} // namespace

TEST_SUITE("vfs.children") {
TEST_CASE("fetchChildren splits files from directories") {
    VfsFixture fx;
    auto       docs   = fx.mkdir("docs");
    auto       photos = fx.mkdir("photos", docs.id);
    auto       fileId = addFile(fx, "notes.txt", docs.id);
    fx.mkdir("elsewhere");

    auto children = fetchChildren(fx.ctx, docs);
    REQUIRE(children.has_value());
    REQUIRE(children->dirs.size() == 1);
    CHECK(children->dirs[0].id == photos.id);
    REQUIRE(children->files.size() == 1);
    CHECK(children->files[0].id == fileId);
    CHECK(children->files[0].mime == "text/plain");

    auto empty = fetchChildren(fx.ctx, photos);
    REQUIRE(empty.has_value());
    CHECK(empty->dirs.empty());
    CHECK(empty->files.empty());
}

TEST_CASE("fetchChildren returns at most one page") {
    VfsFixture fx;
    auto       docs = fx.mkdir("docs");
    for (int i = 0; i < 15; ++i)
        fx.mkdir("d" + std::to_string(i), docs.id);

    auto children = fetchChildren(fx.ctx, docs);
    REQUIRE(children.has_value());
    CHECK(children->dirs.size() + children->files.size() == 10);
    CHECK(children->dirs.front().name == "d0");
    CHECK(children->dirs.back().name == "d9");

    VfsOptions wide;
    wide.childrenPageSize = 100;
    VfsContext wideCtx{fx.faulty, fx.physical, fx.pool, wide};
    auto       all = fetchChildren(wideCtx, docs);
    REQUIRE(all.has_value());
    CHECK(all->dirs.size() == 15);
}

TEST_CASE("fetchChildren ignores documents of unknown type") {
    VfsFixture fx;
    auto       docs = fx.mkdir("docs");
    REQUIRE(fx.documents.create(fx.ctx.docType(), nlohmann::json{{"type", "symlink"}, {"folder_id", docs.id}}).has_value());

    auto children = fetchChildren(fx.ctx, docs);
    REQUIRE(children.has_value());
    CHECK(children->dirs.empty());
    CHECK(children->files.empty());
}

TEST_CASE("ChildrenCache") {
    ChildrenCache     cache;
    DirectoryChildren listing;
    listing.dirs.push_back(rootDirectory());

    CHECK_FALSE(cache.contains("a"));
    cache.put("a", listing);
    cache.put("b", {});
    CHECK(cache.size() == 2);
    REQUIRE(cache.get("a").has_value());
    CHECK(cache.get("a")->dirs.size() == 1);

    cache.invalidate("a");
    CHECK_FALSE(cache.get("a").has_value());
    CHECK(cache.contains("b"));

    cache.clear();
    CHECK(cache.size() == 0);
}
}
