#include <catch2/catch_test_macros.hpp>
#include "core/merge.hpp"

using namespace tagsync;

namespace {

Tag tag_at(const std::string& id, int64_t updated, bool deleted = false) {
    auto t = create_tag(id, id, Timestamp(1000));
    t.updated_at = Timestamp(updated);
    t.deleted = deleted;
    return t;
}

Page page_at(const std::string& id, int64_t updated, bool deleted = false) {
    auto p = create_page(id, "https://" + id + ".test", id, id + ".test", Timestamp(1000));
    p.updated_at = Timestamp(updated);
    p.deleted = deleted;
    return p;
}

} // namespace

TEST_CASE("merge keeps local-only entities", "[merge]") {
    TagsCollection local{{"a", tag_at("a", 2000)}};
    MergeStats stats;

    auto merged = merge_collection(local, TagsCollection{}, TombstoneLedger{}, &stats);

    REQUIRE(merged == local);
    REQUIRE(stats.kept_local == 1);
}

TEST_CASE("merge takes remote-only entities", "[merge]") {
    TagsCollection remote{{"b", tag_at("b", 2000)}};
    MergeStats stats;

    auto merged = merge_collection(TagsCollection{}, remote, TombstoneLedger{}, &stats);

    REQUIRE(merged == remote);
    REQUIRE(stats.taken_remote == 1);
}

TEST_CASE("merge resolves conflicts by updated_at", "[merge]") {
    SECTION("newer remote wins") {
        TagsCollection local{{"a", tag_at("a", 1000)}};
        TagsCollection remote{{"a", tag_at("a", 2000)}};
        remote["a"].name = "remote";

        auto merged = merge_collection(local, remote, TombstoneLedger{});
        REQUIRE(merged.at("a").name == "remote");
    }

    SECTION("newer local wins") {
        TagsCollection local{{"a", tag_at("a", 3000)}};
        local["a"].name = "local";
        TagsCollection remote{{"a", tag_at("a", 2000)}};

        auto merged = merge_collection(local, remote, TombstoneLedger{});
        REQUIRE(merged.at("a").name == "local");
    }

    SECTION("a tie keeps local") {
        TagsCollection local{{"a", tag_at("a", 2000)}};
        local["a"].name = "local";
        TagsCollection remote{{"a", tag_at("a", 2000)}};
        remote["a"].name = "remote";

        auto merged = merge_collection(local, remote, TombstoneLedger{});
        REQUIRE(merged.at("a").name == "local");
    }
}

TEST_CASE("a tombstone beats a newer remote copy", "[merge]") {
    // Deleted locally, never synced, and the remote still has a live row.
    PageCollection remote{{"p", page_at("p", 9000)}};
    TombstoneLedger tombstones;
    tombstones.record_deletion(EntityKind::Page, "p");
    MergeStats stats;

    auto merged = merge_collection(PageCollection{}, remote, tombstones, &stats);

    REQUIRE(merged.empty());
    REQUIRE(stats.excluded_tombstoned == 1);
}

TEST_CASE("a remote soft delete removes the local copy", "[merge]") {
    PageCollection local{{"p", page_at("p", 5000)}};
    PageCollection remote{{"p", page_at("p", 1000, true)}};
    MergeStats stats;

    auto merged = merge_collection(local, remote, TombstoneLedger{}, &stats);

    REQUIRE(merged.empty());
    REQUIRE(stats.excluded_remote_deleted == 1);
}

TEST_CASE("a remote-only soft-deleted row is not imported", "[merge]") {
    TagsCollection remote{{"gone", tag_at("gone", 1000, true)}};

    REQUIRE(merge_collection(TagsCollection{}, remote, TombstoneLedger{}).empty());
}

TEST_CASE("tombstones are scoped by kind", "[merge]") {
    Snapshot local{.tags = {{"x", tag_at("x", 1000)}}, .pages = {{"x", page_at("x", 1000)}}};
    TombstoneLedger tombstones;
    tombstones.record_deletion(EntityKind::Page, "x");

    auto merged = merge_snapshot(local, Snapshot{}, tombstones);

    REQUIRE(merged.tags.contains("x"));
    REQUIRE_FALSE(merged.pages.contains("x"));
}

TEST_CASE("merge_snapshot handles a mixed union of ids", "[merge]") {
    Snapshot local{
        .tags = {{"a", tag_at("a", 1000)}, {"c", tag_at("c", 5000)}},
        .pages = {}
    };
    Snapshot remote{
        .tags = {{"b", tag_at("b", 1000)}, {"c", tag_at("c", 4000)}, {"d", tag_at("d", 1000, true)}},
        .pages = {{"p", page_at("p", 1000)}}
    };
    MergeStats stats;

    auto merged = merge_snapshot(local, remote, TombstoneLedger{}, &stats);

    REQUIRE(merged.tags.size() == 3);
    REQUIRE(merged.tags.at("c").updated_at == Timestamp(5000));
    REQUIRE(merged.pages.size() == 1);
    REQUIRE(stats.kept_local == 2);
    REQUIRE(stats.taken_remote == 2);
    REQUIRE(stats.excluded_remote_deleted == 1);
}
