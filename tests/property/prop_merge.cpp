#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/merge.hpp"

using namespace tagsync;

namespace {

// A narrow id space so local, remote and tombstones actually overlap.
rc::Gen<std::string> small_id() {
    return rc::gen::element<std::string>("a", "b", "c", "d", "e", "f");
}

rc::Gen<Tag> tag_gen(bool allow_deleted) {
    return rc::gen::apply(
        [allow_deleted](std::string id, std::string name, int64_t updated, bool deleted) {
            auto tag = create_tag(id, name, Timestamp(0));
            tag.updated_at = Timestamp(updated);
            tag.deleted = allow_deleted && deleted;
            return tag;
        },
        small_id(),
        rc::gen::element<std::string>("Work", "Home", "Read later"),
        rc::gen::inRange<int64_t>(0, 8),
        rc::gen::arbitrary<bool>());
}

TagsCollection collection_of(const std::vector<Tag>& tags) {
    TagsCollection out;
    for (const auto& tag : tags) {
        out.insert_or_assign(tag.id, tag);
    }
    return out;
}

struct MergeCase {
    TagsCollection local;
    TagsCollection remote;
    TombstoneLedger tombstones;
};

rc::Gen<MergeCase> merge_case() {
    return rc::gen::apply(
        [](std::vector<Tag> local, std::vector<Tag> remote, std::vector<std::string> deleted) {
            MergeCase c{collection_of(local), collection_of(remote), {}};
            for (auto& id : deleted) {
                c.tombstones.record_deletion(EntityKind::Tag, std::move(id));
            }
            return c;
        },
        rc::gen::container<std::vector<Tag>>(tag_gen(false)),
        rc::gen::container<std::vector<Tag>>(tag_gen(true)),
        rc::gen::container<std::vector<std::string>>(small_id()));
}

} // namespace

TEST_CASE("Property: merging the same remote twice changes nothing", "[property][merge]") {
    REQUIRE(rc::check("merge is idempotent", [] {
        const auto c = *merge_case();
        const auto once = merge_collection(c.local, c.remote, c.tombstones);
        const auto twice = merge_collection(once, c.remote, c.tombstones);
        RC_ASSERT(twice == once);
    }));
}

TEST_CASE("Property: tombstoned ids never appear in a merge result", "[property][merge]") {
    REQUIRE(rc::check("no resurrection", [] {
        const auto c = *merge_case();
        const auto merged = merge_collection(c.local, c.remote, c.tombstones);
        for (const auto& key : c.tombstones.keys()) {
            RC_ASSERT(merged.count(key.id) == 0U);
        }
    }));
}

TEST_CASE("Property: remote soft deletes are never kept", "[property][merge]") {
    REQUIRE(rc::check("remote deleted excluded", [] {
        const auto c = *merge_case();
        const auto merged = merge_collection(c.local, c.remote, c.tombstones);
        for (const auto& [id, tag] : c.remote) {
            if (tag.deleted) {
                RC_ASSERT(merged.count(id) == 0U);
            }
        }
        for (const auto& [id, tag] : merged) {
            RC_ASSERT(!tag.deleted);
        }
    }));
}

TEST_CASE("Property: every surviving id resolves by last write", "[property][merge]") {
    REQUIRE(rc::check("local-only kept, remote-only taken, newer wins", [] {
        const auto c = *merge_case();
        MergeStats stats;
        const auto merged = merge_collection(c.local, c.remote, c.tombstones, &stats);

        for (const auto& [id, local] : c.local) {
            if (c.tombstones.is_pending(EntityKind::Tag, id)) continue;
            auto remote = c.remote.find(id);
            if (remote == c.remote.end()) {
                RC_ASSERT(merged.at(id) == local);
            } else if (!remote->second.deleted) {
                const auto& expected =
                    local.updated_at >= remote->second.updated_at ? local : remote->second;
                RC_ASSERT(merged.at(id) == expected);
            }
        }
        for (const auto& [id, remote] : c.remote) {
            if (remote.deleted || c.tombstones.is_pending(EntityKind::Tag, id)) continue;
            if (c.local.count(id) == 0U) {
                RC_ASSERT(merged.at(id) == remote);
            }
        }
        RC_ASSERT(stats.kept_local + stats.taken_remote == merged.size());
    }));
}

TEST_CASE("Property: the merge result only holds known ids", "[property][merge]") {
    REQUIRE(rc::check("no invented entities", [] {
        const auto c = *merge_case();
        const auto merged = merge_collection(c.local, c.remote, c.tombstones);
        for (const auto& [id, tag] : merged) {
            RC_ASSERT(id == tag.id);
            RC_ASSERT(c.local.count(id) + c.remote.count(id) > 0U);
        }
    }));
}
