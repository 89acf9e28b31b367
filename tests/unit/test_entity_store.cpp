#include <catch2/catch_test_macros.hpp>
#include "core/json_codec.hpp"
#include "store/entity_store.hpp"
#include "support/manual_clock.hpp"
#include "support/memory_backing_store.hpp"

using namespace tagsync;
using namespace tagsync::store;
using tagsync::testing::ManualClock;
using tagsync::testing::MemoryBackingStore;

namespace {

struct Fixture {
    MemoryBackingStore backing;
    ManualClock clock;
    EntityStore store{backing, clock};

    Fixture() { REQUIRE(store.ensure_loaded().is_ok()); }

    Page page(const std::string& url = "https://example.com/a") {
        return store.create_or_update_page(url, "Example").unwrap();
    }
};

} // namespace

TEST_CASE("EntityStore rehydration", "[store]") {
    MemoryBackingStore backing;
    ManualClock clock;

    SECTION("an empty backing store loads as empty") {
        EntityStore store(backing, clock);
        REQUIRE(store.ensure_loaded().is_ok());
        REQUIRE(store.tags().empty());
        REQUIRE(store.pages().empty());
        REQUIRE_FALSE(store.last_sync_at().has_value());
    }

    SECTION("mutations before loading are refused") {
        EntityStore store(backing, clock);
        auto result = store.create_tag("work");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Internal);
    }

    SECTION("corrupt stored JSON is a persistence error") {
        backing.values[storage::keys::kTags] = "{broken";
        EntityStore store(backing, clock);
        auto loaded = store.ensure_loaded();
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.unwrap_err().kind == ErrorKind::Persistence);
        REQUIRE_FALSE(store.is_loaded());
    }

    SECTION("a read failure is reported") {
        backing.fail_reads = true;
        EntityStore store(backing, clock);
        REQUIRE(store.ensure_loaded().is_err());
    }

    SECTION("loading twice reads once") {
        EntityStore store(backing, clock);
        REQUIRE(store.ensure_loaded().is_ok());
        REQUIRE(store.ensure_loaded().is_ok());
        REQUIRE(backing.reads == 1);
        store.invalidate();
        REQUIRE(store.ensure_loaded().is_ok());
        REQUIRE(backing.reads == 2);
    }
}

TEST_CASE("EntityStore commit writes dirty parts in one call", "[store]") {
    Fixture f;

    REQUIRE(f.store.commit().is_ok());
    REQUIRE(f.backing.writes == 0);

    auto tag = f.store.create_tag("Work").unwrap();
    REQUIRE(f.store.is_dirty());
    REQUIRE(f.store.commit().is_ok());
    REQUIRE(f.backing.writes == 1);
    REQUIRE(f.backing.values.contains(storage::keys::kTags));
    REQUIRE_FALSE(f.backing.values.contains(storage::keys::kPages));

    SECTION("state survives a fresh store") {
        EntityStore reloaded(f.backing, f.clock);
        REQUIRE(reloaded.ensure_loaded().is_ok());
        REQUIRE(reloaded.tags() == f.store.tags());
    }

    SECTION("a failed write leaves the store dirty") {
        f.backing.fail_writes = true;
        REQUIRE(f.store.rename_tag(tag.id, "Job").is_ok());
        auto committed = f.store.commit();
        REQUIRE(committed.is_err());
        REQUIRE(committed.unwrap_err().kind == ErrorKind::Persistence);
        REQUIRE(f.store.is_dirty());
    }
}

TEST_CASE("EntityStore tags", "[store]") {
    Fixture f;

    SECTION("create derives id and color") {
        auto tag = f.store.create_tag("  Read Later ").unwrap();
        REQUIRE(tag.id == "read_later");
        REQUIRE(tag.name == "Read Later");
        REQUIRE(tag.color == default_tag_color("read_later"));
        REQUIRE(tag.created_at == f.clock.now());
    }

    SECTION("empty description and color count as absent") {
        auto tag = f.store.create_tag("Work", std::string(), std::string()).unwrap();
        REQUIRE_FALSE(tag.description.has_value());
        REQUIRE(tag.color == default_tag_color("work"));
    }

    SECTION("names are unique case-insensitively") {
        REQUIRE(f.store.create_tag("Work").is_ok());
        auto dup = f.store.create_tag("WORK");
        REQUIRE(dup.is_err());
        REQUIRE(dup.unwrap_err().kind == ErrorKind::BusinessRule);
    }

    SECTION("invalid names fail before touching state") {
        REQUIRE(f.store.create_tag("").unwrap_err().kind == ErrorKind::Validation);
        REQUIRE(f.store.create_tag(std::string(51, 'x')).unwrap_err().kind == ErrorKind::Validation);
        REQUIRE_FALSE(f.store.is_dirty());
    }

    SECTION("rename bumps updated_at") {
        auto tag = f.store.create_tag("Work").unwrap();
        f.clock.advance(std::chrono::milliseconds(10));
        auto renamed = f.store.rename_tag(tag.id, "Job").unwrap();
        REQUIRE(renamed.id == tag.id);
        REQUIRE(renamed.name == "Job");
        REQUIRE(renamed.updated_at > tag.updated_at);
        REQUIRE(f.store.find_tag_by_name("job")->id == tag.id);
    }

    SECTION("all_tags sorts by name ignoring case") {
        REQUIRE(f.store.create_tag("beta").is_ok());
        REQUIRE(f.store.create_tag("Alpha").is_ok());
        auto tags = f.store.all_tags();
        REQUIRE(tags.size() == 2);
        REQUIRE(tags[0].name == "Alpha");
    }

    SECTION("bindings are symmetric") {
        auto a = f.store.create_tag("a").unwrap();
        auto b = f.store.create_tag("b").unwrap();
        REQUIRE(f.store.bind_tags(a.id, b.id).is_ok());
        REQUIRE(f.store.tag(a.id)->bindings.contains(b.id));
        REQUIRE(f.store.tag(b.id)->bindings.contains(a.id));

        REQUIRE(f.store.bind_tags(a.id, a.id).unwrap_err().kind == ErrorKind::Validation);

        REQUIRE(f.store.unbind_tags(b.id, a.id).is_ok());
        REQUIRE(f.store.tag(a.id)->bindings.empty());
        REQUIRE(f.store.tag(b.id)->bindings.empty());
    }
}

TEST_CASE("EntityStore delete_tag cascades and records a tombstone", "[store]") {
    Fixture f;
    auto work = f.store.create_tag("work").unwrap();
    auto home = f.store.create_tag("home").unwrap();
    REQUIRE(f.store.bind_tags(work.id, home.id).is_ok());
    auto page = f.page();
    REQUIRE(f.store.add_tag_to_page(page.id, work.id).is_ok());
    f.clock.advance(std::chrono::milliseconds(5));

    REQUIRE(f.store.delete_tag(work.id).is_ok());

    REQUIRE(f.store.tag(work.id) == nullptr);
    REQUIRE(f.store.page(page.id)->tags.empty());
    REQUIRE(f.store.page(page.id)->updated_at == f.clock.now());
    REQUIRE(f.store.tag(home.id)->bindings.empty());
    REQUIRE(f.store.tombstones().is_pending(EntityKind::Tag, work.id));

    SECTION("deleting again is a business error") {
        REQUIRE(f.store.delete_tag(work.id).unwrap_err().kind == ErrorKind::BusinessRule);
    }

    SECTION("re-creating the tag clears its tombstone") {
        REQUIRE(f.store.create_tag("work").is_ok());
        REQUIRE_FALSE(f.store.tombstones().is_pending(EntityKind::Tag, work.id));
    }
}

TEST_CASE("EntityStore pages", "[store]") {
    Fixture f;

    SECTION("register derives id and domain") {
        auto page = f.page("https://news.example.org/x");
        REQUIRE(page.id == generate_page_id("https://news.example.org/x"));
        REQUIRE(page.domain == "news.example.org");
        REQUIRE(f.store.page_by_url(" https://news.example.org/x ")->id == page.id);
    }

    SECTION("a blank title falls back to the URL") {
        auto page = f.store.create_or_update_page("https://a.test", "  ").unwrap();
        REQUIRE(page.title == "https://a.test");
    }

    SECTION("re-registering keeps tags and only bumps on change") {
        auto page = f.page();
        auto tag = f.store.create_tag("t").unwrap();
        REQUIRE(f.store.add_tag_to_page(page.id, tag.id).is_ok());
        const auto stamped = f.store.page(page.id)->updated_at;

        f.clock.advance(std::chrono::milliseconds(10));
        auto same = f.store.create_or_update_page("https://example.com/a", "Example").unwrap();
        REQUIRE(same.updated_at == stamped);
        REQUIRE(same.tags.contains(tag.id));

        auto retitled = f.store.create_or_update_page("https://example.com/a", "New").unwrap();
        REQUIRE(retitled.title == "New");
        REQUIRE(retitled.updated_at > stamped);
    }

    SECTION("a manually edited title is not overwritten by registration") {
        auto page = f.page();
        REQUIRE(f.store.update_page_title(page.id, "Mine").is_ok());
        auto again = f.store.create_or_update_page("https://example.com/a", "Site Title").unwrap();
        REQUIRE(again.title == "Mine");
        REQUIRE(again.title_manually_edited);
    }

    SECTION("adding a tag twice is a no-op") {
        auto page = f.page();
        auto tag = f.store.create_tag("t").unwrap();
        auto first = f.store.add_tag_to_page(page.id, tag.id).unwrap();
        f.clock.advance(std::chrono::milliseconds(10));
        auto second = f.store.add_tag_to_page(page.id, tag.id).unwrap();
        REQUIRE(second.updated_at == first.updated_at);
    }

    SECTION("adding an unknown tag is a business error") {
        auto page = f.page();
        REQUIRE(f.store.add_tag_to_page(page.id, "nope").unwrap_err().kind == ErrorKind::BusinessRule);
    }

    SECTION("create_tag_and_add_to_page reuses a tag by name") {
        auto page = f.page();
        auto existing = f.store.create_tag("Work").unwrap();
        auto tagged = f.store.create_tag_and_add_to_page("work", page.id).unwrap();
        REQUIRE(tagged.tags == std::set<std::string>{existing.id});
        REQUIRE(f.store.tags().size() == 1);

        auto created = f.store.create_tag_and_add_to_page("Fresh", page.id).unwrap();
        REQUIRE(created.tags.size() == 2);
        REQUIRE(f.store.tags().size() == 2);
    }

    SECTION("delete records a tombstone and re-registering revives") {
        auto page = f.page();
        REQUIRE(f.store.delete_page(page.id).is_ok());
        REQUIRE(f.store.page(page.id) == nullptr);
        REQUIRE(f.store.tombstones().is_pending(EntityKind::Page, page.id));

        f.page();
        REQUIRE_FALSE(f.store.tombstones().is_pending(EntityKind::Page, page.id));
    }
}

TEST_CASE("EntityStore queries", "[store]") {
    Fixture f;
    auto a = f.page("https://a.test");
    f.clock.advance(std::chrono::milliseconds(10));
    auto b = f.page("https://b.test");
    f.page("https://untagged.test");
    auto work = f.store.create_tag("work").unwrap();
    auto home = f.store.create_tag("home").unwrap();
    REQUIRE(f.store.add_tag_to_page(a.id, work.id).is_ok());
    f.clock.advance(std::chrono::milliseconds(10));
    REQUIRE(f.store.add_tag_to_page(b.id, work.id).is_ok());
    REQUIRE(f.store.add_tag_to_page(b.id, home.id).is_ok());

    SECTION("tagged pages, newest first") {
        auto pages = f.store.tagged_pages();
        REQUIRE(pages.size() == 2);
        REQUIRE(pages[0].id == b.id);

        REQUIRE(f.store.tagged_pages(home.id).size() == 1);
    }

    SECTION("usage counts include unused tags") {
        REQUIRE(f.store.create_tag("idle").is_ok());
        auto counts = f.store.tag_usage_counts();
        REQUIRE(counts.at(work.id) == 2);
        REQUIRE(counts.at(home.id) == 1);
        REQUIRE(counts.at("idle") == 0);
    }

    SECTION("stats") {
        REQUIRE(f.store.delete_page(generate_page_id("https://untagged.test")).is_ok());
        auto stats = f.store.stats();
        REQUIRE(stats.tags_count == 2);
        REQUIRE(stats.pages_count == 2);
        REQUIRE(stats.tagged_pages_count == 2);
        REQUIRE(stats.pending_tombstones == 1);
    }
}

TEST_CASE("EntityStore import and export", "[store]") {
    Fixture f;
    auto keep = f.store.create_tag("keep").unwrap();
    auto page = f.page();
    const auto exported = to_bytes(f.store.export_json());

    SECTION("merge mode keeps existing entities on collision") {
        REQUIRE(f.store.rename_tag(keep.id, "kept").is_ok());
        auto summary = f.store.import_json(exported, true).unwrap();
        REQUIRE(summary.tags_count == 1);
        REQUIRE(f.store.tag(keep.id)->name == "kept");
    }

    SECTION("replace mode tombstones what the document dropped") {
        auto extra = f.store.create_tag("extra").unwrap();
        REQUIRE(f.store.import_json(exported, false).is_ok());
        REQUIRE(f.store.tag(extra.id) == nullptr);
        REQUIRE(f.store.tombstones().is_pending(EntityKind::Tag, extra.id));
        REQUIRE(f.store.page(page.id) != nullptr);
    }

    SECTION("a bad document changes nothing") {
        auto result = f.store.import_json("[1,2,3]", false);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Validation);
        REQUIRE(f.store.tags().size() == 1);
    }
}

TEST_CASE("EntityStore sync support", "[store]") {
    Fixture f;
    REQUIRE(f.store.commit().is_ok());

    SECTION("replace_collections only dirties what changed") {
        auto snapshot = f.store.snapshot();
        f.store.replace_collections(snapshot);
        REQUIRE_FALSE(f.store.is_dirty());

        snapshot.tags.emplace("r", create_tag("r", "R", Timestamp(1)));
        f.store.replace_collections(snapshot);
        REQUIRE(f.store.is_dirty());
        REQUIRE(f.store.tag("r") != nullptr);
    }

    SECTION("last_sync_at persists") {
        f.store.set_last_sync_at(Timestamp(1234));
        REQUIRE(f.store.commit().is_ok());
        EntityStore reloaded(f.backing, f.clock);
        REQUIRE(reloaded.ensure_loaded().is_ok());
        REQUIRE(reloaded.last_sync_at() == Timestamp(1234));
    }

    SECTION("creations stay pending until acknowledged") {
        const TombstoneKey key{EntityKind::Tag, "work"};
        REQUIRE(f.store.create_tag("Work").is_ok());
        REQUIRE(f.store.pending_creations().contains(key));
        REQUIRE(f.store.commit().is_ok());

        EntityStore reloaded(f.backing, f.clock);
        REQUIRE(reloaded.ensure_loaded().is_ok());
        REQUIRE(reloaded.pending_creations().contains(key));

        REQUIRE(f.store.clear_pending_creation(key));
        REQUIRE_FALSE(f.store.clear_pending_creation(key));
        REQUIRE(f.store.pending_creations().empty());
        REQUIRE(f.store.is_dirty());
    }

    SECTION("deleting an unacknowledged creation drops it") {
        auto page = f.page();
        REQUIRE(f.store.pending_creations().size() == 1);
        REQUIRE(f.store.delete_page(page.id).is_ok());
        REQUIRE(f.store.pending_creations().empty());
        REQUIRE(f.store.tombstones().is_pending(EntityKind::Page, page.id));
    }

    SECTION("clear_tombstone") {
        REQUIRE(f.store.delete_page(f.page().id).is_ok());
        const auto key = *f.store.tombstones().keys().begin();
        REQUIRE(f.store.clear_tombstone(key));
        REQUIRE_FALSE(f.store.clear_tombstone(key));
        REQUIRE(f.store.tombstones().empty());
    }
}
