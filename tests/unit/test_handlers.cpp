#include <catch2/catch_test_macros.hpp>
#include "app/command_pipeline.hpp"
#include "app/handlers.hpp"
#include "core/entities.hpp"
#include "support/manual_clock.hpp"
#include "support/memory_backing_store.hpp"

#include <QJsonArray>
#include <QJsonDocument>

using namespace tagsync;
using namespace tagsync::app;
using tagsync::testing::ManualClock;
using tagsync::testing::MemoryBackingStore;

namespace {

struct Fixture {
    MemoryBackingStore backing;
    ManualClock clock;
    store::EntityStore store{backing, clock};
    CommandPipeline pipeline{store};

    Fixture() { register_store_handlers(pipeline); }

    QJsonValue ok(const QString& op, QJsonObject payload = {}) {
        auto response = pipeline.dispatch(Request{op, std::move(payload)});
        INFO(op.toStdString() << ": " << response.error.toStdString());
        REQUIRE(response.success);
        return response.data;
    }

    Response run(const QString& op, QJsonObject payload = {}) {
        return pipeline.dispatch(Request{op, std::move(payload)});
    }

    QString page_id(const QString& url = "https://example.com/") {
        return ok("registerPage", {{"url", url}, {"title", "Example"}}).toObject().value("id").toString();
    }
};

QStringList tag_ids(const QJsonValue& page) {
    QStringList out;
    for (const auto& t : page.toObject().value("tags").toArray()) out << t.toString();
    return out;
}

} // namespace

TEST_CASE("every caller-facing operation is registered", "[handlers]") {
    Fixture f;
    for (const auto* op : {"getAllTags", "getAllTaggedPages", "getPage", "getTagUsageCounts",
                           "getDataStats", "createTag", "updateTag", "deleteTag", "bindTags",
                           "unbindTags", "registerPage", "updatePageTitle", "addTagToPage",
                           "removeTagFromPage", "createTagAndAddToPage", "updatePageTags",
                           "deletePage", "exportData", "importData", "getSyncStatus"}) {
        INFO(op);
        REQUIRE(f.pipeline.has_handler(QLatin1String(op)));
    }
}

TEST_CASE("tag handlers", "[handlers]") {
    Fixture f;
    auto work = f.ok("createTag", {{"name", "Work"}, {"description", "day job"}}).toObject();
    REQUIRE(work.value("description").toString() == "day job");
    f.ok("createTag", {{"name", "Home"}});

    SECTION("rename") {
        auto renamed = f.ok("updateTag", {{"tagId", "work"}, {"name", "Job"}}).toObject();
        REQUIRE(renamed.value("name").toString() == "Job");
        REQUIRE(renamed.value("id").toString() == "work");
    }

    SECTION("bind and unbind") {
        f.ok("bindTags", {{"tagId", "work"}, {"otherTagId", "home"}});
        REQUIRE(f.store.tag("home")->bindings.contains("work"));
        f.ok("unbindTags", {{"tagId", "work"}, {"otherTagId", "home"}});
        REQUIRE(f.store.tag("home")->bindings.empty());
    }

    SECTION("delete") {
        f.ok("deleteTag", {{"tagId", "work"}});
        REQUIRE(f.ok("getAllTags").toArray().size() == 1);
        REQUIRE(f.ok("getDataStats").toObject().value("pendingTombstones").toInteger() == 1);
    }

    SECTION("unknown tag is a business error") {
        REQUIRE(f.run("deleteTag", {{"tagId", "nope"}}).error_kind == ErrorKind::BusinessRule);
    }
}

TEST_CASE("page handlers", "[handlers]") {
    Fixture f;
    const auto id = f.page_id();

    SECTION("getPage by id or url") {
        REQUIRE(f.ok("getPage", {{"pageId", id}}).toObject().value("title").toString() == "Example");
        REQUIRE(f.ok("getPage", {{"url", "https://example.com/"}}).toObject().value("id").toString() == id);
        REQUIRE(f.ok("getPage", {{"pageId", "missing"}}).isNull());
        REQUIRE(f.run("getPage").error_kind == ErrorKind::Validation);
    }

    SECTION("updatePageTitle marks the title as manual") {
        auto page = f.ok("updatePageTitle", {{"pageId", id}, {"title", "Mine"}}).toObject();
        REQUIRE(page.value("title").toString() == "Mine");
        REQUIRE(page.value("titleManuallyEdited").toBool());
    }

    SECTION("add and remove tag") {
        f.ok("createTag", {{"name", "Work"}});
        REQUIRE(tag_ids(f.ok("addTagToPage", {{"pageId", id}, {"tagId", "work"}})) == QStringList{"work"});
        REQUIRE(tag_ids(f.ok("removeTagFromPage", {{"pageId", id}, {"tagId", "work"}})).isEmpty());
    }

    SECTION("createTagAndAddToPage") {
        auto page = f.ok("createTagAndAddToPage", {{"pageId", id}, {"tagName", "Fresh"}});
        REQUIRE(tag_ids(page) == QStringList{"fresh"});
        REQUIRE(f.ok("getTagUsageCounts").toObject().value("fresh").toInteger() == 1);
    }

    SECTION("getAllTaggedPages filters by tag") {
        const auto other = f.page_id("https://other.test/");
        f.ok("createTagAndAddToPage", {{"pageId", id}, {"tagName", "a"}});
        f.ok("createTagAndAddToPage", {{"pageId", other}, {"tagName", "b"}});
        REQUIRE(f.ok("getAllTaggedPages").toArray().size() == 2);
        REQUIRE(f.ok("getAllTaggedPages", {{"tagId", "b"}}).toArray().size() == 1);
    }

    SECTION("deletePage") {
        f.ok("deletePage", {{"pageId", id}});
        REQUIRE(f.ok("getPage", {{"pageId", id}}).isNull());
        REQUIRE(f.store.tombstones().is_pending(EntityKind::Page, id.toStdString()));
    }
}

TEST_CASE("updatePageTags adds by name and removes by id or name", "[handlers]") {
    Fixture f;
    const auto id = f.page_id();
    f.ok("createTag", {{"name", "Keep"}});
    f.ok("createTag", {{"name", "Drop Me"}});
    f.ok("addTagToPage", {{"pageId", id}, {"tagId", "drop_me"}});
    f.ok("addTagToPage", {{"pageId", id}, {"tagId", "keep"}});

    auto page = f.ok("updatePageTags", {
        {"pageId", id},
        {"tagsToAdd", QJsonArray{" New ", "new", "", "Keep"}},
        {"tagsToRemove", QJsonArray{"drop me", "unknown"}},
    });

    auto ids = tag_ids(page);
    ids.sort();
    REQUIRE(ids == QStringList{"keep", "new"});
    REQUIRE(f.store.tags().size() == 3);

    SECTION("an invalid name rejects the whole update") {
        const auto writes = f.backing.writes;
        auto response = f.run("updatePageTags", {
            {"pageId", id},
            {"tagsToAdd", QJsonArray{"ok", QString(60, QLatin1Char('x'))}},
        });
        REQUIRE(response.error_kind == ErrorKind::Validation);
        REQUIRE(f.backing.writes == writes);
        REQUIRE(f.store.find_tag_by_name("ok") == nullptr);
    }

    SECTION("unknown page") {
        REQUIRE(f.run("updatePageTags", {{"pageId", "nope"}}).error_kind == ErrorKind::BusinessRule);
    }
}

TEST_CASE("export and import handlers", "[handlers]") {
    Fixture f;
    const auto id = f.page_id();
    f.ok("createTagAndAddToPage", {{"pageId", id}, {"tagName", "Work"}});
    const auto exported = f.ok("exportData").toObject();
    REQUIRE(exported.value("version").toString() == "1.0");
    REQUIRE(exported.value("tags").toObject().contains("work"));

    SECTION("import an object in replace mode") {
        f.ok("createTag", {{"name", "Scratch"}});
        auto summary = f.ok("importData", {{"data", exported}}).toObject();
        REQUIRE(summary.value("tagsCount").toInteger() == 1);
        REQUIRE(summary.value("pagesCount").toInteger() == 1);
        REQUIRE(f.store.tag("scratch") == nullptr);
    }

    SECTION("import a string in merge mode") {
        f.ok("createTag", {{"name", "Scratch"}});
        const auto text = QString::fromUtf8(QJsonDocument(exported).toJson());
        f.ok("importData", {{"data", text}, {"mergeMode", true}});
        REQUIRE(f.store.tag("scratch") != nullptr);
    }

    SECTION("import without data") {
        REQUIRE(f.run("importData").error_kind == ErrorKind::Validation);
    }

    SECTION("import of garbage") {
        REQUIRE(f.run("importData", {{"data", "{nope"}}).error_kind == ErrorKind::Validation);
        REQUIRE(f.store.tag("work") != nullptr);
    }
}

TEST_CASE("getSyncStatus without a coordinator reports local state", "[handlers]") {
    Fixture f;
    const auto id = f.page_id();
    f.ok("deletePage", {{"pageId", id}});

    auto status = f.ok("getSyncStatus").toObject();
    REQUIRE(status.value("enabled").toBool() == false);
    REQUIRE(status.value("pendingTombstones").toInteger() == 1);
    REQUIRE(status.value("lastSyncAt").isNull());
}
