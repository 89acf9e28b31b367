#include <catch2/catch_test_macros.hpp>
#include "app/cli.hpp"

#include <QFile>
#include <QTemporaryDir>

using namespace tagsync;
using namespace tagsync::app;

TEST_CASE("CLI commands map to pipeline requests", "[cli]") {
    const CliOptions options;

    SECTION("positional arguments become payload keys") {
        auto request = request_for_command({"rename-tag", "work", "Job"}, options).unwrap();
        REQUIRE(request.operation == "updateTag");
        REQUIRE(request.payload.value("tagId").toString() == "work");
        REQUIRE(request.payload.value("name").toString() == "Job");
    }

    SECTION("optional arguments may be omitted") {
        auto request = request_for_command({"pages"}, options).unwrap();
        REQUIRE(request.operation == "getAllTaggedPages");
        REQUIRE(request.payload.isEmpty());
    }

    SECTION("missing arguments print usage") {
        auto request = request_for_command({"tag-page", "p1"}, options);
        REQUIRE(request.is_err());
        REQUIRE(request.unwrap_err().message == "usage: tag-page <pageId> <tagName>");
    }

    SECTION("unknown commands are rejected") {
        REQUIRE(request_for_command({"frobnicate"}, options).is_err());
    }
}

TEST_CASE("CLI import reads the file", "[cli]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("export.json"));
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    file.write(R"({"tags":{},"pages":{}})");
    file.close();

    auto request = request_for_command({"import", path}, CliOptions{.json = false, .merge = true}).unwrap();
    REQUIRE(request.operation == "importData");
    REQUIRE(request.payload.value("mergeMode").toBool());
    REQUIRE(request.payload.value("data").toString().contains("tags"));

    REQUIRE(request_for_command({"import", dir.filePath("missing.json")}, CliOptions{}).is_err());
}

TEST_CASE("CLI output formatting", "[cli]") {
    SECTION("tag lists") {
        const auto response = Response::ok(QJsonArray{QJsonObject{{"id", "work"}, {"name", "Work"}}});
        REQUIRE(format_response("tags", response, CliOptions{}) == "- Work (work)\n");
    }

    SECTION("errors carry their kind") {
        const auto response = Response::failure(business_error("tag not found: x"));
        REQUIRE(format_response("delete-tag", response, CliOptions{}) ==
                "error (business_rule): tag not found: x\n");
    }

    SECTION("json mode prints the response envelope") {
        const auto response = Response::ok(QJsonValue());
        const auto text = format_response("delete-tag", response, CliOptions{.json = true, .merge = false});
        REQUIRE(text.contains("\"success\": true"));
    }
}
