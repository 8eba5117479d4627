#include <doctest/doctest.h>
#include <cairn/manifest_json.hpp>

#include "../test_helpers.hpp"

using namespace cairn_test;

TEST_CASE("parse minimal record") {
    auto r = cairn::parse_manifest_json(R"({"id": "pub.tool.v1", "name": "Tool", "version": "1.0"})");
    REQUIRE(r.ok);
    CHECK(r.manifest.id.value() == "pub.tool.v1");
    CHECK(r.manifest.name == "Tool");
    CHECK(r.manifest.version == "1.0");
    CHECK(r.manifest.manifest_version == "1.0");
    CHECK(r.manifest.content_type == cairn::ContentType::Unknown);
    CHECK_FALSE(r.manifest.publisher.has_value());
    CHECK(r.warnings.empty());
}

TEST_CASE("parse full record") {
    const char* json = R"({
        "manifestVersion": "1.1",
        "id": "1.0.moddb.mod.rotr",
        "name": "Rise of the Reds",
        "version": "1.87",
        "contentType": "mod",
        "targetGame": "ZeroHour",
        "publisher": {"name": "SWR", "website": "https://example.org"},
        "metadata": {"description": "Total conversion", "tags": ["mod", "factions"]},
        "files": [
            {"relativePath": "Data/rotr.big", "hash": "ABC", "size": 42,
             "sourceType": "ContentAddressable", "isExecutable": false,
             "isRequired": false, "permissions": {"isReadOnly": true, "unixMode": "0644"}},
            {"relativePath": "patch.bin", "sourceType": "PatchFile", "patchSourceFile": "orig.bin"}
        ],
        "dependencies": [
            {"id": "1.108.steam.gameinstallation.zerohour", "name": "ZH",
             "dependencyType": "GameInstallation", "minVersion": "1.04", "installBehavior": "Optional"}
        ],
        "requiredDirectories": ["Maps"],
        "somethingNew": true
    })";

    auto r = cairn::parse_manifest_json(json);
    REQUIRE(r.ok);
    const auto& m = r.manifest;
    CHECK(m.manifest_version == "1.1");
    CHECK(m.content_type == cairn::ContentType::Mod);
    CHECK(m.target_game == cairn::GameType::ZeroHour);
    REQUIRE(m.publisher.has_value());
    CHECK(m.publisher->name == "SWR");
    CHECK(m.metadata.tags.size() == 2);

    REQUIRE(m.files.size() == 2);
    CHECK(m.files[0].hash == "ABC");
    CHECK(m.files[0].size == 42);
    CHECK_FALSE(m.files[0].is_required);
    CHECK(m.files[0].permissions.is_read_only);
    CHECK(m.files[0].permissions.unix_mode == "0644");
    CHECK(m.files[1].source_type == cairn::ContentSourceType::PatchFile);
    CHECK(m.files[1].is_required);

    REQUIRE(m.dependencies.size() == 1);
    CHECK(m.dependencies[0].install_behavior == cairn::DependencyInstallBehavior::Optional);
    CHECK(m.dependencies[0].min_version == "1.04");
    CHECK(m.required_directories == std::vector<std::string>{"Maps"});
    CHECK(r.warnings.empty());
}

TEST_CASE("critical parse failures") {
    SUBCASE("truncated JSON") {
        auto r = cairn::parse_manifest_json(R"({"id": "pub.tool.v1", "na)", "/pool/x.manifest.json");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("parse error") != std::string::npos);
        CHECK(r.error.find("/pool/x.manifest.json") != std::string::npos);
    }

    SUBCASE("non-object root") {
        auto r = cairn::parse_manifest_json("[1, 2]");
        CHECK_FALSE(r.ok);
    }

    SUBCASE("missing id") {
        auto r = cairn::parse_manifest_json(R"({"name": "x"})");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("id missing") != std::string::npos);
    }

    SUBCASE("invalid id") {
        auto r = cairn::parse_manifest_json(R"({"id": "../escape"})");
        CHECK_FALSE(r.ok);
    }
}

TEST_CASE("recoverable problems become warnings") {
    const char* json = R"({
        "id": "pub.tool.v1",
        "contentType": "Spaceship",
        "files": [{"relativePath": "a", "sourceType": "Teleport"}, 7],
        "dependencies": [{"name": "no id"}, {"id": "bad id!"}, {"id": "pub.base.v1"}]
    })";

    auto r = cairn::parse_manifest_json(json);
    REQUIRE(r.ok);
    CHECK(r.manifest.content_type == cairn::ContentType::Unknown);
    CHECK(r.manifest.files.size() == 1);
    CHECK(r.manifest.files[0].source_type == cairn::ContentSourceType::Unknown);
    REQUIRE(r.manifest.dependencies.size() == 1);
    CHECK(r.manifest.dependencies[0].id.value() == "pub.base.v1");
    CHECK(r.warnings.size() == 5);
}

TEST_CASE("serialize then parse preserves the manifest") {
    auto m = make_manifest("pub.tool.v1", "Tool", "2.0");
    m.publisher = cairn::PublisherInfo{"Pub", "modder", "", "", "pub@example.org"};
    m.metadata.description = "A tool";
    m.metadata.tags = {"util"};
    auto file = content_file("bin/tool.exe", "binary");
    file.is_executable = true;
    file.permissions.unix_mode = "0755";
    m.files.push_back(file);

    cairn::ContentDependency dep;
    dep.id = make_id("pub.base.v1");
    dep.name = "Base";
    dep.dependency_type = cairn::ContentType::GameClient;
    dep.max_version = "3.0";
    dep.install_behavior = cairn::DependencyInstallBehavior::Suggested;
    m.dependencies.push_back(dep);
    m.required_directories.push_back("logs");

    std::string text = cairn::serialize_manifest(m);
    CHECK(text.find("\"relativePath\"") != std::string::npos);
    CHECK(text.find("\n  \"id\"") != std::string::npos);

    auto r = cairn::parse_manifest_json(text);
    REQUIRE(r.ok);
    CHECK(r.manifest == m);
    CHECK(r.warnings.empty());
}

TEST_CASE("absent publisher is not serialized") {
    auto m = make_manifest("pub.tool.v1");
    std::string text = cairn::serialize_manifest(m);
    CHECK(text.find("\"publisher\"") == std::string::npos);
}

TEST_CASE("enum names parse case-insensitively") {
    CHECK(cairn::parse_content_type("mappack") == cairn::ContentType::MapPack);
    CHECK(cairn::parse_game_type("ZEROHOUR") == cairn::GameType::ZeroHour);
    CHECK(cairn::parse_source_type("remotedownload") == cairn::ContentSourceType::RemoteDownload);
    CHECK(cairn::parse_install_behavior("suggested") == cairn::DependencyInstallBehavior::Suggested);
    CHECK_FALSE(cairn::parse_content_type("").has_value());
    CHECK(std::string(cairn::content_type_to_string(cairn::ContentType::LanguagePack)) == "LanguagePack");
}
