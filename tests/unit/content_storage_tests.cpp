#include <doctest/doctest.h>
#include <cairn/content_storage.hpp>
#include <cairn/manifest_json.hpp>

#include "../test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

using namespace cairn_test;
using cairn::ContentStorageService;
using cairn::ErrorCode;

namespace {

cairn::StorageConfig storage_config(const TempDir& dir) {
    cairn::StorageConfig config;
    config.root = dir.sub("pool");
    config.gc_grace_period_seconds = 0;
    return config;
}

std::unique_ptr<ContentStorageService> make_storage(const TempDir& dir) {
    return std::make_unique<ContentStorageService>(storage_config(dir),
                                                   std::make_shared<cairn::Sha256HashProvider>());
}

// Hash provider that always reports the same failure
class FailingHashProvider : public cairn::HashProvider {
public:
    cairn::Result<std::string> computeFileHash(const std::string& path,
                                               const cairn::CancellationToken&) override {
        return cairn::Result<std::string>::err(
            cairn::Error(ErrorCode::HASH_FAILED, "cannot hash " + path));
    }
};

} // namespace

TEST_CASE("constructor rejects unusable configuration") {
    cairn::StorageConfig empty_root;
    CHECK_THROWS_AS(ContentStorageService(empty_root, std::make_shared<cairn::Sha256HashProvider>()),
                    std::invalid_argument);

    TempDir dir;
    CHECK_THROWS_AS(ContentStorageService(storage_config(dir), nullptr), std::invalid_argument);
}

TEST_CASE("storage layout paths") {
    TempDir dir;
    auto storage = make_storage(dir);
    auto id = make_id("Pub.Tool.V1");
    std::string root = storage->config().root;

    CHECK(storage->getManifestStoragePath(id) == cairn::join_path(root, "manifests/pub.tool.v1.manifest.json"));
    CHECK(storage->getContentDirectoryPath(id) == cairn::join_path(root, "data/pub.tool.v1"));

    std::string hash = sha256_of("hello");
    CHECK(storage->getObjectPath(hash) == cairn::join_path(root, "cas-objects/2c/" + hash));
}

TEST_CASE("store writes objects and record") {
    TempDir dir;
    auto storage = make_storage(dir);
    write_file(dir.sub("src/tool.exe"), "tool binary");
    write_file(dir.sub("src/readme.txt"), "read me");

    auto m = make_manifest("pub.tool.v1");
    auto exe = content_file("tool.exe", "tool binary");
    exe.size = 0;
    for (auto& c : exe.hash) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    m.files.push_back(exe);
    m.files.push_back(content_file("readme.txt", "read me"));

    auto stored = storage->storeContent(m, dir.sub("src"));
    REQUIRE(stored.isOk());

    const auto& result = stored.value();
    REQUIRE(result.files.size() == 2);
    CHECK(result.files[0].hash == sha256_of("tool binary"));
    CHECK(result.files[0].size == 11);

    CHECK(storage->objectExists(sha256_of("tool binary")));
    CHECK(storage->objectExists(sha256_of("read me")));
    CHECK(storage->isContentStored(m.id).value());
    CHECK(cairn::is_directory(storage->getContentDirectoryPath(m.id)));
    CHECK_FALSE(cairn::path_exists(cairn::join_path(storage->getContentDirectoryPath(m.id), "source.path")));

    auto read = storage->readManifest(m.id);
    REQUIRE(read.isOk());
    REQUIRE(read.value().has_value());
    CHECK(*read.value() == result);

    auto object = cairn::read_file(storage->getObjectPath(sha256_of("read me")));
    REQUIRE(object.ok);
    CHECK(object.content == "read me");
}

TEST_CASE("identical files are stored once") {
    TempDir dir;
    auto storage = make_storage(dir);
    write_file(dir.sub("a/one.txt"), "same bytes");
    write_file(dir.sub("a/two.txt"), "same bytes");
    write_file(dir.sub("b/three.txt"), "same bytes");

    auto first = make_manifest("pub.first.v1");
    first.files = {content_file("one.txt", "same bytes"), content_file("two.txt", "same bytes")};
    auto second = make_manifest("pub.second.v1");
    second.files = {content_file("three.txt", "same bytes")};

    REQUIRE(storage->storeContent(first, dir.sub("a")).isOk());
    REQUIRE(storage->storeContent(second, dir.sub("b")).isOk());

    CHECK(count_files(cairn::join_path(storage->config().root, "cas-objects")) == 1);
}

TEST_CASE("store failures write nothing") {
    TempDir dir;
    auto storage = make_storage(dir);
    std::string root = storage->config().root;
    write_file(dir.sub("src/good.txt"), "good");
    write_file(dir.sub("src/bad.txt"), "actual");

    SUBCASE("missing source directory") {
        auto m = make_manifest("pub.x.v1");
        m.files.push_back(content_file("good.txt", "good"));
        auto r = storage->storeContent(m, dir.sub("absent"));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::SOURCE_MISSING);
        CHECK(r.error().message().find("Source directory does not exist") != std::string::npos);
    }

    SUBCASE("missing required file") {
        auto m = make_manifest("pub.x.v1");
        m.files = {content_file("good.txt", "good"), content_file("gone.txt", "gone")};
        auto r = storage->storeContent(m, dir.sub("src"));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::SOURCE_MISSING);
        CHECK(r.error().message() == "Required file not found: gone.txt");
    }

    SUBCASE("hash mismatch") {
        auto m = make_manifest("pub.x.v1");
        m.files = {content_file("good.txt", "good"), content_file("bad.txt", "expected")};
        auto r = storage->storeContent(m, dir.sub("src"));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::HASH_MISMATCH);
        CHECK(r.error().message().find("Hash mismatch for bad.txt") != std::string::npos);
    }

    SUBCASE("size mismatch") {
        auto m = make_manifest("pub.x.v1");
        auto file = content_file("good.txt", "good");
        file.size = 99;
        m.files = {file};
        auto r = storage->storeContent(m, dir.sub("src"));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::SIZE_MISMATCH);
        CHECK(r.error().message() == "Size mismatch for good.txt: expected 99, got 4");
    }

    SUBCASE("path escaping the source directory") {
        auto m = make_manifest("pub.x.v1");
        m.files = {content_file("../../etc/passwd", "root")};
        auto r = storage->storeContent(m, dir.sub("src"));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::PATH_TRAVERSAL);
        CHECK(r.error().message().find("../../etc/passwd") != std::string::npos);
    }

    SUBCASE("hash provider failure") {
        ContentStorageService failing(storage_config(dir), std::make_shared<FailingHashProvider>());
        auto m = make_manifest("pub.x.v1");
        m.files = {content_file("good.txt", "good")};
        auto r = failing.storeContent(m, dir.sub("src"));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::HASH_FAILED);
    }

    SUBCASE("cancelled before start") {
        cairn::CancellationToken token;
        token.cancel();
        auto m = make_manifest("pub.x.v1");
        m.files = {content_file("good.txt", "good")};
        auto r = storage->storeContent(m, dir.sub("src"), token);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::CANCELLED);
    }

    CHECK(count_files(cairn::join_path(root, "manifests")) == 0);
    CHECK(count_files(cairn::join_path(root, "cas-objects")) == 0);
    CHECK(count_files(cairn::join_path(root, "data")) == 0);
}

TEST_CASE("missing optional file is dropped from the stored manifest") {
    TempDir dir;
    auto storage = make_storage(dir);
    write_file(dir.sub("src/main.big"), "main");

    auto m = make_manifest("pub.opt.v1");
    auto optional = content_file("extras.big", "extras");
    optional.is_required = false;
    m.files = {content_file("main.big", "main"), optional};

    auto r = storage->storeContent(m, dir.sub("src"));
    REQUIRE(r.isOk());
    REQUIRE(r.value().files.size() == 1);
    CHECK(r.value().files[0].relative_path == "main.big");
}

TEST_CASE("non content-addressable files are recorded as given") {
    TempDir dir;
    auto storage = make_storage(dir);
    cairn::create_directories(dir.sub("install"));

    auto m = make_manifest("pub.install.v1");
    cairn::ManifestFile remote;
    remote.relative_path = "maps.big";
    remote.source_type = cairn::ContentSourceType::RemoteDownload;
    remote.download_url = "https://example.org/maps.big";
    m.files = {remote};

    auto r = storage->storeContent(m, dir.sub("install"));
    REQUIRE(r.isOk());
    CHECK(r.value().files == m.files);
    CHECK(count_files(cairn::join_path(storage->config().root, "cas-objects")) == 0);

    // Without objects the content stays where it is; the mapping points at it
    auto mapping = cairn::read_file(cairn::join_path(storage->getContentDirectoryPath(m.id), "source.path"));
    REQUIRE(mapping.ok);
    CHECK(mapping.content == cairn::to_portable_path(
        std::filesystem::absolute(dir.sub("install")).lexically_normal().string()));
}

TEST_CASE("read missing and corrupt records") {
    TempDir dir;
    auto storage = make_storage(dir);

    auto missing = storage->readManifest(make_id("nonexistent-id"));
    REQUIRE(missing.isOk());
    CHECK_FALSE(missing.value().has_value());
    CHECK_FALSE(storage->isContentStored(make_id("nonexistent-id")).value());

    auto id = make_id("pub.corrupt.v1");
    write_file(storage->getManifestStoragePath(id), R"({"id": "pub.corrupt.v1", "name": )");
    auto corrupt = storage->readManifest(id);
    REQUIRE(corrupt.isErr());
    CHECK(corrupt.error().code() == ErrorCode::MANIFEST_CORRUPT);

    auto other = make_id("pub.other.v1");
    write_file(storage->getManifestStoragePath(other), R"({"id": "pub.elsewhere.v1"})");
    auto mismatched = storage->readManifest(other);
    REQUIRE(mismatched.isErr());
    CHECK(mismatched.error().code() == ErrorCode::MANIFEST_CORRUPT);

    auto scan = storage->scanManifests();
    REQUIRE(scan.isOk());
    CHECK(scan.value().unreadable.size() == 1);
    CHECK(scan.value().manifests.size() == 1);
}

TEST_CASE("remove deletes only unshared objects") {
    TempDir dir;
    auto storage = make_storage(dir);
    write_file(dir.sub("src/shared.txt"), "shared");
    write_file(dir.sub("src/own.txt"), "own");

    auto a = make_manifest("pub.a.v1");
    a.files = {content_file("shared.txt", "shared"), content_file("own.txt", "own")};
    auto b = make_manifest("pub.b.v1");
    b.files = {content_file("shared.txt", "shared")};

    REQUIRE(storage->storeContent(a, dir.sub("src")).isOk());
    REQUIRE(storage->storeContent(b, dir.sub("src")).isOk());

    REQUIRE(storage->removeContent(a.id).isOk());
    CHECK_FALSE(storage->isContentStored(a.id).value());
    CHECK_FALSE(cairn::path_exists(storage->getContentDirectoryPath(a.id)));
    CHECK_FALSE(storage->objectExists(sha256_of("own")));
    CHECK(storage->objectExists(sha256_of("shared")));

    // Idempotent
    CHECK(storage->removeContent(a.id).isOk());
    CHECK(storage->removeContent(make_id("never.stored")).isOk());

    REQUIRE(storage->removeContent(b.id).isOk());
    CHECK_FALSE(storage->objectExists(sha256_of("shared")));
}

TEST_CASE("failed content directory removal keeps the record") {
    TempDir dir;
    auto storage = make_storage(dir);
    write_file(dir.sub("src/a.txt"), "a");
    auto m = make_manifest("pub.locked.v1");
    m.files = {content_file("a.txt", "a")};
    REQUIRE(storage->storeContent(m, dir.sub("src")).isOk());

    // A read-only subdirectory makes remove_all fail for unprivileged users
    namespace fs = std::filesystem;
    fs::path locked = fs::path(storage->getContentDirectoryPath(m.id)) / "locked";
    write_file((locked / "inner.txt").string(), "inner");
    fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_exec);

    std::error_code ec;
    bool privileged = std::ofstream((locked / "check.txt").string()).good();
    fs::remove(locked / "check.txt", ec);
    if (privileged) {
        fs::permissions(locked, fs::perms::owner_all);
        MESSAGE("running with permission override, removal cannot be made to fail");
        return;
    }

    auto removed = storage->removeContent(m.id);
    fs::permissions(locked, fs::perms::owner_all);

    REQUIRE(removed.isErr());
    CHECK(removed.error().code() == ErrorCode::IO_ERROR);
    CHECK(storage->isContentStored(m.id).value());
    CHECK(storage->objectExists(sha256_of("a")));

    // Retrying once the directory is removable completes the removal
    REQUIRE(storage->removeContent(m.id).isOk());
    CHECK_FALSE(storage->isContentStored(m.id).value());
    CHECK_FALSE(storage->objectExists(sha256_of("a")));
}

TEST_CASE("storage paths refuse ids that name the parent directory") {
    TempDir dir;
    auto storage = make_storage(dir);
    write_file(dir.sub("src/a.txt"), "a");
    auto other = make_manifest("pub.other.v1");
    other.files = {content_file("a.txt", "a")};
    REQUIRE(storage->storeContent(other, dir.sub("src")).isOk());

    cairn::ManifestId empty;
    CHECK_THROWS_AS(storage->getContentDirectoryPath(empty), std::invalid_argument);
    CHECK_THROWS_AS(storage->getManifestStoragePath(empty), std::invalid_argument);

    auto removed = storage->removeContent(empty);
    REQUIRE(removed.isErr());
    CHECK(removed.error().code() == ErrorCode::INVALID_ID);
    CHECK(storage->isContentStored(other.id).value());
    CHECK(cairn::is_directory(storage->getContentDirectoryPath(other.id)));
}

TEST_CASE("replace and update stored records") {
    TempDir dir;
    auto storage = make_storage(dir);
    write_file(dir.sub("src/tool.exe"), "tool");

    auto m = make_manifest("pub.tool.v1");
    m.files = {content_file("tool.exe", "tool")};

    SUBCASE("replace requires a stored manifest") {
        auto r = storage->replaceManifest(m);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::NOT_STORED);
    }

    REQUIRE(storage->storeContent(m, dir.sub("src")).isOk());

    SUBCASE("replace rewrites metadata and fills sizes") {
        auto changed = m;
        changed.name = "Renamed";
        changed.files[0].size = 0;
        auto r = storage->replaceManifest(changed);
        REQUIRE(r.isOk());
        CHECK(r.value().files[0].size == 4);
        CHECK(storage->readManifest(m.id).value()->name == "Renamed");
    }

    SUBCASE("replace refuses unknown objects") {
        auto changed = m;
        changed.files.push_back(content_file("new.dll", "never stored"));
        auto r = storage->replaceManifest(changed);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::SOURCE_MISSING);
    }

    SUBCASE("update applies a patch") {
        auto r = storage->updateManifest(m.id, [](cairn::ContentManifest& manifest) {
            manifest.files[0].is_executable = true;
            return cairn::Result<bool>::ok(true);
        });
        REQUIRE(r.isOk());
        CHECK(r.value());
        CHECK(storage->readManifest(m.id).value()->files[0].is_executable);
    }

    SUBCASE("update without change writes nothing") {
        auto r = storage->updateManifest(m.id, [](cairn::ContentManifest&) {
            return cairn::Result<bool>::ok(false);
        });
        REQUIRE(r.isOk());
        CHECK_FALSE(r.value());
    }

    SUBCASE("update of absent manifest") {
        auto r = storage->updateManifest(make_id("pub.none.v1"), [](cairn::ContentManifest&) {
            return cairn::Result<bool>::ok(true);
        });
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::MANIFEST_NOT_FOUND);
    }
}

TEST_CASE("garbage collection") {
    TempDir dir;
    auto storage = make_storage(dir);
    write_file(dir.sub("src/kept.txt"), "kept");
    auto m = make_manifest("pub.keep.v1");
    m.files = {content_file("kept.txt", "kept")};
    REQUIRE(storage->storeContent(m, dir.sub("src")).isOk());

    std::string orphan = sha256_of("orphan");
    write_file(storage->getObjectPath(orphan), "orphan");
    write_file(cairn::join_path(cairn::join_path(storage->config().root, "temp"), "stale"), "x");

    SUBCASE("deletes unreferenced objects") {
        auto r = storage->collectGarbage();
        REQUIRE(r.isOk());
        CHECK(r.value().objects_scanned == 2);
        CHECK(r.value().objects_referenced == 1);
        CHECK(r.value().objects_deleted == 1);
        CHECK(r.value().bytes_freed == 6);
        CHECK_FALSE(storage->objectExists(orphan));
        CHECK(storage->objectExists(sha256_of("kept")));
        CHECK(count_files(cairn::join_path(storage->config().root, "temp")) == 0);
    }

    SUBCASE("grace period protects young objects") {
        auto config = storage_config(dir);
        config.gc_grace_period_seconds = 3600;
        ContentStorageService patient(config, std::make_shared<cairn::Sha256HashProvider>());
        auto r = patient.collectGarbage();
        REQUIRE(r.isOk());
        CHECK(r.value().objects_deleted == 0);
        CHECK(patient.objectExists(orphan));
    }

    SUBCASE("unreadable record aborts collection") {
        write_file(storage->getManifestStoragePath(make_id("pub.broken.v1")), "{");
        auto r = storage->collectGarbage();
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::MANIFEST_CORRUPT);
        CHECK(storage->objectExists(orphan));
    }
}

TEST_CASE("integrity verification") {
    TempDir dir;
    auto storage = make_storage(dir);
    write_file(dir.sub("src/a.txt"), "alpha");
    write_file(dir.sub("src/b.txt"), "beta");
    auto m = make_manifest("pub.check.v1");
    m.files = {content_file("a.txt", "alpha"), content_file("b.txt", "beta")};
    REQUIRE(storage->storeContent(m, dir.sub("src")).isOk());

    auto clean = storage->verifyIntegrity();
    REQUIRE(clean.isOk());
    CHECK(clean.value().ok());
    CHECK(clean.value().objects_validated == 2);

    write_file(storage->getObjectPath(sha256_of("alpha")), "tampered");
    cairn::remove_file(storage->getObjectPath(sha256_of("beta")));

    auto report = storage->verifyIntegrity();
    REQUIRE(report.isOk());
    REQUIRE(report.value().issues.size() == 2);

    bool saw_mismatch = false;
    bool saw_missing = false;
    for (const auto& issue : report.value().issues) {
        if (issue.kind == cairn::IntegrityIssueKind::HashMismatch) {
            saw_mismatch = issue.hash == sha256_of("alpha");
        }
        if (issue.kind == cairn::IntegrityIssueKind::MissingObject) {
            saw_missing = issue.hash == sha256_of("beta");
            CHECK(issue.manifest_ids == std::vector<std::string>{"pub.check.v1"});
        }
    }
    CHECK(saw_mismatch);
    CHECK(saw_missing);
}

TEST_CASE("storage statistics") {
    TempDir dir;
    auto storage = make_storage(dir);

    auto empty = storage->getStats();
    REQUIRE(empty.isOk());
    CHECK(empty.value().manifest_count == 0);

    write_file(dir.sub("src/a.txt"), "12345");
    auto m = make_manifest("pub.stats.v1");
    m.files = {content_file("a.txt", "12345")};
    REQUIRE(storage->storeContent(m, dir.sub("src")).isOk());

    auto stats = storage->getStats();
    REQUIRE(stats.isOk());
    CHECK(stats.value().manifest_count == 1);
    CHECK(stats.value().object_count == 1);
    CHECK(stats.value().object_bytes == 5);
    CHECK(stats.value().total_file_count == 2);
    CHECK(stats.value().total_size_bytes > 5);
}
