#include <catch2/catch_test_macros.hpp>

#include "storage/model_catalog.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using test::TmpDir;

TEST_CASE("FileModelCatalog", "[models]") {
    TmpDir dir;
    FileModelCatalog catalog(dir.path.string());

    SECTION("MissingManifestIsEmpty") {
        catalog.load();
        REQUIRE(catalog.entries().empty());
        REQUIRE_FALSE(catalog.checksum("ggml-base.en"));
    }

    SECTION("BinFileIsAvailable") {
        test::write_file(dir.file("ggml-base.en.bin"), "weights");
        REQUIRE(catalog.is_available("ggml-base.en"));
        REQUIRE(catalog.model_path("ggml-base.en") == dir.file("ggml-base.en.bin"));
        REQUIRE_FALSE(catalog.is_available("ggml-tiny.en"));
        REQUIRE_FALSE(catalog.is_available(""));
    }

    SECTION("EmptyFileIsNotAvailable") {
        test::write_file(dir.file("ggml-tiny.en.bin"), "");
        REQUIRE_FALSE(catalog.is_available("ggml-tiny.en"));
    }

    SECTION("DirectoryModelIsAvailable") {
        std::filesystem::create_directory(dir.path / "ggml-large");
        REQUIRE(catalog.is_available("ggml-large"));
        REQUIRE(catalog.model_path("ggml-large") == dir.file("ggml-large"));
    }

    SECTION("UpsertPersistsManifest") {
        REQUIRE(catalog.upsert({.model_id = "ggml-base.en", .checksum = "abc123"}));
        REQUIRE(catalog.upsert({.model_id = "ggml-tiny.en", .checksum = std::nullopt}));

        std::ifstream f(dir.file("manifest.json"));
        auto j = nlohmann::json::parse(f);
        REQUIRE(j["version"] == FileModelCatalog::kManifestVersion);
        REQUIRE(j["entries"].size() == 2);
        REQUIRE(j["entries"][1]["checksum"].is_null());

        FileModelCatalog reloaded(dir.path.string());
        reloaded.load();
        REQUIRE(reloaded.checksum("ggml-base.en") == "abc123");
        REQUIRE_FALSE(reloaded.checksum("ggml-tiny.en"));
        REQUIRE_FALSE(reloaded.entries()[0].last_updated.empty());
    }

    SECTION("UpsertReplacesExisting") {
        REQUIRE(catalog.upsert({.model_id = "ggml-base.en", .checksum = "old"}));
        REQUIRE(catalog.upsert({.model_id = "ggml-base.en", .checksum = "new"}));
        REQUIRE(catalog.entries().size() == 1);
        REQUIRE(catalog.checksum("ggml-base.en") == "new");
    }

    SECTION("RemoveDropsEntry") {
        REQUIRE(catalog.upsert({.model_id = "ggml-base.en", .checksum = "abc"}));
        REQUIRE(catalog.remove("ggml-base.en"));
        FileModelCatalog reloaded(dir.path.string());
        reloaded.load();
        REQUIRE(reloaded.entries().empty());
    }

    SECTION("CorruptManifestIsEmpty") {
        test::write_file(dir.file("manifest.json"), "{\"entries\": [ {\"model_id\": ");
        catalog.load();
        REQUIRE(catalog.entries().empty());
    }
}
