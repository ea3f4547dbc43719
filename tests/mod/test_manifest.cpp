// modkit_mod manifest tests

#include <catch2/catch_test_macros.hpp>
#include <modkit/mod/manifest.hpp>

#include <filesystem>
#include <fstream>

using namespace modkit_mod;
using modkit_core::ErrorCode;
using modkit_core::ManifestError;

TEST_CASE("ModManifest parsing", "[mod][manifest]") {
    SECTION("full manifest") {
        auto manifest = ModManifest::from_json_string(R"({
            "id": "better_guards",
            "name": "Better Guards",
            "author": "someone",
            "version": "1.4.0",
            "description": "Guards that fight back",
            "dependencies": ["core_lib", "combat_ext >= 2.0.0"],
            "loadBefore": ["ui_tweaks"],
            "loadAfter": ["balance_pass"],
            "priority": -5,
            "scripts": ["scripts/guards.lua"],
            "permissions": ["filesystem"],
            "patches": ["patches/guard.json"],
            "contentFolders": {"Templates": "Content/Templates"}
        })", "Mods/better_guards");

        REQUIRE(manifest);
        REQUIRE(manifest->id == "better_guards");
        REQUIRE(manifest->author == "someone");
        REQUIRE(manifest->dependencies.size() == 2);
        REQUIRE(manifest->dependencies[1].id == "combat_ext");
        REQUIRE(manifest->dependencies[1].has_constraint());
        REQUIRE(manifest->dependency_ids() == std::vector<std::string>{"core_lib", "combat_ext"});
        REQUIRE(manifest->load_before == std::vector<std::string>{"ui_tweaks"});
        REQUIRE(manifest->load_after == std::vector<std::string>{"balance_pass"});
        REQUIRE(manifest->priority == -5);
        REQUIRE(manifest->scripts.size() == 1);
        REQUIRE(manifest->permissions.size() == 1);
        REQUIRE(manifest->patches.size() == 1);
        REQUIRE(manifest->content_folders.at("Templates") == "Content/Templates");
        REQUIRE(manifest->directory == std::filesystem::path("Mods/better_guards"));
        REQUIRE(manifest->to_string() == "Better Guards (better_guards) v1.4.0");
    }

    SECTION("minimal manifest uses defaults") {
        auto manifest = ModManifest::from_json_string(
            R"({"id": "tiny", "name": "Tiny", "version": "0.1.0"})", "Mods/tiny");
        REQUIRE(manifest);
        REQUIRE(manifest->priority == 0);
        REQUIRE(manifest->dependencies.empty());
        REQUIRE(manifest->content_folders.empty());
    }

    SECTION("dependency versions may be short") {
        auto manifest = ModManifest::from_json_string(
            R"({"id": "tiny", "name": "Tiny", "version": "0.1.0", "dependencies": ["core >= 1.0", "ui 2"]})",
            "Mods/tiny");
        REQUIRE(manifest);
        REQUIRE(manifest->dependencies[0].constraint.version == SemanticVersion(1, 0, 0));
        REQUIRE(manifest->dependencies[1].to_string() == "ui >=2.0.0");
    }

    SECTION("field names are case-insensitive and nulls are absent") {
        auto manifest = ModManifest::from_json_string(
            R"({"Id": "tiny", "NAME": "Tiny", "Version": "0.1.0", "loadafter": ["x"], "author": null})",
            "Mods/tiny");
        REQUIRE(manifest);
        REQUIRE(manifest->id == "tiny");
        REQUIRE(manifest->load_after == std::vector<std::string>{"x"});
        REQUIRE(manifest->author.empty());
    }

    SECTION("version with trailing text is accepted") {
        auto manifest = ModManifest::from_json_string(
            R"({"id": "a", "name": "A", "version": "1.0.0-beta+42"})", "Mods/a");
        REQUIRE(manifest);
        REQUIRE(manifest->semantic_version()->prerelease == "beta");
    }
}

TEST_CASE("ModManifest validation failures", "[mod][manifest]") {
    auto parse = [](const char* text) {
        return ModManifest::from_json_string(text, "Mods/x", "Mods/x/mod.json");
    };

    SECTION("missing id") {
        auto result = parse(R"({"name": "X", "version": "1.0.0"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ManifestError>()->kind == ManifestError::Kind::MissingField);
        REQUIRE(result.error().as<ManifestError>()->field == "id");
    }

    SECTION("empty name") {
        auto result = parse(R"({"id": "x", "name": "", "version": "1.0.0"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ManifestError>()->field == "name");
    }

    SECTION("bad version") {
        auto result = parse(R"({"id": "x", "name": "X", "version": "1.0"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ManifestError>()->kind == ManifestError::Kind::InvalidVersion);
    }

    SECTION("wrong field type") {
        auto result = parse(R"({"id": "x", "name": "X", "version": "1.0.0", "priority": "high"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ManifestError>()->kind == ManifestError::Kind::InvalidField);
        REQUIRE(result.error().as<ManifestError>()->field == "priority");
    }

    SECTION("non-string array entry") {
        auto result = parse(R"({"id": "x", "name": "X", "version": "1.0.0", "scripts": [1]})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ManifestError>()->field == "scripts");
    }

    SECTION("malformed dependency") {
        auto result = parse(R"({"id": "x", "name": "X", "version": "1.0.0", "dependencies": ["y >=soon"]})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ManifestError>()->field == "dependencies");
    }

    SECTION("invalid JSON") {
        auto result = parse("{\"id\": ");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
        REQUIRE(result.error().message().find("Mods/x/mod.json") != std::string::npos);
    }

    SECTION("root must be an object") {
        REQUIRE(parse("[]").is_err());
    }
}

TEST_CASE("ModManifest load from disk", "[mod][manifest]") {
    auto dir = std::filesystem::temp_directory_path() / "modkit_test_manifest";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    {
        std::ofstream out(dir / "mod.json");
        out << R"({"id": "disk_mod", "name": "Disk Mod", "version": "2.0.0"})";
    }

    auto manifest = ModManifest::load(dir / "mod.json", dir);
    REQUIRE(manifest);
    REQUIRE(manifest->id == "disk_mod");
    REQUIRE(manifest->directory == dir);

    auto missing = ModManifest::load(dir / "absent.json", dir);
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code() == ErrorCode::NotFound);

    LoadedMod loaded{*manifest, dir};
    REQUIRE(loaded.resolve_path("scripts/a.lua") == dir / "scripts/a.lua");

    std::filesystem::remove_all(dir);
}
