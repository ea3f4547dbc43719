// modkit_mod loader tests

#include <catch2/catch_test_macros.hpp>
#include <modkit/core/log.hpp>
#include <modkit/mod/mod.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace modkit_mod;
using modkit_core::ErrorCode;
using modkit_doc::Document;

namespace fs = std::filesystem;

namespace {

void write_file(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << text;
}

/// Scratch mods directory removed on destruction
class TempMods {
public:
    explicit TempMods(const std::string& name)
        : m_root(fs::temp_directory_path() / name) {
        fs::remove_all(m_root);
        fs::create_directories(m_root / "Mods");
    }

    ~TempMods() {
        std::error_code ec;
        fs::remove_all(m_root, ec);
    }

    [[nodiscard]] fs::path mods() const { return m_root / "Mods"; }

    void write(const std::string& relative, const std::string& text) const {
        write_file(mods() / relative, text);
    }

    [[nodiscard]] modkit_core::LoaderConfig config() const {
        modkit_core::LoaderConfig cfg;
        cfg.mods_directory = mods();
        return cfg;
    }

private:
    fs::path m_root;
};

struct RecordingScript : ScriptInstance {
    std::string path;
    std::string mod_id;
    int* unload_count = nullptr;

    std::string type_name() const override { return "RecordingScript"; }

    modkit_core::Result<void> on_unload() override {
        ++*unload_count;
        return modkit_core::Ok();
    }
};

class RecordingHost : public ScriptHost {
public:
    std::shared_ptr<ScriptInstance> load_script(const fs::path& relative_path) override {
        loaded.push_back(relative_path.generic_string());
        if (relative_path.filename() == "fails.lua") {
            return nullptr;
        }
        auto script = std::make_shared<RecordingScript>();
        script->path = relative_path.generic_string();
        script->unload_count = &unload_count;
        return script;
    }

    void initialize_script(ScriptInstance& instance, const ScriptContext& context) override {
        static_cast<RecordingScript&>(instance).mod_id = context.mod_id;
        initialized.push_back(context.mod_id);
    }

    std::vector<std::string> loaded;
    std::vector<std::string> initialized;
    int unload_count = 0;
};

Document base_guard() {
    return Document::parse(R"({"name":"Guard","stats":{"hp":100},"tags":["npc"]})").value();
}

} // anonymous namespace

TEST_CASE("ModLoader with no mods", "[mod][loader]") {
    SECTION("missing root is created") {
        auto root = fs::temp_directory_path() / "modkit_test_loader_create";
        fs::remove_all(root);

        modkit_core::LoaderConfig cfg;
        cfg.mods_directory = root / "Mods";
        DocumentStore store;
        ModLoader loader(cfg, store);

        auto result = loader.load_all();
        REQUIRE(result);
        REQUIRE(*result == 0);
        REQUIRE(fs::is_directory(root / "Mods"));
        fs::remove_all(root);
    }

    SECTION("missing root is left alone when configured") {
        auto root = fs::temp_directory_path() / "modkit_test_loader_nocreate";
        fs::remove_all(root);

        modkit_core::LoaderConfig cfg;
        cfg.mods_directory = root / "Mods";
        cfg.create_missing_mods_directory = false;
        DocumentStore store;
        ModLoader loader(cfg, store);

        REQUIRE(*loader.load_all() == 0);
        REQUIRE_FALSE(fs::exists(root / "Mods"));
    }

    SECTION("directories without manifests are skipped") {
        TempMods temp("modkit_test_loader_empty");
        temp.write("not_a_mod/readme.txt", "hello");
        DocumentStore store;
        ModLoader loader(temp.config(), store);

        REQUIRE(loader.discover_mods().empty());
        REQUIRE(*loader.load_all() == 0);
        REQUIRE(loader.load_order().empty());
    }
}

TEST_CASE("ModLoader discovery", "[mod][loader]") {
    TempMods temp("modkit_test_loader_discover");
    temp.write("b_mod/mod.json", R"({"id":"b","name":"B","version":"1.0.0"})");
    temp.write("a_mod/mod.json", R"({"id":"a","name":"A","version":"1.0.0"})");
    temp.write("broken/mod.json", R"({"id":"broken","name":"Broken"})");
    temp.write("custom/About.json", R"({"id":"custom","name":"Custom","version":"1.0.0"})");

    DocumentStore store;

    SECTION("sorted by directory, invalid manifests skipped") {
        ModLoader loader(temp.config(), store);
        auto manifests = loader.discover_mods();
        REQUIRE(manifests.size() == 2);
        REQUIRE(manifests[0].id == "a");
        REQUIRE(manifests[1].id == "b");
        REQUIRE(manifests[0].directory == temp.mods() / "a_mod");
    }

    SECTION("manifest file name is configurable") {
        auto cfg = temp.config();
        cfg.manifest_file = "About.json";
        ModLoader loader(cfg, store);
        auto manifests = loader.discover_mods();
        REQUIRE(manifests.size() == 1);
        REQUIRE(manifests[0].id == "custom");
    }
}

TEST_CASE("ModLoader load order", "[mod][loader]") {
    TempMods temp("modkit_test_loader_order");
    DocumentStore store;

    SECTION("dependencies and priority") {
        temp.write("app/mod.json",
            R"({"id":"app","name":"App","version":"1.0.0","dependencies":["lib >= 1.0.0"],"priority":-10})");
        temp.write("lib/mod.json", R"({"id":"lib","name":"Lib","version":"1.2.0","priority":50})");
        temp.write("zeta/mod.json", R"({"id":"zeta","name":"Zeta","version":"1.0.0","priority":-20})");

        ModLoader loader(temp.config(), store);
        auto result = loader.load_all();
        REQUIRE(result);
        REQUIRE(*result == 3);
        REQUIRE(loader.load_order() == std::vector<std::string>{"zeta", "lib", "app"});
        REQUIRE(loader.is_loaded("app"));
        REQUIRE(loader.get_manifest("lib")->version == "1.2.0");
        REQUIRE(loader.loaded_mods().size() == 3);
    }

    SECTION("resolution failure aborts loading") {
        temp.write("a/mod.json", R"({"id":"A","name":"A","version":"1.0.0","dependencies":["B"]})");
        temp.write("b/mod.json", R"({"id":"B","name":"B","version":"1.0.0","dependencies":["A"]})");

        ModLoader loader(temp.config(), store);
        auto result = loader.load_all();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::DependencyCycle);
        REQUIRE(loader.loaded_mods().empty());
    }

    SECTION("version mismatch aborts loading") {
        temp.write("app/mod.json",
            R"({"id":"app","name":"App","version":"1.0.0","dependencies":["lib >= 2.0.0"]})");
        temp.write("lib/mod.json", R"({"id":"lib","name":"Lib","version":"1.2.0"})");

        ModLoader loader(temp.config(), store);
        auto result = loader.load_all();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IncompatibleVersion);
    }

    SECTION("duplicate ids load once") {
        temp.write("first/mod.json", R"({"id":"dup","name":"First","version":"1.0.0"})");
        temp.write("second/mod.json", R"({"id":"dup","name":"Second","version":"2.0.0"})");

        std::ostringstream out;
        auto logger = modkit_core::mod_logger();
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        sink->set_pattern("%v");
        logger->sinks().push_back(sink);

        ModLoader loader(temp.config(), store);
        auto result = loader.load_all();
        logger->flush();
        logger->sinks().pop_back();

        REQUIRE(result);
        REQUIRE(*result == 1);
        REQUIRE(loader.load_order() == std::vector<std::string>{"dup"});
        REQUIRE(loader.get_manifest("dup")->name == "First");

        std::string text = out.str();
        auto event = text.find("duplicate_mod_skipped");
        REQUIRE(event != std::string::npos);
        std::string line = text.substr(event, text.find('\n', event) - event);
        REQUIRE(line.find("id=\"dup\"") != std::string::npos);
        REQUIRE(line.find("kept_directory=\"" + (temp.mods() / "first").string() + "\"") != std::string::npos);
        REQUIRE(line.find("skipped_directory=\"" + (temp.mods() / "second").string() + "\"") != std::string::npos);
    }
}

TEST_CASE("ModLoader content and patches", "[mod][loader]") {
    TempMods temp("modkit_test_loader_patches");
    DocumentStore store;
    REQUIRE(store.add("Templates/npc_guard.json", base_guard()));

    temp.write("guards/mod.json", R"({
        "id": "guards", "name": "Guards", "version": "1.0.0",
        "patches": ["patches/bad.json", "patches/hp.json", "patches/missing_target.json", "patches/absent.json"],
        "contentFolders": {"Items": "Content/Items"}
    })");
    temp.write("guards/patches/bad.json", R"({
        "target": "Templates/npc_guard.json",
        "operations": [
            {"op": "add", "path": "/tags/-", "value": "elite"},
            {"op": "test", "path": "/name", "value": "Captain"},
            {"op": "add", "path": "/never", "value": true}
        ]
    })");
    temp.write("guards/patches/hp.json", R"({
        "target": "Templates/npc_guard.json",
        "operations": [{"op": "replace", "path": "/stats/hp", "value": 250}]
    })");
    temp.write("guards/patches/missing_target.json", R"({
        "target": "Templates/dragon.json",
        "operations": [{"op": "remove", "path": "/hp"}]
    })");
    temp.write("guards/Content/Items/halberd.json", R"({"damage":12})");

    ModLoader loader(temp.config(), store);
    REQUIRE(loader.load_all());

    SECTION("a failing patch does not stop later patches") {
        const auto* guard = store.get("Templates/npc_guard.json");
        REQUIRE(guard != nullptr);
        REQUIRE(guard->dump() == R"({"name":"Guard","stats":{"hp":250},"tags":["npc","elite"]})");
    }

    SECTION("unreadable patch files are skipped") {
        REQUIRE(loader.get_patches("guards").size() == 3);
        REQUIRE(loader.get_patches("nobody").empty());
    }

    SECTION("content folders are loaded into the store") {
        REQUIRE(store.contains("Items/halberd.json"));
        REQUIRE(loader.get_content_folders("guards").at("Items") == temp.mods() / "guards" / "Content/Items");
        REQUIRE(loader.get_content_folder_path("guards", "Items").has_value());
        REQUIRE_FALSE(loader.get_content_folder_path("guards", "Sounds").has_value());
        REQUIRE_FALSE(loader.get_content_folder_path("nobody", "Items").has_value());
    }

    SECTION("reload re-applies patches") {
        REQUIRE(store.replace("Templates/npc_guard.json", base_guard()));
        REQUIRE(loader.reload("guards"));
        REQUIRE(store.get("Templates/npc_guard.json")->dump() ==
                R"({"name":"Guard","stats":{"hp":250},"tags":["npc","elite"]})");
        REQUIRE(loader.load_order() == std::vector<std::string>{"guards"});
    }
}

TEST_CASE("ModLoader scripts", "[mod][loader]") {
    TempMods temp("modkit_test_loader_scripts");
    temp.write("scripted/mod.json", R"({
        "id": "scripted", "name": "Scripted", "version": "1.0.0",
        "scripts": ["scripts/main.lua", "scripts/fails.lua", "scripts/missing.lua"]
    })");
    temp.write("scripted/scripts/main.lua", "-- main");
    temp.write("scripted/scripts/fails.lua", "-- fails");

    DocumentStore store;

    SECTION("scripts are loaded, initialized and unloaded") {
        RecordingHost host;
        ModLoader loader(temp.config(), store, &host);
        REQUIRE(loader.load_all());

        REQUIRE(host.loaded == std::vector<std::string>{"scripted/scripts/main.lua", "scripted/scripts/fails.lua"});
        REQUIRE(host.initialized == std::vector<std::string>{"scripted"});

        REQUIRE(loader.unload("scripted"));
        REQUIRE(host.unload_count == 1);
        REQUIRE_FALSE(loader.is_loaded("scripted"));
        REQUIRE(loader.get_manifest("scripted") == nullptr);
        REQUIRE(loader.load_order().empty());
    }

    SECTION("reload tears down and recreates scripts") {
        RecordingHost host;
        ModLoader loader(temp.config(), store, &host);
        REQUIRE(loader.load_all());

        REQUIRE(loader.reload("scripted"));
        REQUIRE(host.unload_count == 1);
        REQUIRE(host.initialized.size() == 2);
        REQUIRE(loader.is_loaded("scripted"));
    }

    SECTION("without a host scripts are skipped") {
        ModLoader loader(temp.config(), store);
        REQUIRE(loader.load_all());
        REQUIRE(loader.is_loaded("scripted"));
    }

    SECTION("unload and reload of unknown mods") {
        ModLoader loader(temp.config(), store);
        auto unloaded = loader.unload("ghost");
        REQUIRE(unloaded.is_err());
        REQUIRE(unloaded.error().code() == ErrorCode::NotFound);
        REQUIRE(loader.reload("ghost").is_err());
    }
}
