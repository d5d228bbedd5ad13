#include <catch2/catch_test_macros.hpp>
#include "config/ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

namespace {

std::string writeConfig(const std::string& name, const std::string& content) {
    auto path = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream(path) << content;
    return path;
}

}  // namespace

TEST_CASE("ConfigManager dispatches sections", "[config]") {
    utils::ErrorReporter::ClearErrors();

    SECTION("Registered sections receive their tables") {
        auto path = writeConfig("docxlate_test_config.toml", R"(
            [translator]
            backend = "dashscope"
            api_key = "sk-1"

            [logging]
            level = 5
        )");

        ConfigManager config(path);
        std::string backend;
        std::int64_t level = 0;
        REQUIRE(config.registerTable("translator", { .load = [&](const toml::table& t) {
                                         backend = t["backend"].value_or(std::string());
                                     } },
                                     { "backend", "api_key" }));
        REQUIRE(config.registerTable("logging", { .load = [&](const toml::table& t) {
                                         level = t["level"].value_or(std::int64_t{ 0 });
                                     } },
                                     { "level" }));

        REQUIRE(config.load());
        REQUIRE(backend == "dashscope");
        REQUIRE(level == 5);
        std::filesystem::remove(path);
    }

    SECTION("Missing file falls back to empty tables") {
        ConfigManager config("/nonexistent/docxlate/config.toml");
        bool called = false;
        std::size_t keys = 1;
        config.registerTable("translator", { .load = [&](const toml::table& t) {
                                 called = true;
                                 keys = t.size();
                             } },
                             { "backend" });
        REQUIRE(config.load());
        REQUIRE(called);
        REQUIRE(keys == 0);
    }

    SECTION("Parse errors are reported") {
        auto path = writeConfig("docxlate_test_broken.toml", "[translator\nbackend = ");
        ConfigManager config(path);
        bool called = false;
        config.registerTable("translator", { .load = [&](const toml::table&) { called = true; } }, { "backend" });

        REQUIRE_FALSE(config.load());
        REQUIRE(called);
        REQUIRE(std::string(config.lastError()).rfind("config parse error: ", 0) == 0);
        REQUIRE(utils::ErrorReporter::HasPendingErrors());
        auto reports = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(reports.back().category == utils::ErrorCategory::Configuration);
        std::filesystem::remove(path);
    }

    SECTION("Duplicate key ownership is rejected") {
        ConfigManager config("unused.toml");
        REQUIRE(config.registerTable("translator", { .load = [](const toml::table&) {} }, { "backend" }));
        REQUIRE_FALSE(config.registerTable("translator", { .load = [](const toml::table&) {} }, { "backend" }));
        REQUIRE(std::string(config.lastError()).find("Duplicate ownership") != std::string::npos);
    }

    SECTION("Nested paths resolve") {
        auto path = writeConfig("docxlate_test_nested.toml", R"(
            [translator.dashscope]
            model = "qwen-max"
        )");
        ConfigManager config(path);
        std::string model;
        config.registerTable("translator.dashscope", { .load = [&](const toml::table& t) {
                                 model = t["model"].value_or(std::string());
                             } },
                             { "model" });
        REQUIRE(config.load());
        REQUIRE(model == "qwen-max");
        std::filesystem::remove(path);
    }
}
