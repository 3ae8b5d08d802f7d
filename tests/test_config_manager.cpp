#include <catch2/catch_test_macros.hpp>

#include "config/AppConfig.hpp"
#include "config/ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace
{

class TempConfig
{
public:
    explicit TempConfig(const std::string& content)
        : path_("test_temp_config.toml")
    {
        std::ofstream file(path_);
        file << content;
    }

    ~TempConfig()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

TEST_CASE("ConfigManager uses defaults without a file", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    AppConfig config;
    ConfigManager manager("no_such_config.toml");
    REQUIRE(registerAppConfigTables(manager, config));
    REQUIRE(manager.load());
    REQUIRE_FALSE(manager.fileFound());

    REQUIRE(config.logging.level == 4);
    REQUIRE(config.logging.append);
    REQUIRE(config.diagnostics.max_preview == 160);
    REQUIRE(config.resources.directory == "assets/lexicon");
    REQUIRE(config.resources.language == "es");
    REQUIRE(config.summary.max_sentences == 3);
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
}

TEST_CASE("ConfigManager reads every table", "[config]")
{
    TempConfig file(R"(
[logging]
level = 6
append = false
console = true
directory = "out/logs"

[diagnostics]
verbose = true
max_preview = 40

[resources]
directory = "lexicon"
language = "ca"

[summary]
max_sentences = 5
)");

    AppConfig config;
    ConfigManager manager(file.path());
    registerAppConfigTables(manager, config);
    REQUIRE(manager.load());
    REQUIRE(manager.fileFound());

    REQUIRE(config.logging.level == 6);
    REQUIRE_FALSE(config.logging.append);
    REQUIRE(config.logging.console);
    REQUIRE(config.logging.directory == "out/logs");
    REQUIRE(config.diagnostics.verbose);
    REQUIRE(config.diagnostics.max_preview == 40);
    REQUIRE(config.resources.directory == "lexicon");
    REQUIRE(config.resources.language == "ca");
    REQUIRE(config.summary.max_sentences == 5);
}

TEST_CASE("ConfigManager keeps defaults for bad values", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    SECTION("Out-of-range numbers")
    {
        TempConfig file("[summary]\nmax_sentences = 0\n[logging]\nlevel = 9\n");
        AppConfig config;
        ConfigManager manager(file.path());
        registerAppConfigTables(manager, config);
        REQUIRE(manager.load());

        REQUIRE(config.summary.max_sentences == 3);
        REQUIRE(config.logging.level == 4);
        REQUIRE(utils::ErrorReporter::GetPendingErrors().size() == 2);
    }

    SECTION("Parse error")
    {
        TempConfig file("[summary\nmax_sentences = 2\n");
        AppConfig config;
        ConfigManager manager(file.path());
        registerAppConfigTables(manager, config);
        REQUIRE_FALSE(manager.load());
        REQUIRE(std::string(manager.lastError()).find("parse error") != std::string::npos);
        REQUIRE(config.summary.max_sentences == 3);

        auto last = utils::ErrorReporter::GetLastError();
        REQUIRE(last.category == utils::ErrorCategory::Configuration);
        utils::ErrorReporter::ClearErrors();
    }

    SECTION("Wrong types are ignored")
    {
        TempConfig file("[summary]\nmax_sentences = \"many\"\n");
        AppConfig config;
        ConfigManager manager(file.path());
        registerAppConfigTables(manager, config);
        REQUIRE(manager.load());
        REQUIRE(config.summary.max_sentences == 3);
    }
}

TEST_CASE("ConfigManager table registration", "[config]")
{
    ConfigManager manager("no_such_config.toml");
    int calls = 0;
    REQUIRE(manager.registerTable("app.debug", { [&calls](const toml::table&) { ++calls; } }));
    REQUIRE_FALSE(manager.registerTable("app.debug", { [](const toml::table&) {} }));
    REQUIRE(manager.load());
    REQUIRE(calls == 1);
}
