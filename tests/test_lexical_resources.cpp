#include <catch2/catch_test_macros.hpp>

#include "processing/LexicalResources.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

using namespace processing;

namespace fs = std::filesystem;

// Test fixture for a temporary lexicon directory
class TempLexicon
{
public:
    TempLexicon()
        : dir_("test_temp_lexicon")
    {
        fs::create_directories(dir_);
    }

    ~TempLexicon()
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& file_name, const std::string& content)
    {
        std::ofstream file(dir_ / file_name);
        file << content;
    }

    std::string path() const { return dir_.string(); }

private:
    fs::path dir_;
};

TEST_CASE("LexicalResources built-in tables", "[lexicon]")
{
    auto resources = LexicalResources::createDefault();

    SECTION("Corrections")
    {
        REQUIRE(resources->lookupCorrection("haiga") == std::optional<std::string>("haya"));
        REQUIRE(resources->lookupCorrection("nadien") == std::optional<std::string>("nadie"));
        REQUIRE_FALSE(resources->lookupCorrection("haber").has_value());
        REQUIRE_FALSE(resources->lookupCorrection("casa").has_value());
    }

    SECTION("Gendered nouns")
    {
        REQUIRE(resources->lookupGenderedNoun("niño") == std::optional<std::string>("el niño"));
        REQUIRE(resources->lookupGenderedNoun("gente") == std::optional<std::string>("la gente"));
        REQUIRE_FALSE(resources->lookupGenderedNoun("coche").has_value());
    }

    SECTION("Stopwords")
    {
        REQUIRE(resources->hasStopwords());
        REQUIRE(resources->isStopword("de"));
        REQUIRE(resources->isStopword("que"));
        REQUIRE_FALSE(resources->isStopword("gato"));
    }
}

TEST_CASE("LexicalResources folds keys on construction", "[lexicon]")
{
    LexicalResources resources({ { "HAIGA", "haya" } }, { { "Niño", "el niño" } }, { "DE" });
    REQUIRE(resources.lookupCorrection("haiga").has_value());
    REQUIRE(resources.lookupGenderedNoun("niño").has_value());
    REQUIRE(resources.isStopword("de"));
}

TEST_CASE("LexicalResources loads JSON overrides", "[lexicon][json]")
{
    utils::ErrorReporter::ClearErrors();
    TempLexicon lexicon;
    lexicon.write("corrections.json", R"({ "ke": "que", "haiga": "haya" })");
    lexicon.write("gendered_nouns.json", R"({ "perro": "el perro", "broken": 3 })");
    lexicon.write("stopwords_es.json", R"(["el", "la", "de"])");

    auto resources = LexicalResources::loadFromDirectory(lexicon.path(), "es");

    REQUIRE(resources->correctionCount() == 2);
    REQUIRE(resources->lookupCorrection("ke") == std::optional<std::string>("que"));
    REQUIRE_FALSE(resources->lookupCorrection("naiden").has_value());

    SECTION("Non-string entries are skipped")
    {
        REQUIRE(resources->genderedNounCount() == 1);
        REQUIRE(resources->lookupGenderedNoun("perro") == std::optional<std::string>("el perro"));
    }

    SECTION("Stopword list replaces the built-in one")
    {
        REQUIRE(resources->stopwordCount() == 3);
        REQUIRE_FALSE(resources->isStopword("que"));
    }
}

TEST_CASE("LexicalResources falls back to built-in tables", "[lexicon][json]")
{
    utils::ErrorReporter::ClearErrors();

    SECTION("Missing directory")
    {
        auto resources = LexicalResources::loadFromDirectory("does_not_exist_lexicon", "es");
        REQUIRE(resources->correctionCount() == LexicalResources::defaultCorrections().size());
        REQUIRE(resources->genderedNounCount() == LexicalResources::defaultGenderedNouns().size());
        REQUIRE(resources->hasStopwords());
    }

    SECTION("Invalid JSON is reported")
    {
        TempLexicon lexicon;
        lexicon.write("corrections.json", "{ not json");
        lexicon.write("gendered_nouns.json", R"(["not", "an", "object"])");

        auto resources = LexicalResources::loadFromDirectory(lexicon.path(), "es");
        REQUIRE(resources->lookupCorrection("haiga").has_value());
        REQUIRE(resources->lookupGenderedNoun("casa").has_value());

        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 2);
        for (const auto& error : errors)
            REQUIRE(error.category == utils::ErrorCategory::Resources);
    }

    SECTION("Unknown language has no stopwords")
    {
        auto resources = LexicalResources::loadFromDirectory("does_not_exist_lexicon", "xx");
        REQUIRE_FALSE(resources->hasStopwords());
        REQUIRE(utils::ErrorReporter::HasPendingErrors());
        utils::ErrorReporter::ClearErrors();
    }
}

#ifdef WORDCHEF_TEST_ASSETS_DIR
TEST_CASE("Shipped lexicon files load", "[lexicon][assets]")
{
    utils::ErrorReporter::ClearErrors();
    auto resources = LexicalResources::loadFromDirectory(WORDCHEF_TEST_ASSETS_DIR, "es");
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
    REQUIRE(resources->lookupCorrection("haiga") == std::optional<std::string>("haya"));
    REQUIRE(resources->lookupGenderedNoun("niño") == std::optional<std::string>("el niño"));
    REQUIRE(resources->stopwordCount() == LexicalResources::defaultStopwords("es").size());
}
#endif
