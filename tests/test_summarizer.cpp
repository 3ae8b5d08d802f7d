#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "processing/FullAnnotationBackend.hpp"
#include "processing/HeuristicFallbackBackend.hpp"
#include "processing/LexicalResources.hpp"
#include "processing/SentenceScorer.hpp"
#include "processing/Summarizer.hpp"
#include "utils/document_builder.hpp"

using namespace processing;
using text_processing::AnalysisMode;
using text_processing::Document;
using text_processing::PartOfSpeech;
using text_processing::ScoredSentence;
using test_utils::makeSentence;
using Catch::Matchers::WithinAbs;

namespace
{

constexpr auto N = PartOfSpeech::Noun;
constexpr auto V = PartOfSpeech::Verb;
constexpr auto D = PartOfSpeech::Determiner;

// Scores: s3 > s0 > s1 > s4 > s2
Document fiveSentenceDocument()
{
    Document doc;
    doc.sentences.push_back(makeSentence("El gato duerme.", { { "El", "el", D }, { "gato", "gato", N },
                                                              { "duerme", "dormir", V }, { "." } }, 0));
    doc.sentences.push_back(makeSentence("La lluvia cae.", { { "La", "el", D }, { "lluvia", "lluvia", N },
                                                             { "cae", "caer", V }, { "." } }, 1));
    doc.sentences.push_back(makeSentence("Nada más.", { { "Nada" }, { "más" }, { "." } }, 2));
    doc.sentences.push_back(makeSentence("El perro, la casa y el jardín brillan.",
                                         { { "El", "el", D }, { "perro", "perro", N }, { "," },
                                           { "la", "el", D }, { "casa", "casa", N }, { "y" },
                                           { "el", "el", D }, { "jardín", "jardín", N },
                                           { "brillan", "brillar", V }, { "." } }, 3));
    doc.sentences.push_back(makeSentence("Y ya.", { { "Y" }, { "ya" }, { "." } }, 4));
    return doc;
}

const std::string kFiveSentenceText =
    "El gato duerme. La lluvia cae. Nada más. El perro, la casa y el jardín brillan. Y ya.";

} // namespace

TEST_CASE("SentenceScorer formula", "[summarizer][scorer]")
{
    FullAnnotationBackend backend(fiveSentenceDocument(), LexicalResources::createDefault());
    SentenceScorer scorer(backend);
    const auto& sentences = backend.sentences();

    SECTION("First sentence gets the position bonus")
    {
        // 1 noun, 15 code points, +1 bonus
        REQUIRE_THAT(scorer.score(sentences[0]), WithinAbs(1.0 - 15.0 / 200.0 + 1.0, 1e-9));
    }

    SECTION("Nouns add one point each, length subtracts")
    {
        REQUIRE_THAT(scorer.score(sentences[3]), WithinAbs(3.0 - 38.0 / 200.0, 1e-9));
        REQUIRE_THAT(scorer.score(sentences[2]), WithinAbs(-9.0 / 200.0, 1e-9));
    }

    SECTION("Length counts code points, not bytes")
    {
        Document doc;
        doc.sentences.push_back(makeSentence("x", { { "x" } }, 0));
        doc.sentences.push_back(makeSentence("ñandú", { { "ñandú", "ñandú", N } }, 1));
        FullAnnotationBackend accented(doc, LexicalResources::createDefault());
        SentenceScorer accented_scorer(accented);
        REQUIRE_THAT(accented_scorer.score(accented.sentences()[1]), WithinAbs(1.0 - 5.0 / 200.0, 1e-9));
    }
}

TEST_CASE("SentenceScorer ranking", "[summarizer][scorer]")
{
    SECTION("Descending by score")
    {
        auto ranked = SentenceScorer::rank({ { 0, 0.5 }, { 1, 2.0 }, { 2, 1.0 } });
        REQUIRE(ranked[0].sentence_index == 1);
        REQUIRE(ranked[1].sentence_index == 2);
        REQUIRE(ranked[2].sentence_index == 0);
    }

    SECTION("Ties keep ascending position")
    {
        auto ranked = SentenceScorer::rank({ { 3, 1.0 }, { 1, 1.0 }, { 2, 1.0 } });
        REQUIRE(ranked[0].sentence_index == 1);
        REQUIRE(ranked[1].sentence_index == 2);
        REQUIRE(ranked[2].sentence_index == 3);
    }
}

TEST_CASE("Summarizer selects top sentences in document order", "[summarizer]")
{
    FullAnnotationBackend backend(fiveSentenceDocument(), LexicalResources::createDefault());
    Summarizer summarizer;

    SECTION("Two best sentences, original order")
    {
        auto summary = summarizer.summarize(backend, kFiveSentenceText, 2);
        REQUIRE_FALSE(summary.short_circuited);
        REQUIRE(summary.total_sentences == 5);
        REQUIRE(summary.selected_indices == std::vector<std::size_t>{ 0, 3 });
        REQUIRE(summary.text == "El gato duerme. El perro, la casa y el jardín brillan.");
        REQUIRE(summary.mode == AnalysisMode::FullAnnotation);
    }

    SECTION("Three best sentences")
    {
        auto summary = summarizer.summarize(backend, kFiveSentenceText, 3);
        REQUIRE(summary.selected_indices == std::vector<std::size_t>{ 0, 1, 3 });
        REQUIRE(summary.text == "El gato duerme. La lluvia cae. El perro, la casa y el jardín brillan.");
    }

    SECTION("Output never exceeds the requested count")
    {
        for (std::size_t max = 1; max <= 4; ++max)
        {
            auto summary = summarizer.summarize(backend, kFiveSentenceText, max);
            REQUIRE(summary.selected_indices.size() == max);
            for (std::size_t i = 1; i < summary.selected_indices.size(); ++i)
                REQUIRE(summary.selected_indices[i - 1] < summary.selected_indices[i]);
        }
    }
}

TEST_CASE("Summarizer short-circuits small inputs", "[summarizer]")
{
    Document doc;
    doc.sentences.push_back(makeSentence("Hola mundo.", { { "Hola" }, { "mundo", "mundo", N }, { "." } }, 0));
    doc.sentences.push_back(makeSentence("Adiós.", { { "Adiós" }, { "." } }, 1));
    FullAnnotationBackend backend(doc, LexicalResources::createDefault());

    const std::string original = "  Hola mundo.   Adiós.  ";
    auto summary = Summarizer().summarize(backend, original, 3);
    REQUIRE(summary.short_circuited);
    REQUIRE(summary.text == original);
    REQUIRE(summary.selected_indices.empty());
    REQUIRE(summary.total_sentences == 2);

    SECTION("Equal count also returns the original")
    {
        auto equal = Summarizer().summarize(backend, original, 2);
        REQUIRE(equal.short_circuited);
        REQUIRE(equal.text == original);
    }
}

TEST_CASE("Summarizer heuristic fallback", "[summarizer][fallback]")
{
    const std::string text = "Uno dos. La casa grande y bonita del pueblo. Tres.";
    HeuristicFallbackBackend backend(text);

    SECTION("Splits on periods and drops empty fragments")
    {
        const auto& sentences = backend.sentences();
        REQUIRE(sentences.size() == 3);
        REQUIRE(sentences[0].text == "Uno dos");
        REQUIRE(sentences[1].text == "La casa grande y bonita del pueblo");
        REQUIRE(sentences[2].text == "Tres");
        REQUIRE(sentences[2].index == 2);
    }

    SECTION("Words of three or more characters count as nouns")
    {
        REQUIRE(backend.nounCount(backend.sentences()[1]) == 5);
    }

    SECTION("Selected fragments are joined without periods")
    {
        auto summary = Summarizer().summarize(backend, text, 1);
        REQUIRE(summary.mode == AnalysisMode::HeuristicFallback);
        REQUIRE(summary.text == "La casa grande y bonita del pueblo");
    }

    SECTION("Consecutive periods")
    {
        HeuristicFallbackBackend dotted("Hola... Adiós.");
        REQUIRE(dotted.sentences().size() == 2);
    }
}
