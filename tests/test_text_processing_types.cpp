#include <catch2/catch_test_macros.hpp>
#include <string>
#include <stdexcept>

#include "processing/Diagnostics.hpp"
#include "processing/StageRunner.hpp"
#include "processing/TextProcessingTypes.hpp"
#include "utils/ErrorReporter.hpp"

using namespace text_processing;

TEST_CASE("Part-of-speech tag mapping", "[types]")
{
    REQUIRE(partOfSpeechFromTag("NOUN") == PartOfSpeech::Noun);
    REQUIRE(partOfSpeechFromTag("noun") == PartOfSpeech::Noun);
    REQUIRE(partOfSpeechFromTag("VERB") == PartOfSpeech::Verb);
    REQUIRE(partOfSpeechFromTag("DET") == PartOfSpeech::Determiner);

    SECTION("Finer tags collapse to Other")
    {
        REQUIRE(partOfSpeechFromTag("PROPN") == PartOfSpeech::Other);
        REQUIRE(partOfSpeechFromTag("AUX") == PartOfSpeech::Other);
        REQUIRE(partOfSpeechFromTag("") == PartOfSpeech::Other);
    }
}

TEST_CASE("Type names", "[types]")
{
    REQUIRE(std::string(toString(PartOfSpeech::Determiner)) == "DET");
    REQUIRE(std::string(toString(AnalysisMode::HeuristicFallback)) == "heuristic_fallback");
    REQUIRE(std::string(toString(ErrorCode::MalformedAnnotation)) == "MalformedAnnotation");
}

TEST_CASE("ProcessingResult", "[types]")
{
    auto ok = ProcessingResult<int>::success(7);
    REQUIRE(ok.ok());
    REQUIRE(*ok.value == 7);
    REQUIRE_FALSE(ok.error.has_value());

    auto failed = ProcessingResult<int>::failure(ErrorCode::InvalidArgument, "bad");
    REQUIRE_FALSE(failed.ok());
    REQUIRE(failed.error == ErrorCode::InvalidArgument);
    REQUIRE(failed.message == "bad");
}

TEST_CASE("run_stage wraps stage callables", "[types][stage]")
{
    utils::ErrorReporter::ClearErrors();

    SECTION("Success carries the payload")
    {
        auto stage = processing::run_stage<std::string>("upper", []() { return std::string("HOLA"); });
        REQUIRE(stage.succeeded);
        REQUIRE(stage.result == "HOLA");
        REQUIRE(stage.stage_name == "upper");
        REQUIRE(stage.duration.count() >= 0);
    }

    SECTION("Exceptions become failed results")
    {
        auto stage = processing::run_stage<int>("explode", []() -> int { throw std::runtime_error("boom"); });
        REQUIRE_FALSE(stage.succeeded);
        REQUIRE(stage.error == std::optional<std::string>("boom"));

        auto last = utils::ErrorReporter::GetLastError();
        REQUIRE(last.category == utils::ErrorCategory::Processing);
        REQUIRE(last.technical_details == "explode: boom");
        utils::ErrorReporter::ClearErrors();
    }
}

TEST_CASE("Diagnostics previews", "[diagnostics]")
{
    const std::size_t saved = processing::Diagnostics::MaxPreview();

    SECTION("Short text is kept with control characters escaped")
    {
        processing::Diagnostics::SetMaxPreview(160);
        REQUIRE(processing::Diagnostics::Preview("a\nb\tc") == "a\\nb\\tc");
    }

    SECTION("Long text is cut on a code point boundary")
    {
        processing::Diagnostics::SetMaxPreview(3);
        REQUIRE(processing::Diagnostics::Preview("ñañaña") == "ñañ... (12 bytes)");
    }

    SECTION("Invalid bytes are cut one at a time")
    {
        processing::Diagnostics::SetMaxPreview(2);
        REQUIRE(processing::Diagnostics::Preview("\xFFñx") == "\xFFñ... (4 bytes)");
    }

    processing::Diagnostics::SetMaxPreview(saved);
}
