#include "TextProcessingTypes.hpp"

#include <algorithm>
#include <cctype>

namespace text_processing
{

const char* toString(PartOfSpeech pos) noexcept
{
    switch (pos)
    {
    case PartOfSpeech::Noun:
        return "NOUN";
    case PartOfSpeech::Verb:
        return "VERB";
    case PartOfSpeech::Determiner:
        return "DET";
    case PartOfSpeech::Other:
        return "OTHER";
    }
    return "OTHER";
}

const char* toString(AnalysisMode mode) noexcept
{
    switch (mode)
    {
    case AnalysisMode::FullAnnotation:
        return "full_annotation";
    case AnalysisMode::HeuristicFallback:
        return "heuristic_fallback";
    }
    return "unknown";
}

const char* toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::EmptyInput:
        return "EmptyInput";
    case ErrorCode::InvalidArgument:
        return "InvalidArgument";
    case ErrorCode::MalformedAnnotation:
        return "MalformedAnnotation";
    case ErrorCode::StageFailed:
        return "StageFailed";
    }
    return "Unknown";
}

PartOfSpeech partOfSpeechFromTag(const std::string& tag)
{
    std::string upper = tag;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "NOUN" || upper == "N" || upper == "NC")
        return PartOfSpeech::Noun;
    if (upper == "VERB" || upper == "V")
        return PartOfSpeech::Verb;
    if (upper == "DET" || upper == "DT" || upper == "D")
        return PartOfSpeech::Determiner;
    return PartOfSpeech::Other;
}

} // namespace text_processing
