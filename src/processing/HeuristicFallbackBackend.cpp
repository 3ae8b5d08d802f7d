#include "HeuristicFallbackBackend.hpp"
#include "CorrectionEngine.hpp"
#include "TextUtils.hpp"

#include <sstream>

namespace processing
{

HeuristicFallbackBackend::HeuristicFallbackBackend(std::string text)
    : text_(std::move(text))
    , sentences_(splitSentences(text_))
{
}

text_processing::AnalysisMode HeuristicFallbackBackend::mode() const noexcept
{
    return text_processing::AnalysisMode::HeuristicFallback;
}

const std::vector<text_processing::Sentence>& HeuristicFallbackBackend::sentences() const noexcept
{
    return sentences_;
}

std::size_t HeuristicFallbackBackend::nounCount(const text_processing::Sentence& sentence) const
{
    std::size_t count = 0;
    for (const auto& word : splitWhitespace(sentence.text))
    {
        if (codepointLength(word) >= kMinContentWordLength)
            ++count;
    }
    return count;
}

std::string HeuristicFallbackBackend::correct() const
{
    return CorrectionEngine::removeRepetitions(text_);
}

std::optional<std::string> HeuristicFallbackBackend::lemmatize() const
{
    return std::nullopt;
}

std::vector<text_processing::Sentence> HeuristicFallbackBackend::splitSentences(const std::string& text)
{
    std::vector<text_processing::Sentence> sentences;
    std::istringstream stream(text);
    std::string fragment;
    while (std::getline(stream, fragment, '.'))
    {
        std::string trimmed = trim(fragment);
        if (trimmed.empty())
            continue;

        text_processing::Sentence sentence;
        sentence.index = sentences.size();
        sentence.text = trimmed;
        for (const auto& word : splitWhitespace(trimmed))
        {
            text_processing::Token token;
            token.text = word;
            token.lemma = word;
            token.index = sentence.tokens.size();
            sentence.tokens.push_back(std::move(token));
        }
        sentences.push_back(std::move(sentence));
    }
    return sentences;
}

} // namespace processing
