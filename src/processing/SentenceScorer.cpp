#include "SentenceScorer.hpp"
#include "IAnalysisBackend.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace processing
{

SentenceScorer::SentenceScorer(const IAnalysisBackend& backend)
    : backend_(backend)
{
}

double SentenceScorer::score(const text_processing::Sentence& sentence) const
{
    const double nouns = static_cast<double>(backend_.nounCount(sentence));
    const double length = static_cast<double>(codepointLength(trim(sentence.text)));

    double result = nouns - (length / kLengthPenaltyDivisor);
    if (sentence.index == 0)
        result += kFirstSentenceBonus;
    return result;
}

std::vector<text_processing::ScoredSentence> SentenceScorer::scoreAll() const
{
    std::vector<text_processing::ScoredSentence> scored;
    scored.reserve(backend_.sentences().size());
    for (const auto& sentence : backend_.sentences())
    {
        scored.push_back({ sentence.index, score(sentence) });
    }
    return scored;
}

std::vector<text_processing::ScoredSentence> SentenceScorer::rank(std::vector<text_processing::ScoredSentence> scored)
{
    std::stable_sort(scored.begin(), scored.end(),
                     [](const text_processing::ScoredSentence& a, const text_processing::ScoredSentence& b)
                     {
                         if (a.score != b.score)
                             return a.score > b.score;
                         return a.sentence_index < b.sentence_index;
                     });
    return scored;
}

} // namespace processing
