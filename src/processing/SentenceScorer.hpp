#pragma once

#include "TextProcessingTypes.hpp"

#include <vector>

namespace processing
{

class IAnalysisBackend;

/// score = nouns - length / 200 + (1 for the first sentence)
/// Length is counted in code points of the trimmed sentence text.
class SentenceScorer
{
public:
    static constexpr double kLengthPenaltyDivisor = 200.0;
    static constexpr double kFirstSentenceBonus = 1.0;

    explicit SentenceScorer(const IAnalysisBackend& backend);

    [[nodiscard]] double score(const text_processing::Sentence& sentence) const;

    /// One entry per backend sentence, in document order.
    [[nodiscard]] std::vector<text_processing::ScoredSentence> scoreAll() const;

    /// Highest score first; equal scores keep ascending sentence index.
    [[nodiscard]] static std::vector<text_processing::ScoredSentence> rank(
        std::vector<text_processing::ScoredSentence> scored);

private:
    const IAnalysisBackend& backend_;
};

} // namespace processing
