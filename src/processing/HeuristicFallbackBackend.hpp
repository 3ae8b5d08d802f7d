#pragma once

#include "IAnalysisBackend.hpp"

namespace processing
{

/// Backend used when no annotation is available. Deliberately cruder:
/// sentences are '.'-separated fragments, "nouns" are whitespace tokens longer
/// than two characters, and correction is limited to repetition removal.
class HeuristicFallbackBackend : public IAnalysisBackend
{
public:
    explicit HeuristicFallbackBackend(std::string text);

    [[nodiscard]] text_processing::AnalysisMode mode() const noexcept override;
    [[nodiscard]] const std::vector<text_processing::Sentence>& sentences() const noexcept override;
    [[nodiscard]] std::size_t nounCount(const text_processing::Sentence& sentence) const override;
    [[nodiscard]] std::string correct() const override;
    [[nodiscard]] std::optional<std::string> lemmatize() const override;

    /// Splits on '.', trims fragments and drops the empty ones. Tokens are the
    /// whitespace-separated words, tagged Other with the surface form as lemma.
    static std::vector<text_processing::Sentence> splitSentences(const std::string& text);

    static constexpr std::size_t kMinContentWordLength = 3;

private:
    std::string text_;
    std::vector<text_processing::Sentence> sentences_;
};

} // namespace processing
