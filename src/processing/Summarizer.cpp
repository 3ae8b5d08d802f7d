#include "Summarizer.hpp"
#include "IAnalysisBackend.hpp"
#include "SentenceScorer.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace processing
{

text_processing::SummaryResult Summarizer::summarize(const IAnalysisBackend& backend, const std::string& original_text,
                                                     std::size_t max_sentences) const
{
    text_processing::SummaryResult summary;
    summary.mode = backend.mode();

    const auto& sentences = backend.sentences();
    summary.total_sentences = sentences.size();

    if (sentences.size() <= max_sentences)
    {
        summary.text = original_text;
        summary.short_circuited = true;
        return summary;
    }

    SentenceScorer scorer(backend);
    auto ranked = SentenceScorer::rank(scorer.scoreAll());
    ranked.resize(max_sentences);

    for (const auto& entry : ranked)
        summary.selected_indices.push_back(entry.sentence_index);
    // Selection order is by score, output order is by position
    std::sort(summary.selected_indices.begin(), summary.selected_indices.end());

    std::vector<std::string> parts;
    parts.reserve(summary.selected_indices.size());
    for (std::size_t index : summary.selected_indices)
        parts.push_back(trim(sentences[index].text));

    summary.text = joinWords(parts);
    return summary;
}

} // namespace processing
