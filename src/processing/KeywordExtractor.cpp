#include "KeywordExtractor.hpp"
#include "IAnalysisBackend.hpp"
#include "LexicalResources.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace processing
{

using text_processing::PartOfSpeech;

KeywordExtractor::KeywordExtractor(std::shared_ptr<const LexicalResources> resources)
    : resources_(std::move(resources))
{
    if (!resources_)
        throw std::invalid_argument("KeywordExtractor requires lexical resources");
}

text_processing::KeywordReport KeywordExtractor::extract(const std::string& text, const IAnalysisBackend& backend) const
{
    text_processing::KeywordReport report;
    report.mode = backend.mode();
    report.top_words = mostCommon(contentWords(text), kTopCount);

    if (backend.mode() != text_processing::AnalysisMode::FullAnnotation)
        return report;

    std::vector<std::string> nouns;
    std::vector<std::string> verbs;
    for (const auto& sentence : backend.sentences())
    {
        for (const auto& token : sentence.tokens)
        {
            if (token.pos == PartOfSpeech::Noun)
                nouns.push_back(token.text);
            else if (token.pos == PartOfSpeech::Verb)
                verbs.push_back(token.text);
        }
    }
    report.nouns = mostCommon(nouns, kTopCount);
    report.verbs = mostCommon(verbs, kTopCount);
    return report;
}

std::vector<std::string> KeywordExtractor::contentWords(const std::string& text) const
{
    std::vector<std::string> words;
    for (auto& word : wordTokens(foldCase(text)))
    {
        if (codepointLength(word) < kMinWordLength)
            continue;
        if (resources_->isStopword(word))
            continue;
        words.push_back(std::move(word));
    }
    return words;
}

std::vector<text_processing::WordCount> KeywordExtractor::mostCommon(const std::vector<std::string>& words,
                                                                     std::size_t limit)
{
    std::vector<text_processing::WordCount> counts;
    std::unordered_map<std::string, std::size_t> position;
    for (const auto& word : words)
    {
        auto it = position.find(word);
        if (it == position.end())
        {
            position.emplace(word, counts.size());
            counts.emplace_back(word, 1);
        }
        else
        {
            ++counts[it->second].second;
        }
    }

    // counts is in first-occurrence order, so a stable sort keeps that order for ties
    std::stable_sort(counts.begin(), counts.end(),
                     [](const text_processing::WordCount& a, const text_processing::WordCount& b)
                     {
                         return a.second > b.second;
                     });
    if (counts.size() > limit)
        counts.resize(limit);
    return counts;
}

} // namespace processing
