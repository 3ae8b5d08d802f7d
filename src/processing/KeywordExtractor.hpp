#pragma once

#include "TextProcessingTypes.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace processing
{

class IAnalysisBackend;
class LexicalResources;

class KeywordExtractor
{
public:
    static constexpr std::size_t kTopCount = 5;
    static constexpr std::size_t kMinWordLength = 3;

    explicit KeywordExtractor(std::shared_ptr<const LexicalResources> resources);

    /// Frequent content words of text plus, with full annotation, the most
    /// frequent nouns and verbs. Lists are ordered by count, then first occurrence.
    [[nodiscard]] text_processing::KeywordReport extract(const std::string& text,
                                                         const IAnalysisBackend& backend) const;

    /// Lowercased word tokens minus stopwords and words shorter than kMinWordLength.
    [[nodiscard]] std::vector<std::string> contentWords(const std::string& text) const;

    [[nodiscard]] static std::vector<text_processing::WordCount> mostCommon(const std::vector<std::string>& words,
                                                                            std::size_t limit);

private:
    std::shared_ptr<const LexicalResources> resources_;
};

} // namespace processing
