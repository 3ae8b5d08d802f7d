#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "TextProcessingTypes.hpp"

namespace processing
{

class IAnnotator;
class LexicalResources;

/// Entry points used by the front end. Each call picks its analysis path once:
/// full annotation when the annotator returns a valid document, the heuristic
/// fallback otherwise. Calls share only read-only state and may run concurrently.
class TextPipeline
{
public:
    explicit TextPipeline(std::shared_ptr<const LexicalResources> resources,
                          std::shared_ptr<const IAnnotator> annotator = nullptr);
    ~TextPipeline();

    TextPipeline(const TextPipeline&) = delete;
    TextPipeline& operator=(const TextPipeline&) = delete;

    [[nodiscard]] text_processing::ProcessingResult<text_processing::NormalizationResult>
    normalize(const std::string& text) const;

    [[nodiscard]] text_processing::ProcessingResult<text_processing::SummaryResult>
    summarize(const std::string& text, std::size_t max_sentences) const;

    [[nodiscard]] text_processing::ProcessingResult<text_processing::KeywordReport>
    extractKeywords(const std::string& text) const;

    [[nodiscard]] text_processing::PatternMatches findPatterns(const std::string& text) const;

    // One task per document; results keep the input order.
    [[nodiscard]] std::vector<text_processing::ProcessingResult<text_processing::NormalizationResult>>
    normalizeBatch(const std::vector<std::string>& texts) const;

    [[nodiscard]] std::vector<text_processing::ProcessingResult<text_processing::SummaryResult>>
    summarizeBatch(const std::vector<std::string>& texts, std::size_t max_sentences) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace processing
