#pragma once

#include "TextProcessingTypes.hpp"

#include <cstddef>
#include <string>

namespace processing
{

class IAnalysisBackend;

class Summarizer
{
public:
    /// Extractive summary of at most max_sentences sentences in reading order.
    /// When the input has no more sentences than requested, original_text is
    /// returned untouched. max_sentences must be >= 1 (checked by the caller).
    [[nodiscard]] text_processing::SummaryResult summarize(const IAnalysisBackend& backend,
                                                           const std::string& original_text,
                                                           std::size_t max_sentences) const;
};

} // namespace processing
