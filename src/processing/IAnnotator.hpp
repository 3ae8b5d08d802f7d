#pragma once

#include "TextProcessingTypes.hpp"

#include <optional>
#include <string>

namespace processing
{

/**
 * @brief Linguistic annotation capability (tokenization, POS tagging,
 * lemmatization, sentence segmentation) supplied from outside the core.
 *
 * Contract for implementations:
 * - sentences are non-overlapping, cover the input in order, and are non-empty
 * - tokens are in reading order with index 0..n-1 inside their sentence
 * - every token carries a lemma (its surface form when lemmatization is not meaningful)
 *
 * Latency is unbounded; any timeout policy belongs to the caller.
 */
class IAnnotator
{
public:
    virtual ~IAnnotator() = default;

    /**
     * @brief Annotate raw text.
     * @return The annotated document, or std::nullopt when annotation is unavailable
     */
    virtual std::optional<text_processing::Document> annotate(const std::string& text) const = 0;
};

} // namespace processing
