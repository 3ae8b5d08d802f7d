#pragma once

#include "TextProcessingTypes.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace processing
{

/**
 * @brief One analysis path over a single input text.
 *
 * The pipeline picks the variant once per call: FullAnnotationBackend when the
 * annotator produced a valid document, HeuristicFallbackBackend otherwise.
 * Every result built from a backend carries its mode().
 */
class IAnalysisBackend
{
public:
    virtual ~IAnalysisBackend() = default;

    [[nodiscard]] virtual text_processing::AnalysisMode mode() const noexcept = 0;

    /// Sentences of the input, index 0..n-1, in reading order.
    [[nodiscard]] virtual const std::vector<text_processing::Sentence>& sentences() const noexcept = 0;

    /// Content-density estimate used by the sentence scorer.
    [[nodiscard]] virtual std::size_t nounCount(const text_processing::Sentence& sentence) const = 0;

    /// Corrected text for the whole input.
    [[nodiscard]] virtual std::string correct() const = 0;

    /// Space-joined lemmas, or std::nullopt when the path has no lemmatization.
    [[nodiscard]] virtual std::optional<std::string> lemmatize() const = 0;
};

} // namespace processing
