#pragma once

#include "IAnalysisBackend.hpp"

#include <memory>

namespace processing
{

class LexicalResources;

/// Backend over a validated annotator document: POS-based noun counts and the
/// full correction rule set.
class FullAnnotationBackend : public IAnalysisBackend
{
public:
    FullAnnotationBackend(text_processing::Document document, std::shared_ptr<const LexicalResources> resources);

    [[nodiscard]] text_processing::AnalysisMode mode() const noexcept override;
    [[nodiscard]] const std::vector<text_processing::Sentence>& sentences() const noexcept override;
    [[nodiscard]] std::size_t nounCount(const text_processing::Sentence& sentence) const override;
    [[nodiscard]] std::string correct() const override;
    [[nodiscard]] std::optional<std::string> lemmatize() const override;

private:
    text_processing::Document document_;
    std::shared_ptr<const LexicalResources> resources_;
};

} // namespace processing
