#pragma once

#include "IAnnotator.hpp"

#include <memory>
#include <string>

namespace processing
{

/// Annotation adapter over a document already annotated by an external tagger
/// and exported as JSON:
///   { "text": "...", "sentences": [ { "text": "...", "tokens": [
///       { "text": "lo", "lemma": "el", "pos": "DET" } ] } ] }
/// "index" fields are optional and validated later when present.
class JsonAnnotator : public IAnnotator
{
public:
    JsonAnnotator(std::string source_text, text_processing::Document document);

    static std::unique_ptr<JsonAnnotator> fromString(const std::string& json_text, std::string& error);
    static std::unique_ptr<JsonAnnotator> fromFile(const std::string& path, std::string& error);

    [[nodiscard]] const std::string& sourceText() const noexcept { return source_text_; }

    // Returns the imported document only for the text it was produced from.
    std::optional<text_processing::Document> annotate(const std::string& text) const override;

private:
    std::string source_text_;
    text_processing::Document document_;
};

} // namespace processing
