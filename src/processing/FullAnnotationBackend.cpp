#include "FullAnnotationBackend.hpp"
#include "CorrectionEngine.hpp"
#include "LexicalResources.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace processing
{

using text_processing::PartOfSpeech;

FullAnnotationBackend::FullAnnotationBackend(text_processing::Document document,
                                             std::shared_ptr<const LexicalResources> resources)
    : document_(std::move(document))
    , resources_(std::move(resources))
{
}

text_processing::AnalysisMode FullAnnotationBackend::mode() const noexcept
{
    return text_processing::AnalysisMode::FullAnnotation;
}

const std::vector<text_processing::Sentence>& FullAnnotationBackend::sentences() const noexcept
{
    return document_.sentences;
}

std::size_t FullAnnotationBackend::nounCount(const text_processing::Sentence& sentence) const
{
    return static_cast<std::size_t>(std::count_if(sentence.tokens.begin(), sentence.tokens.end(),
                                                  [](const text_processing::Token& token)
                                                  {
                                                      return token.pos == PartOfSpeech::Noun;
                                                  }));
}

std::string FullAnnotationBackend::correct() const
{
    // Rules look across sentence boundaries, as the token stream is read left to right
    std::vector<text_processing::Token> stream;
    for (const auto& sentence : document_.sentences)
        stream.insert(stream.end(), sentence.tokens.begin(), sentence.tokens.end());

    CorrectionEngine engine(resources_);
    return engine.correct(stream);
}

std::optional<std::string> FullAnnotationBackend::lemmatize() const
{
    std::vector<std::string> lemmas;
    for (const auto& sentence : document_.sentences)
    {
        for (const auto& token : sentence.tokens)
            lemmas.push_back(token.lemma.empty() ? token.text : token.lemma);
    }
    return joinWords(lemmas);
}

} // namespace processing
