#pragma once

#include "processing/IAnnotator.hpp"
#include "processing/TextProcessingTypes.hpp"

#include <atomic>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace test_utils
{

struct TokenSpec
{
    std::string text;
    std::string lemma;
    text_processing::PartOfSpeech pos = text_processing::PartOfSpeech::Other;
};

inline text_processing::Sentence makeSentence(std::string text, std::initializer_list<TokenSpec> tokens,
                                              std::size_t index)
{
    text_processing::Sentence sentence;
    sentence.text = std::move(text);
    sentence.index = index;
    for (const auto& spec : tokens)
    {
        text_processing::Token token;
        token.text = spec.text;
        token.lemma = spec.lemma.empty() ? spec.text : spec.lemma;
        token.pos = spec.pos;
        token.index = sentence.tokens.size();
        sentence.tokens.push_back(std::move(token));
    }
    return sentence;
}

inline std::vector<text_processing::Token> makeTokens(std::initializer_list<TokenSpec> tokens)
{
    return makeSentence("", tokens, 0).tokens;
}

// Annotator double: returns a fixed document (or nothing) for any text
class StaticAnnotator : public processing::IAnnotator
{
public:
    explicit StaticAnnotator(std::optional<text_processing::Document> document)
        : document_(std::move(document))
    {
    }

    std::optional<text_processing::Document> annotate(const std::string&) const override
    {
        ++calls_;
        return document_;
    }

    int calls() const { return calls_.load(); }

private:
    std::optional<text_processing::Document> document_;
    mutable std::atomic<int> calls_{ 0 };
};

// Annotator double whose backend always fails
class ThrowingAnnotator : public processing::IAnnotator
{
public:
    std::optional<text_processing::Document> annotate(const std::string&) const override
    {
        throw std::runtime_error("tagger crashed");
    }
};

} // namespace test_utils
