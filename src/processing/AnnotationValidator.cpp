#include "AnnotationValidator.hpp"
#include "TextUtils.hpp"

namespace processing
{

void validateAnnotation(const text_processing::Document& doc)
{
    if (doc.sentences.empty())
        throw MalformedAnnotationError("document has no sentences");

    for (std::size_t s = 0; s < doc.sentences.size(); ++s)
    {
        const auto& sentence = doc.sentences[s];
        if (sentence.index != s)
        {
            throw MalformedAnnotationError("sentence index " + std::to_string(sentence.index) +
                                           " found at position " + std::to_string(s));
        }
        if (sentence.tokens.empty() || isBlank(sentence.text))
        {
            throw MalformedAnnotationError("sentence " + std::to_string(s) + " is empty");
        }

        for (std::size_t t = 0; t < sentence.tokens.size(); ++t)
        {
            const auto& token = sentence.tokens[t];
            if (token.index != t)
            {
                throw MalformedAnnotationError("sentence " + std::to_string(s) + ": token index " +
                                               std::to_string(token.index) + " found at position " +
                                               std::to_string(t));
            }
            if (token.text.empty())
            {
                throw MalformedAnnotationError("sentence " + std::to_string(s) + ": token " +
                                               std::to_string(t) + " has no text");
            }
        }
    }
}

} // namespace processing
