#pragma once

#include "TextProcessingTypes.hpp"

#include <stdexcept>
#include <string>

namespace processing
{

class MalformedAnnotationError : public std::runtime_error
{
public:
    explicit MalformedAnnotationError(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

// Throws MalformedAnnotationError when the document breaks the annotator contract:
// empty document or sentence, indices not 0..n-1, or a token without surface text.
void validateAnnotation(const text_processing::Document& doc);

} // namespace processing
