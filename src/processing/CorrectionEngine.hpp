#pragma once

#include "TextProcessingTypes.hpp"

#include <memory>
#include <string>
#include <vector>

namespace processing
{

class LexicalResources;

/// Rule-based token correction. Per token, first match wins:
///   1. exact correction from the correction table
///   2. "lo" + determiner: gendered article from the next token's lemma, default "el"
///   3. "haber" after vamos/voy/van/vas/quiera -> "a ver"
///   4. token equal (case-insensitive) to the previous source token -> dropped
///   5. otherwise the surface text
/// Rules 1-3 only fire on the first token of a run of equal tokens, so
/// "haiga haiga" yields a single "haya".
class CorrectionEngine
{
public:
    explicit CorrectionEngine(std::shared_ptr<const LexicalResources> resources);

    /// Tokens are consumed in order and never reordered; emitted units are joined with one space.
    [[nodiscard]] std::string correct(const std::vector<text_processing::Token>& tokens) const;

    /// Drops every word equal (case-insensitive) to the word right before it in the input.
    [[nodiscard]] static std::vector<std::string> suppressRepetitions(const std::vector<std::string>& words);

    /// Whitespace-split, suppressRepetitions, single-space join.
    [[nodiscard]] static std::string removeRepetitions(const std::string& text);

    static constexpr const char* kDefaultArticle = "el";
    static constexpr const char* kHomophoneReplacement = "a ver";

private:
    static bool isExhortativeTrigger(const std::string& folded_word);

    std::shared_ptr<const LexicalResources> resources_;
};

} // namespace processing
