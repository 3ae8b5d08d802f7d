#include "CorrectionEngine.hpp"
#include "LexicalResources.hpp"
#include "TextUtils.hpp"

#include <array>
#include <stdexcept>

namespace processing
{

using text_processing::PartOfSpeech;
using text_processing::Token;

CorrectionEngine::CorrectionEngine(std::shared_ptr<const LexicalResources> resources)
    : resources_(std::move(resources))
{
    if (!resources_)
        throw std::invalid_argument("CorrectionEngine requires lexical resources");
}

std::string CorrectionEngine::correct(const std::vector<Token>& tokens) const
{
    std::vector<std::string> folded;
    folded.reserve(tokens.size());
    for (const auto& token : tokens)
        folded.push_back(foldCase(token.text));

    std::vector<std::string> emitted;
    emitted.reserve(tokens.size());

    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        const Token& token = tokens[i];
        const std::string& word = folded[i];

        // Later members of a run of equal tokens are dropped before any rewrite rule sees them
        if (i > 0 && word == folded[i - 1])
            continue;

        if (auto replacement = resources_->lookupCorrection(word))
        {
            emitted.push_back(*replacement);
            continue;
        }

        if (word == "lo" && token.pos == PartOfSpeech::Determiner)
        {
            if (i + 1 < tokens.size())
            {
                if (auto phrase = resources_->lookupGenderedNoun(foldCase(tokens[i + 1].lemma)))
                {
                    // The phrase carries the noun, so the noun token is consumed too
                    emitted.push_back(*phrase);
                    ++i;
                    continue;
                }
            }
            emitted.emplace_back(kDefaultArticle);
            continue;
        }

        if (word == "haber" && i > 0 && isExhortativeTrigger(folded[i - 1]))
        {
            emitted.emplace_back(kHomophoneReplacement);
            continue;
        }

        emitted.push_back(token.text);
    }

    return joinWords(emitted);
}

std::vector<std::string> CorrectionEngine::suppressRepetitions(const std::vector<std::string>& words)
{
    std::vector<std::string> kept;
    kept.reserve(words.size());

    std::string previous;
    for (std::size_t i = 0; i < words.size(); ++i)
    {
        std::string folded = foldCase(words[i]);
        if (i == 0 || folded != previous)
            kept.push_back(words[i]);
        previous = std::move(folded);
    }
    return kept;
}

std::string CorrectionEngine::removeRepetitions(const std::string& text)
{
    return joinWords(suppressRepetitions(splitWhitespace(text)));
}

bool CorrectionEngine::isExhortativeTrigger(const std::string& folded_word)
{
    static const std::array<const char*, 5> triggers = { "vamos", "voy", "van", "vas", "quiera" };
    for (const char* trigger : triggers)
    {
        if (folded_word == trigger)
            return true;
    }
    return false;
}

} // namespace processing
