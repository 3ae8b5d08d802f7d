#include "PatternFinder.hpp"

#include <regex>

namespace processing
{

namespace
{

std::vector<std::string> collectMatches(const std::string& text, const std::regex& pattern)
{
    std::vector<std::string> matches;
    for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it)
    {
        matches.push_back(it->str());
    }
    return matches;
}

} // anonymous namespace

std::vector<std::string> findDates(const std::string& text)
{
    static const std::regex dates(
        R"(\b(?:\d{1,2}[/-]\d{1,2}[/-]\d{2,4}|\d{4}[/-]\d{1,2}[/-]\d{1,2})\b)",
        std::regex::ECMAScript
    );
    return collectMatches(text, dates);
}

std::vector<std::string> findMoney(const std::string& text)
{
    // An amount needs a currency after it; a leading "€" alone is not enough.
    // "€" is multi-byte, so it is only ever used as a whole group
    static const std::regex money(
        R"(\b(?:€\s?)?\d{1,3}(?:[.,]\d{3})*(?:[.,]\d+)?\s?(?:€|euros|USD|\$))"
        R"(|\$\d+(?:\.\d+)?\b)",
        std::regex::ECMAScript
    );
    return collectMatches(text, money);
}

std::vector<std::string> findEmails(const std::string& text)
{
    static const std::regex emails(
        R"(\b[\w.-]+@[\w.-]+\.\w{2,4}\b)",
        std::regex::ECMAScript
    );
    return collectMatches(text, emails);
}

text_processing::PatternMatches findPatterns(const std::string& text)
{
    text_processing::PatternMatches matches;
    matches.dates = findDates(text);
    matches.money = findMoney(text);
    matches.emails = findEmails(text);
    return matches;
}

} // namespace processing
