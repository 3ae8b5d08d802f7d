#pragma once

#include "TextProcessingTypes.hpp"

#include <string>
#include <vector>

namespace processing
{

// Regex scans for dates (12/05/2023, 2023-05-12), money amounts (1.200,50 €, 30 euros, $15.99)
// and e-mail addresses. Matches are returned in text order.
std::vector<std::string> findDates(const std::string& text);
std::vector<std::string> findMoney(const std::string& text);
std::vector<std::string> findEmails(const std::string& text);

text_processing::PatternMatches findPatterns(const std::string& text);

} // namespace processing
