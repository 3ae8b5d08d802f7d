#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace processing
{

/// UTF-8 to UTF-32 conversion
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// NFC-composed, lowercased copy used for every table lookup ("Niño" -> "niño")
std::string foldCase(const std::string& text);

/// Length in code points, not bytes
std::size_t codepointLength(const std::string& text);

/// Unicode space separators (Zs, Zl, Zp) and ASCII whitespace
bool isSpace(char32_t cp);

/// True if the text is empty or contains only whitespace
bool isBlank(const std::string& text);

std::string trim(const std::string& text);

std::vector<std::string> splitWhitespace(const std::string& text);

std::string joinWords(const std::vector<std::string>& words, const std::string& separator = " ");

/// Letter or digit according to the Unicode category
bool isWordChar(char32_t cp);

/// Maximal runs of letters/digits, in order of appearance
std::vector<std::string> wordTokens(const std::string& text);

} // namespace processing
