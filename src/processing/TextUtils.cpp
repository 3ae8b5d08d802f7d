#include "TextUtils.hpp"
#include <utf8proc.h>

#include <cctype>
#include <cstdlib>

namespace processing
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // Invalid byte: keep it as U+FFFD and resynchronize on the next byte
            result.push_back(U'\uFFFD');
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

std::string foldCase(const std::string& text)
{
    if (text.empty())
        return text;

    std::string composed = text;
    utf8proc_uint8_t* nfc = utf8proc_NFC(reinterpret_cast<const utf8proc_uint8_t*>(text.c_str()));
    if (nfc)
    {
        composed.assign(reinterpret_cast<char*>(nfc));
        std::free(nfc);
    }

    std::u32string cps = utf8ToUtf32(composed);
    for (char32_t& cp : cps)
    {
        cp = static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp)));
    }
    return utf32ToUtf8(cps);
}

std::size_t codepointLength(const std::string& text)
{
    return utf8ToUtf32(text).size();
}

bool isSpace(char32_t cp)
{
    if (cp < 0x80)
        return std::isspace(static_cast<unsigned char>(cp)) != 0;
    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        // NEL is a C1 control but still a line break
        return cp == 0x85;
    }
}

bool isBlank(const std::string& text)
{
    for (char32_t cp : utf8ToUtf32(text))
    {
        if (!isSpace(cp))
            return false;
    }
    return true;
}

std::string trim(const std::string& text)
{
    std::u32string cps = utf8ToUtf32(text);
    std::size_t start = 0;
    std::size_t end = cps.size();

    while (start < end && isSpace(cps[start]))
        ++start;
    while (end > start && isSpace(cps[end - 1]))
        --end;

    if (start == 0 && end == cps.size())
        return text;
    return utf32ToUtf8(cps.substr(start, end - start));
}

std::vector<std::string> splitWhitespace(const std::string& text)
{
    std::vector<std::string> words;
    std::u32string current;
    for (char32_t cp : utf8ToUtf32(text))
    {
        if (!isSpace(cp))
        {
            current.push_back(cp);
        }
        else if (!current.empty())
        {
            words.push_back(utf32ToUtf8(current));
            current.clear();
        }
    }
    if (!current.empty())
        words.push_back(utf32ToUtf8(current));
    return words;
}

std::string joinWords(const std::vector<std::string>& words, const std::string& separator)
{
    std::string out;
    for (size_t i = 0; i < words.size(); ++i)
    {
        if (i > 0)
            out += separator;
        out += words[i];
    }
    return out;
}

bool isWordChar(char32_t cp)
{
    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return false;
    }
}

std::vector<std::string> wordTokens(const std::string& text)
{
    std::vector<std::string> tokens;
    std::u32string current;
    for (char32_t cp : utf8ToUtf32(text))
    {
        if (isWordChar(cp))
        {
            current.push_back(cp);
        }
        else if (!current.empty())
        {
            tokens.push_back(utf32ToUtf8(current));
            current.clear();
        }
    }
    if (!current.empty())
        tokens.push_back(utf32ToUtf8(current));
    return tokens;
}

} // namespace processing
