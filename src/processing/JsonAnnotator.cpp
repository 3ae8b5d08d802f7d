#include "JsonAnnotator.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace processing
{

namespace
{

text_processing::Token parseToken(const json& j, std::size_t position)
{
    text_processing::Token token;
    token.text = j.at("text").get<std::string>();
    token.lemma = j.value("lemma", std::string());
    if (token.lemma.empty())
        token.lemma = token.text;
    token.pos = text_processing::partOfSpeechFromTag(j.value("pos", std::string()));
    token.index = j.contains("index") ? j.at("index").get<std::size_t>() : position;
    return token;
}

text_processing::Sentence parseSentence(const json& j, std::size_t position)
{
    text_processing::Sentence sentence;
    const json& tokens = j.at("tokens");
    if (!tokens.is_array())
        throw std::invalid_argument("sentence " + std::to_string(position) + ": \"tokens\" is not an array");

    std::size_t t = 0;
    for (const auto& token_json : tokens)
    {
        sentence.tokens.push_back(parseToken(token_json, t++));
    }

    if (j.contains("text"))
    {
        sentence.text = j.at("text").get<std::string>();
    }
    else
    {
        std::vector<std::string> words;
        for (const auto& token : sentence.tokens)
            words.push_back(token.text);
        sentence.text = joinWords(words);
    }
    sentence.index = j.contains("index") ? j.at("index").get<std::size_t>() : position;
    return sentence;
}

} // anonymous namespace

JsonAnnotator::JsonAnnotator(std::string source_text, text_processing::Document document)
    : source_text_(std::move(source_text))
    , document_(std::move(document))
{
}

std::unique_ptr<JsonAnnotator> JsonAnnotator::fromString(const std::string& json_text, std::string& error)
{
    try
    {
        json j = json::parse(json_text);
        if (!j.is_object())
        {
            error = "annotation root must be an object";
            return nullptr;
        }

        const json& sentences = j.at("sentences");
        if (!sentences.is_array())
        {
            error = "\"sentences\" is not an array";
            return nullptr;
        }

        text_processing::Document doc;
        std::size_t s = 0;
        for (const auto& sentence_json : sentences)
        {
            doc.sentences.push_back(parseSentence(sentence_json, s++));
        }

        std::string text;
        if (j.contains("text"))
        {
            text = j.at("text").get<std::string>();
        }
        else
        {
            std::vector<std::string> parts;
            for (const auto& sentence : doc.sentences)
                parts.push_back(sentence.text);
            text = joinWords(parts);
        }

        return std::make_unique<JsonAnnotator>(std::move(text), std::move(doc));
    }
    catch (const json::exception& e)
    {
        error = e.what();
        return nullptr;
    }
    catch (const std::invalid_argument& e)
    {
        error = e.what();
        return nullptr;
    }
}

std::unique_ptr<JsonAnnotator> JsonAnnotator::fromFile(const std::string& path, std::string& error)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        error = "cannot open " + path;
        return nullptr;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    auto annotator = fromString(buffer.str(), error);
    if (!annotator)
    {
        PLOG_ERROR_(Diagnostics::kLogInstance) << "[JsonAnnotator] Failed to import " << path << ": " << error;
        return nullptr;
    }

    PLOG_INFO_(Diagnostics::kLogInstance) << "[JsonAnnotator] Imported " << path << " sentences="
                                          << annotator->document_.sentences.size();
    return annotator;
}

std::optional<text_processing::Document> JsonAnnotator::annotate(const std::string& text) const
{
    if (trim(text) != trim(source_text_))
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance)
            << "[JsonAnnotator] No annotation for text=" << Diagnostics::Preview(text);
        return std::nullopt;
    }
    return document_;
}

} // namespace processing
