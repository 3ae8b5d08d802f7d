#include "LexicalResources.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace processing
{

namespace
{

// Spanish list, same coverage as the common NLTK corpus
const char* const kSpanishStopwords[] = {
    "de", "la", "que", "el", "en", "y", "a", "los", "del", "se", "las", "por", "un", "para", "con",
    "no", "una", "su", "al", "lo", "como", "más", "pero", "sus", "le", "ya", "o", "este", "sí",
    "porque", "esta", "entre", "cuando", "muy", "sin", "sobre", "también", "me", "hasta", "hay",
    "donde", "quien", "desde", "todo", "nos", "durante", "todos", "uno", "les", "ni", "contra",
    "otros", "ese", "eso", "ante", "ellos", "e", "esto", "mí", "antes", "algunos", "qué", "unos",
    "yo", "otro", "otras", "otra", "él", "tanto", "esa", "estos", "mucho", "quienes", "nada",
    "muchos", "cual", "poco", "ella", "estar", "estas", "algunas", "algo", "nosotros", "mi", "mis",
    "tú", "te", "ti", "tu", "tus", "ellas", "nosotras", "vosotros", "vosotras", "os", "mío", "mía",
    "míos", "mías", "tuyo", "tuya", "tuyos", "tuyas", "suyo", "suya", "suyos", "suyas", "nuestro",
    "nuestra", "nuestros", "nuestras", "vuestro", "vuestra", "vuestros", "vuestras", "esos", "esas",
    "estoy", "estás", "está", "estamos", "estáis", "están", "esté", "estés", "estemos", "estéis",
    "estén", "estaré", "estarás", "estará", "estaremos", "estaréis", "estarán", "estaba", "estabas",
    "estábamos", "estabais", "estaban", "estuve", "estuviste", "estuvo", "estuvimos", "estuvieron",
    "he", "has", "ha", "hemos", "habéis", "han", "haya", "hayas", "hayamos", "hayáis", "hayan",
    "habré", "habrás", "habrá", "habremos", "habréis", "habrán", "había", "habías", "habíamos",
    "habíais", "habían", "hube", "hubo", "hubimos", "hubieron", "soy", "eres", "es", "somos",
    "sois", "son", "sea", "seas", "seamos", "seáis", "sean", "seré", "serás", "será", "seremos",
    "seréis", "serán", "sería", "serían", "era", "eras", "éramos", "erais", "eran", "fui",
    "fuiste", "fue", "fuimos", "fueron", "fuera", "fueran", "tengo", "tienes", "tiene", "tenemos",
    "tenéis", "tienen", "tenga", "tengan", "tendré", "tendrá", "tenía", "tenían", "tuve", "tuvo",
    "tuvieron", "tener", "ser", "haber"
};

LexicalResources::Table foldKeys(const LexicalResources::Table& table)
{
    LexicalResources::Table folded;
    folded.reserve(table.size());
    for (const auto& [key, value] : table)
    {
        folded[foldCase(key)] = value;
    }
    return folded;
}

std::optional<json> readJsonFile(const fs::path& file_path)
{
    if (!fs::exists(file_path))
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[LexicalResources] Resource file not found: " << file_path.string();
        return std::nullopt;
    }

    std::ifstream file(file_path);
    if (!file.is_open())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Resources, "Failed to open lexicon file",
                                            file_path.string());
        return std::nullopt;
    }

    try
    {
        json j;
        file >> j;
        return j;
    }
    catch (const json::exception& e)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Resources, "Lexicon file is not valid JSON",
                                            file_path.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<LexicalResources::Table> loadTableFile(const fs::path& file_path)
{
    auto j = readJsonFile(file_path);
    if (!j)
        return std::nullopt;

    if (!j->is_object())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Resources,
                                            "Invalid lexicon format (expected object)", file_path.string());
        return std::nullopt;
    }

    LexicalResources::Table table;
    for (auto& [key, value] : j->items())
    {
        if (value.is_string())
        {
            table[key] = value.get<std::string>();
        }
        else
        {
            PLOG_WARNING_(Diagnostics::kLogInstance)
                << "[LexicalResources] Skipping non-string replacement for key: " << key;
        }
    }
    return table;
}

std::optional<LexicalResources::WordSet> loadWordSetFile(const fs::path& file_path)
{
    auto j = readJsonFile(file_path);
    if (!j)
        return std::nullopt;

    if (!j->is_array())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Resources,
                                            "Invalid stopword format (expected array)", file_path.string());
        return std::nullopt;
    }

    LexicalResources::WordSet words;
    for (const auto& entry : *j)
    {
        if (entry.is_string())
            words.insert(entry.get<std::string>());
    }
    return words;
}

} // anonymous namespace

LexicalResources::LexicalResources(const Table& corrections, const Table& gendered_nouns, const WordSet& stopwords)
    : corrections_(foldKeys(corrections))
    , gendered_nouns_(foldKeys(gendered_nouns))
{
    stopwords_.reserve(stopwords.size());
    for (const auto& word : stopwords)
    {
        stopwords_.insert(foldCase(word));
    }
}

std::shared_ptr<const LexicalResources> LexicalResources::createDefault()
{
    return std::make_shared<const LexicalResources>(defaultCorrections(), defaultGenderedNouns(),
                                                    defaultStopwords("es"));
}

std::shared_ptr<const LexicalResources> LexicalResources::loadFromDirectory(const std::string& resource_dir,
                                                                            const std::string& language)
{
    PLOG_INFO_(Diagnostics::kLogInstance) << "[LexicalResources] Loading lexicon from: " << resource_dir;

    fs::path dir = resource_dir;

    auto corrections = loadTableFile(dir / "corrections.json");
    auto gendered = loadTableFile(dir / "gendered_nouns.json");
    auto stopwords = loadWordSetFile(dir / ("stopwords_" + language + ".json"));

    if (!stopwords)
    {
        WordSet builtin = defaultStopwords(language);
        if (builtin.empty())
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Resources,
                                                "No stopword list available, keyword filtering disabled",
                                                "language=" + language);
        }
        stopwords = std::move(builtin);
    }

    auto resources = std::make_shared<const LexicalResources>(corrections.value_or(defaultCorrections()),
                                                              gendered.value_or(defaultGenderedNouns()),
                                                              *stopwords);

    PLOG_INFO_(Diagnostics::kLogInstance)
        << "[LexicalResources] Loaded corrections=" << resources->correctionCount()
        << (corrections ? "" : " (built-in)") << " gendered_nouns=" << resources->genderedNounCount()
        << (gendered ? "" : " (built-in)") << " stopwords=" << resources->stopwordCount();
    return resources;
}

std::optional<std::string> LexicalResources::lookupCorrection(const std::string& folded_word) const
{
    auto it = corrections_.find(folded_word);
    if (it == corrections_.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> LexicalResources::lookupGenderedNoun(const std::string& folded_lemma) const
{
    auto it = gendered_nouns_.find(folded_lemma);
    if (it == gendered_nouns_.end())
        return std::nullopt;
    return it->second;
}

bool LexicalResources::isStopword(const std::string& folded_word) const
{
    return stopwords_.find(folded_word) != stopwords_.end();
}

const LexicalResources::Table& LexicalResources::defaultCorrections()
{
    // No entry for "haber": the correction engine rewrites it only after a motion verb
    static const Table table = {
        { "haiga",  "haya"     },
        { "naiden", "nadie"    },
        { "nadien", "nadie"    },
        { "aserca", "acerca"   },
        { "enserio", "en serio" },
        { "iva",    "iba"      },
    };
    return table;
}

const LexicalResources::Table& LexicalResources::defaultGenderedNouns()
{
    static const Table table = {
        { "casa",    "la casa"    },
        { "persona", "la persona" },
        { "gente",   "la gente"   },
        { "niño",    "el niño"    },
        { "niña",    "la niña"    },
        { "camisa",  "la camisa"  },
    };
    return table;
}

LexicalResources::WordSet LexicalResources::defaultStopwords(const std::string& language)
{
    if (language != "es")
        return {};
    return WordSet(std::begin(kSpanishStopwords), std::end(kSpanishStopwords));
}

} // namespace processing
