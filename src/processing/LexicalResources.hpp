#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace processing
{

/// Read-only lexicon shared by every pipeline call: correction table,
/// gendered-noun table and stopword set. Keys are case-folded on construction.
/// Instances are only handed out as shared_ptr<const>, so concurrent reads need no locking.
class LexicalResources
{
public:
    using Table = std::unordered_map<std::string, std::string>;
    using WordSet = std::unordered_set<std::string>;

    LexicalResources(const Table& corrections, const Table& gendered_nouns, const WordSet& stopwords);

    /// Built-in Spanish tables.
    static std::shared_ptr<const LexicalResources> createDefault();

    /// Loads corrections.json, gendered_nouns.json and stopwords_<language>.json from
    /// resource_dir. Any file that is missing or unreadable falls back to the built-in table.
    static std::shared_ptr<const LexicalResources> loadFromDirectory(const std::string& resource_dir,
                                                                     const std::string& language = "es");

    [[nodiscard]] std::optional<std::string> lookupCorrection(const std::string& folded_word) const;
    [[nodiscard]] std::optional<std::string> lookupGenderedNoun(const std::string& folded_lemma) const;
    [[nodiscard]] bool isStopword(const std::string& folded_word) const;

    [[nodiscard]] std::size_t correctionCount() const noexcept { return corrections_.size(); }
    [[nodiscard]] std::size_t genderedNounCount() const noexcept { return gendered_nouns_.size(); }
    [[nodiscard]] std::size_t stopwordCount() const noexcept { return stopwords_.size(); }
    [[nodiscard]] bool hasStopwords() const noexcept { return !stopwords_.empty(); }

    static const Table& defaultCorrections();
    static const Table& defaultGenderedNouns();
    /// Empty for languages without a built-in list.
    static WordSet defaultStopwords(const std::string& language);

private:
    Table corrections_;
    Table gendered_nouns_;
    WordSet stopwords_;
};

} // namespace processing
