#pragma once

#include <string>
#include <chrono>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace text_processing {

// Core data contracts for the text processing pipeline.
// All stages use these types as input/output to ensure clean interfaces.

// Closed tag set. Finer annotator tags are mapped onto these four.
enum class PartOfSpeech {
    Noun,
    Verb,
    Determiner,
    Other
};

struct Token {
    std::string text;                         // Surface form as it appears in the input
    std::string lemma;                        // Dictionary form (surface form if not meaningful)
    PartOfSpeech pos = PartOfSpeech::Other;
    std::size_t index = 0;                    // Zero-based position within the owning sentence
};

struct Sentence {
    std::vector<Token> tokens;
    std::string text;
    std::size_t index = 0;                    // Position within the document
};

struct Document {
    std::vector<Sentence> sentences;
};

struct ScoredSentence {
    std::size_t sentence_index = 0;
    double score = 0.0;
};

// Which analysis path produced a result
enum class AnalysisMode {
    FullAnnotation,
    HeuristicFallback
};

struct NormalizationResult {
    std::string original;
    std::optional<std::string> lemmatized;    // Only available with full annotation
    std::string deduplicated;                 // Repetitions removed from raw whitespace-split words
    std::string corrected;
    AnalysisMode mode = AnalysisMode::FullAnnotation;
};

struct SummaryResult {
    std::string text;
    std::vector<std::size_t> selected_indices; // Ascending; empty when short-circuited
    std::size_t total_sentences = 0;
    bool short_circuited = false;             // Input had no more sentences than requested
    AnalysisMode mode = AnalysisMode::FullAnnotation;
};

using WordCount = std::pair<std::string, std::size_t>;

struct KeywordReport {
    std::vector<WordCount> top_words;         // Frequent content words (stopwords removed)
    std::vector<WordCount> nouns;             // Empty without annotation
    std::vector<WordCount> verbs;             // Empty without annotation
    AnalysisMode mode = AnalysisMode::FullAnnotation;
};

struct PatternMatches {
    std::vector<std::string> dates;
    std::vector<std::string> money;
    std::vector<std::string> emails;
};

enum class ErrorCode {
    EmptyInput,          // Text is empty or whitespace only
    InvalidArgument,     // e.g. max_sentences < 1
    MalformedAnnotation, // Annotator broke its contract
    StageFailed          // A pipeline stage threw unexpectedly
};

// Value-or-error returned by the public pipeline entry points
template<typename T>
struct ProcessingResult {
    std::optional<T> value;
    std::optional<ErrorCode> error;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return value.has_value(); }

    static ProcessingResult success(T v) {
        ProcessingResult res;
        res.value = std::move(v);
        return res;
    }

    static ProcessingResult failure(ErrorCode code, std::string msg) {
        ProcessingResult res;
        res.error = code;
        res.message = std::move(msg);
        return res;
    }
};

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result{};                              // The actual result payload
    bool succeeded = true;                   // Whether the stage completed successfully
    std::optional<std::string> error;        // Error message if stage failed
    std::chrono::microseconds duration{0};   // How long the stage took to execute
    std::string stage_name;                  // Name of the stage (for logging/metrics)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

const char* toString(PartOfSpeech pos) noexcept;
const char* toString(AnalysisMode mode) noexcept;
const char* toString(ErrorCode code) noexcept;

// Maps an annotator tag (UD or spaCy style, case-insensitive) onto the closed set.
PartOfSpeech partOfSpeechFromTag(const std::string& tag);

} // namespace text_processing
