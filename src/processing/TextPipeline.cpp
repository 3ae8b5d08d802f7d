#include "TextPipeline.hpp"
#include "AnnotationValidator.hpp"
#include "CorrectionEngine.hpp"
#include "Diagnostics.hpp"
#include "FullAnnotationBackend.hpp"
#include "HeuristicFallbackBackend.hpp"
#include "IAnnotator.hpp"
#include "KeywordExtractor.hpp"
#include "LexicalResources.hpp"
#include "PatternFinder.hpp"
#include "StageRunner.hpp"
#include "Summarizer.hpp"
#include "TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <exception>
#include <future>
#include <sstream>
#include <stdexcept>
#include <plog/Log.h>

namespace processing
{

using text_processing::ErrorCode;
using text_processing::KeywordReport;
using text_processing::NormalizationResult;
using text_processing::ProcessingResult;
using text_processing::SummaryResult;

namespace
{

void logInput(const char* operation, const std::string& input)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[TextPipeline] op=" << operation << " stage=input raw=" << Diagnostics::Preview(input);
}

void logBackend(const char* operation, const IAnalysisBackend& backend)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[TextPipeline] op=" << operation << " mode=" << text_processing::toString(backend.mode())
            << " sentences=" << backend.sentences().size();
}

void logStageResult(const text_processing::StageResult<std::string>& stage)
{
    if (!Diagnostics::IsVerbose() || !stage.succeeded)
        return;

    std::ostringstream oss;
    oss << "[TextPipeline] stage=" << stage.stage_name << " status=ok duration=" << stage.duration.count() << "us"
        << " output=" << Diagnostics::Preview(stage.result);
    PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
}

template<typename T>
ProcessingResult<T> rejectEmpty(const char* operation)
{
    PLOG_DEBUG_(Diagnostics::kLogInstance) << "[TextPipeline] op=" << operation << " rejected=empty_input";
    return ProcessingResult<T>::failure(ErrorCode::EmptyInput, "input text is empty");
}

template<typename T>
ProcessingResult<T> rejectMalformed(const char* operation, const MalformedAnnotationError& error)
{
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Annotation, "Annotator returned a malformed document",
                                      std::string(operation) + ": " + error.what());
    return ProcessingResult<T>::failure(ErrorCode::MalformedAnnotation, error.what());
}

template<typename T>
ProcessingResult<T> rejectAnnotatorFailure(const char* operation, const std::exception& error)
{
    PLOG_ERROR_(Diagnostics::kLogInstance) << "[TextPipeline] op=" << operation << " stage=annotate error=" << error.what();
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Annotation, "Annotator failed",
                                      std::string(operation) + ": " + error.what());
    return ProcessingResult<T>::failure(ErrorCode::StageFailed, std::string("annotate: ") + error.what());
}

template<typename T, typename S>
ProcessingResult<T> rejectStage(const text_processing::StageResult<S>& stage)
{
    return ProcessingResult<T>::failure(ErrorCode::StageFailed,
                                        stage.stage_name + ": " + stage.error.value_or("unknown"));
}

} // anonymous namespace

struct TextPipeline::Impl
{
    Impl(std::shared_ptr<const LexicalResources> res, std::shared_ptr<const IAnnotator> ann)
        : resources(std::move(res))
        , annotator(std::move(ann))
    {
        if (!resources)
            throw std::invalid_argument("TextPipeline requires lexical resources");
    }

    // Throws MalformedAnnotationError when the annotator breaks its contract.
    std::unique_ptr<IAnalysisBackend> selectBackend(const std::string& text) const
    {
        if (!annotator)
        {
            Diagnostics::LogDegradation("TextPipeline", "no_annotator");
            return std::make_unique<HeuristicFallbackBackend>(text);
        }

        auto document = annotator->annotate(text);
        if (!document)
        {
            Diagnostics::LogDegradation("TextPipeline", "annotator_unavailable");
            return std::make_unique<HeuristicFallbackBackend>(text);
        }

        validateAnnotation(*document);
        return std::make_unique<FullAnnotationBackend>(std::move(*document), resources);
    }

    std::shared_ptr<const LexicalResources> resources;
    std::shared_ptr<const IAnnotator> annotator;
};

TextPipeline::TextPipeline(std::shared_ptr<const LexicalResources> resources,
                           std::shared_ptr<const IAnnotator> annotator)
    : impl_(std::make_unique<Impl>(std::move(resources), std::move(annotator)))
{
}

TextPipeline::~TextPipeline() = default;

ProcessingResult<NormalizationResult> TextPipeline::normalize(const std::string& text) const
{
    PROFILE_SCOPE_CUSTOM("TextPipeline::normalize");

    if (isBlank(text))
        return rejectEmpty<NormalizationResult>("normalize");

    logInput("normalize", text);

    std::unique_ptr<IAnalysisBackend> backend;
    try
    {
        backend = impl_->selectBackend(text);
    }
    catch (const MalformedAnnotationError& error)
    {
        return rejectMalformed<NormalizationResult>("normalize", error);
    }
    catch (const std::exception& error)
    {
        return rejectAnnotatorFailure<NormalizationResult>("normalize", error);
    }
    logBackend("normalize", *backend);

    auto dedup_stage = run_stage<std::string>("deduplicate",
                                              [&]()
                                              {
                                                  return CorrectionEngine::removeRepetitions(text);
                                              });
    logStageResult(dedup_stage);
    if (!dedup_stage.succeeded)
        return rejectStage<NormalizationResult>(dedup_stage);

    auto correct_stage = run_stage<std::string>("correct",
                                                [&]()
                                                {
                                                    return backend->correct();
                                                });
    logStageResult(correct_stage);
    if (!correct_stage.succeeded)
        return rejectStage<NormalizationResult>(correct_stage);

    NormalizationResult result;
    result.original = text;
    result.lemmatized = backend->lemmatize();
    result.deduplicated = std::move(dedup_stage.result);
    result.corrected = std::move(correct_stage.result);
    result.mode = backend->mode();
    return ProcessingResult<NormalizationResult>::success(std::move(result));
}

ProcessingResult<SummaryResult> TextPipeline::summarize(const std::string& text, std::size_t max_sentences) const
{
    PROFILE_SCOPE_CUSTOM("TextPipeline::summarize");

    if (isBlank(text))
        return rejectEmpty<SummaryResult>("summarize");

    if (max_sentences < 1)
        return ProcessingResult<SummaryResult>::failure(ErrorCode::InvalidArgument, "max_sentences must be >= 1");

    logInput("summarize", text);

    std::unique_ptr<IAnalysisBackend> backend;
    try
    {
        backend = impl_->selectBackend(text);
    }
    catch (const MalformedAnnotationError& error)
    {
        return rejectMalformed<SummaryResult>("summarize", error);
    }
    catch (const std::exception& error)
    {
        return rejectAnnotatorFailure<SummaryResult>("summarize", error);
    }
    logBackend("summarize", *backend);

    auto summary_stage = run_stage<SummaryResult>("summarize",
                                                  [&]()
                                                  {
                                                      return Summarizer().summarize(*backend, text, max_sentences);
                                                  });
    if (!summary_stage.succeeded)
        return rejectStage<SummaryResult>(summary_stage);

    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[TextPipeline] stage=summarize selected=" << summary_stage.result.selected_indices.size() << "/"
            << summary_stage.result.total_sentences
            << " short_circuit=" << (summary_stage.result.short_circuited ? "yes" : "no")
            << " output=" << Diagnostics::Preview(summary_stage.result.text);
    }
    return ProcessingResult<SummaryResult>::success(std::move(summary_stage.result));
}

ProcessingResult<KeywordReport> TextPipeline::extractKeywords(const std::string& text) const
{
    PROFILE_SCOPE_CUSTOM("TextPipeline::extractKeywords");

    if (isBlank(text))
        return rejectEmpty<KeywordReport>("keywords");

    logInput("keywords", text);

    std::unique_ptr<IAnalysisBackend> backend;
    try
    {
        backend = impl_->selectBackend(text);
    }
    catch (const MalformedAnnotationError& error)
    {
        return rejectMalformed<KeywordReport>("keywords", error);
    }
    catch (const std::exception& error)
    {
        return rejectAnnotatorFailure<KeywordReport>("keywords", error);
    }
    logBackend("keywords", *backend);

    auto keyword_stage = run_stage<KeywordReport>("keywords",
                                                  [&]()
                                                  {
                                                      return KeywordExtractor(impl_->resources).extract(text, *backend);
                                                  });
    if (!keyword_stage.succeeded)
        return rejectStage<KeywordReport>(keyword_stage);

    return ProcessingResult<KeywordReport>::success(std::move(keyword_stage.result));
}

text_processing::PatternMatches TextPipeline::findPatterns(const std::string& text) const
{
    PROFILE_SCOPE_CUSTOM("TextPipeline::findPatterns");
    return processing::findPatterns(text);
}

std::vector<ProcessingResult<NormalizationResult>> TextPipeline::normalizeBatch(
    const std::vector<std::string>& texts) const
{
    std::vector<std::future<ProcessingResult<NormalizationResult>>> tasks;
    tasks.reserve(texts.size());
    for (const auto& text : texts)
    {
        tasks.push_back(std::async(std::launch::async, [this, &text]() { return normalize(text); }));
    }

    std::vector<ProcessingResult<NormalizationResult>> results;
    results.reserve(tasks.size());
    for (auto& task : tasks)
        results.push_back(task.get());
    return results;
}

std::vector<ProcessingResult<SummaryResult>> TextPipeline::summarizeBatch(const std::vector<std::string>& texts,
                                                                         std::size_t max_sentences) const
{
    std::vector<std::future<ProcessingResult<SummaryResult>>> tasks;
    tasks.reserve(texts.size());
    for (const auto& text : texts)
    {
        tasks.push_back(
            std::async(std::launch::async, [this, &text, max_sentences]() { return summarize(text, max_sentences); }));
    }

    std::vector<ProcessingResult<SummaryResult>> results;
    results.reserve(tasks.size());
    for (auto& task : tasks)
        results.push_back(task.get());
    return results;
}

} // namespace processing
