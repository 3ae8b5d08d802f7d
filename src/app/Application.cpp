#include "Application.hpp"
#include "app/Version.hpp"
#include "config/ConfigManager.hpp"
#include "processing/Diagnostics.hpp"
#include "processing/JsonAnnotator.hpp"
#include "processing/LexicalResources.hpp"
#include "processing/TextPipeline.hpp"
#include "processing/TextUtils.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <iostream>
#include <string>
#include <utility>

using namespace text_processing;

namespace
{

void printList(const char* label, const std::vector<std::string>& items)
{
    std::cout << label << ":";
    if (items.empty())
    {
        std::cout << " (none)\n";
        return;
    }
    std::cout << '\n';
    for (const auto& item : items)
        std::cout << "  - " << item << '\n';
}

void printCounts(const char* label, const std::vector<WordCount>& counts)
{
    std::cout << label << ":";
    if (counts.empty())
    {
        std::cout << " (none)\n";
        return;
    }
    std::cout << '\n';
    for (const auto& [word, count] : counts)
        std::cout << "  " << word << " (" << count << ")\n";
}

template <typename T>
int reportFailure(const ProcessingResult<T>& result)
{
    std::cerr << "error: " << (result.error ? toString(*result.error) : "unknown") << ": " << result.message
              << '\n';
    return Application::kExitProcessingError;
}

bool readLine(const std::string& prompt, std::string& line)
{
    std::cout << prompt << std::flush;
    return static_cast<bool>(std::getline(std::cin, line));
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    std::string usage_error;
    if (!parseCommandLine(argc_, argv_, args_, usage_error))
    {
        std::cerr << "error: " << usage_error << "\n\n" << usageText(argc_ > 0 ? argv_[0] : "wordchef");
        return kExitUsageError;
    }
    if (args_.show_help)
    {
        std::cout << usageText(argc_ > 0 ? argv_[0] : "wordchef");
        return kExitOk;
    }
    if (args_.show_version)
    {
        std::cout << "wordchef " << WORDCHEF_VERSION_STRING << '\n';
        return kExitOk;
    }

    if (!initialize())
    {
        flushPendingErrors();
        return kExitProcessingError;
    }

    int code = args_.command == Command::Menu ? runMenu() : runCommand(args_.command);
    flushPendingErrors();
    return code;
}

bool Application::initialize()
{
    initializeConfig();

    if (!initializeLogging())
        return false;

    PROFILE_SCOPE_FUNCTION();
    PLOG_INFO << "wordchef " << WORDCHEF_VERSION_STRING << " starting, command=" << commandName(args_.command);
    if (!config_manager_->fileFound())
    {
        PLOG_INFO << "No configuration at " << config_manager_->path() << ", using defaults";
    }

    loadResources();
    return resources_ != nullptr;
}

void Application::initializeConfig()
{
    config_manager_ = std::make_unique<ConfigManager>(args_.config_path);
    registerAppConfigTables(*config_manager_, config_);

    // Errors are already queued on ErrorReporter and shown once the command finishes.
    config_manager_->load();

    if (args_.verbose)
        config_.diagnostics.verbose = true;
}

bool Application::initializeLogging()
{
    utils::LogManager::Settings settings;
    settings.directory = config_.logging.directory;
    settings.append = config_.logging.append;
    settings.console = config_.logging.console;
    settings.level = static_cast<plog::Severity>(config_.logging.level);

    if (!utils::LogManager::Initialize(settings))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                          "log directory: " + settings.directory);
        return false;
    }

    utils::LogManager::RegisterLogger<0>({ .name = "main",
                                           .filepath = utils::LogManager::LogPath("run.log"),
                                           .append_override = std::nullopt,
                                           .level_override = std::nullopt,
                                           .max_file_size = 10 * 1024 * 1024,
                                           .backup_count = 3,
                                           .add_console_appender = config_.logging.console });

    processing::Diagnostics::InitializeLogger("processing.log", false);
    processing::Diagnostics::SetVerbose(config_.diagnostics.verbose);
    processing::Diagnostics::SetMaxPreview(config_.diagnostics.max_preview);

#if WORDCHEF_PROFILING_LEVEL >= 1
    utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>({ .name = "profiling",
                                                                         .filepath = utils::LogManager::LogPath("profiling.log"),
                                                                         .append_override = std::nullopt,
                                                                         .level_override = plog::debug,
                                                                         .max_file_size = 10 * 1024 * 1024,
                                                                         .backup_count = 3,
                                                                         .add_console_appender = false });
#endif

    return true;
}

void Application::loadResources()
{
    PROFILE_SCOPE_FUNCTION();

    resources_ = processing::LexicalResources::loadFromDirectory(config_.resources.directory,
                                                                 config_.resources.language);
    PLOG_INFO << "Lexicon loaded: corrections=" << resources_->correctionCount()
              << " gendered_nouns=" << resources_->genderedNounCount()
              << " stopwords=" << resources_->stopwordCount();

    pipeline_ = std::make_unique<processing::TextPipeline>(resources_);
}

int Application::runCommand(Command command)
{
    PROFILE_SCOPE_CUSTOM("Application::runCommand");

    std::unique_ptr<processing::TextPipeline> annotated_pipeline;
    const processing::TextPipeline* pipeline = pipeline_.get();
    std::string text;

    if (args_.annotation_path)
    {
        std::string error;
        auto annotator = processing::JsonAnnotator::fromFile(*args_.annotation_path, error);
        if (!annotator)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Annotation, "Could not read annotation file",
                                              *args_.annotation_path + ": " + error);
            return kExitProcessingError;
        }
        text = annotator->sourceText();
        annotated_pipeline = std::make_unique<processing::TextPipeline>(
            resources_, std::shared_ptr<const processing::IAnnotator>(std::move(annotator)));
        pipeline = annotated_pipeline.get();
    }
    else
    {
        text = args_.text.value_or(std::string{});
    }

    switch (command)
    {
    case Command::Normalize:
        return runNormalize(*pipeline, text);
    case Command::Summarize:
        return runSummarize(*pipeline, text, args_.max_sentences.value_or(config_.summary.max_sentences));
    case Command::Keywords:
        return runKeywords(*pipeline, text);
    case Command::Patterns:
        return runPatterns(*pipeline, text);
    case Command::Menu:
    case Command::None:
        break;
    }
    return kExitUsageError;
}

int Application::runMenu()
{
    static const char* kMenu = "\n=== wordchef ===\n"
                               "1. Normalize text\n"
                               "2. Summarize text\n"
                               "3. Extract keywords\n"
                               "4. Find patterns\n"
                               "0. Exit\n";

    int last_code = kExitOk;
    std::string choice;
    while (true)
    {
        std::cout << kMenu;
        if (!readLine("Option: ", choice))
            break;
        choice = processing::trim(choice);
        if (choice == "0")
            break;
        if (choice != "1" && choice != "2" && choice != "3" && choice != "4")
        {
            std::cout << "Invalid option.\n";
            continue;
        }

        std::string text;
        if (!readLine("Text: ", text))
            break;

        if (choice == "1")
        {
            last_code = runNormalize(*pipeline_, text);
        }
        else if (choice == "2")
        {
            std::string count;
            if (!readLine("Sentences [" + std::to_string(config_.summary.max_sentences) + "]: ", count))
                break;
            std::size_t max_sentences = config_.summary.max_sentences;
            count = processing::trim(count);
            if (!count.empty() && !parseSentenceCount(count, max_sentences))
            {
                std::cout << "Invalid number: " << count << '\n';
                continue;
            }
            last_code = runSummarize(*pipeline_, text, max_sentences);
        }
        else if (choice == "3")
        {
            last_code = runKeywords(*pipeline_, text);
        }
        else
        {
            last_code = runPatterns(*pipeline_, text);
        }
        flushPendingErrors();
    }
    return last_code;
}

int Application::runNormalize(const processing::TextPipeline& pipeline, const std::string& text)
{
    auto result = pipeline.normalize(text);
    if (!result.ok())
        return reportFailure(result);

    const auto& value = *result.value;
    std::cout << "Mode: " << toString(value.mode) << '\n'
              << "Original: " << value.original << '\n'
              << "Lemmatized: " << value.lemmatized.value_or("(unavailable)") << '\n'
              << "Deduplicated: " << value.deduplicated << '\n'
              << "Corrected: " << value.corrected << '\n';
    return kExitOk;
}

int Application::runSummarize(const processing::TextPipeline& pipeline, const std::string& text,
                              std::size_t max_sentences)
{
    auto result = pipeline.summarize(text, max_sentences);
    if (!result.ok())
        return reportFailure(result);

    const auto& value = *result.value;
    std::cout << "Mode: " << toString(value.mode) << '\n'
              << "Sentences: " << value.selected_indices.size() << "/" << value.total_sentences << '\n'
              << "Summary: " << value.text << '\n';
    return kExitOk;
}

int Application::runKeywords(const processing::TextPipeline& pipeline, const std::string& text)
{
    auto result = pipeline.extractKeywords(text);
    if (!result.ok())
        return reportFailure(result);

    const auto& value = *result.value;
    std::cout << "Mode: " << toString(value.mode) << '\n';
    printCounts("Top words", value.top_words);
    printCounts("Nouns", value.nouns);
    printCounts("Verbs", value.verbs);
    return kExitOk;
}

int Application::runPatterns(const processing::TextPipeline& pipeline, const std::string& text)
{
    auto matches = pipeline.findPatterns(text);
    printList("Dates", matches.dates);
    printList("Money", matches.money);
    printList("Emails", matches.emails);
    return kExitOk;
}

void Application::flushPendingErrors()
{
    if (!utils::ErrorReporter::HasPendingErrors())
        return;

    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << "[" << utils::ErrorReporter::SeverityToString(report.severity) << "] "
                  << utils::ErrorReporter::CategoryToString(report.category) << ": " << report.user_message;
        if (!report.technical_details.empty() && config_.diagnostics.verbose)
            std::cerr << " (" << report.technical_details << ")";
        std::cerr << '\n';
    }
}

void Application::cleanup()
{
    pipeline_.reset();
    resources_.reset();
    if (utils::LogManager::IsInitialized())
    {
        PLOG_INFO << "wordchef exiting";
        utils::LogManager::Shutdown();
    }
}
