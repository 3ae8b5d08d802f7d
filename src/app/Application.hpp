#pragma once

#include "config/AppConfig.hpp"
#include "CommandLine.hpp"

#include <memory>
#include <string>

class ConfigManager;

namespace processing
{
class LexicalResources;
class TextPipeline;
}

class Application
{
public:
    enum ExitCode
    {
        kExitOk = 0,
        kExitProcessingError = 1,
        kExitUsageError = 2
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool initialize();
    bool initializeLogging();
    void initializeConfig();
    void loadResources();

    int runCommand(Command command);
    int runMenu();

    int runNormalize(const processing::TextPipeline& pipeline, const std::string& text);
    int runSummarize(const processing::TextPipeline& pipeline, const std::string& text, std::size_t max_sentences);
    int runKeywords(const processing::TextPipeline& pipeline, const std::string& text);
    int runPatterns(const processing::TextPipeline& pipeline, const std::string& text);

    void flushPendingErrors();
    void cleanup();

    CommandLine args_;
    AppConfig config_;
    std::unique_ptr<ConfigManager> config_manager_;
    std::shared_ptr<const processing::LexicalResources> resources_;
    std::unique_ptr<processing::TextPipeline> pipeline_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
