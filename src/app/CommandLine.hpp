#pragma once

#include <cstddef>
#include <optional>
#include <string>

enum class Command
{
    None,
    Normalize,
    Summarize,
    Keywords,
    Patterns,
    Menu
};

struct CommandLine
{
    Command command = Command::None;
    std::string config_path = "config.toml";
    std::optional<std::string> text;
    std::optional<std::string> annotation_path;
    std::optional<std::size_t> max_sentences;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

// Returns false and fills error on a usage error.
bool parseCommandLine(int argc, const char* const* argv, CommandLine& out, std::string& error);

// Non-negative decimal integer; no sign, no trailing characters.
bool parseSentenceCount(const std::string& value, std::size_t& out);

const char* commandName(Command command);

std::string usageText(const char* program);
