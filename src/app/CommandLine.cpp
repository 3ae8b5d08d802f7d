#include "CommandLine.hpp"

#include <cctype>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace
{

Command commandFromString(const char* arg)
{
    if (std::strcmp(arg, "normalize") == 0)
        return Command::Normalize;
    if (std::strcmp(arg, "summarize") == 0)
        return Command::Summarize;
    if (std::strcmp(arg, "keywords") == 0)
        return Command::Keywords;
    if (std::strcmp(arg, "patterns") == 0)
        return Command::Patterns;
    if (std::strcmp(arg, "menu") == 0)
        return Command::Menu;
    return Command::None;
}

} // namespace

bool parseSentenceCount(const std::string& value, std::size_t& out)
{
    if (value.empty())
        return false;
    for (unsigned char c : value)
    {
        if (!std::isdigit(c))
            return false;
    }
    try
    {
        out = static_cast<std::size_t>(std::stoull(value));
        return true;
    }
    catch (const std::out_of_range&)
    {
        return false;
    }
}

bool parseCommandLine(int argc, const char* const* argv, CommandLine& out, std::string& error)
{
    out = CommandLine{};

    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];
        auto needValue = [&](const char* flag) -> const char*
        {
            if (i + 1 >= argc)
            {
                error = std::string("missing value for ") + flag;
                return nullptr;
            }
            return argv[++i];
        };

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            out.show_help = true;
        }
        else if (std::strcmp(arg, "--version") == 0)
        {
            out.show_version = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0)
        {
            out.verbose = true;
        }
        else if (std::strcmp(arg, "--config") == 0)
        {
            const char* value = needValue(arg);
            if (!value)
                return false;
            out.config_path = value;
        }
        else if (std::strcmp(arg, "--text") == 0)
        {
            const char* value = needValue(arg);
            if (!value)
                return false;
            out.text = value;
        }
        else if (std::strcmp(arg, "--annotation") == 0)
        {
            const char* value = needValue(arg);
            if (!value)
                return false;
            out.annotation_path = value;
        }
        else if (std::strcmp(arg, "--max") == 0)
        {
            const char* value = needValue(arg);
            if (!value)
                return false;
            std::size_t count = 0;
            if (!parseSentenceCount(value, count))
            {
                error = std::string("invalid value for --max: ") + value;
                return false;
            }
            out.max_sentences = count;
        }
        else if (arg[0] == '-')
        {
            error = std::string("unknown option: ") + arg;
            return false;
        }
        else
        {
            if (out.command != Command::None)
            {
                error = std::string("unexpected argument: ") + arg;
                return false;
            }
            out.command = commandFromString(arg);
            if (out.command == Command::None)
            {
                error = std::string("unknown command: ") + arg;
                return false;
            }
        }
    }

    if (out.show_help || out.show_version)
        return true;

    switch (out.command)
    {
    case Command::None:
        error = "no command given";
        return false;
    case Command::Menu:
        return true;
    case Command::Patterns:
        if (!out.text)
        {
            error = "patterns requires --text";
            return false;
        }
        return true;
    default:
        break;
    }

    if (out.text.has_value() == out.annotation_path.has_value())
    {
        error = std::string(commandName(out.command)) + " requires exactly one of --text or --annotation";
        return false;
    }
    if (out.max_sentences && out.command != Command::Summarize)
    {
        error = "--max only applies to summarize";
        return false;
    }
    return true;
}

const char* commandName(Command command)
{
    switch (command)
    {
    case Command::Normalize: return "normalize";
    case Command::Summarize: return "summarize";
    case Command::Keywords: return "keywords";
    case Command::Patterns: return "patterns";
    case Command::Menu: return "menu";
    case Command::None: break;
    }
    return "none";
}

std::string usageText(const char* program)
{
    std::ostringstream oss;
    oss << "Usage: " << program << " [--config <path>] [--verbose] <command> [options]\n"
        << "\n"
        << "Commands:\n"
        << "  normalize --text <s> | --annotation <file.json>\n"
        << "  summarize --text <s> | --annotation <file.json> [--max <n>]\n"
        << "  keywords  --text <s> | --annotation <file.json>\n"
        << "  patterns  --text <s>\n"
        << "  menu      interactive mode\n"
        << "\n"
        << "Options:\n"
        << "  --config <path>  configuration file (default: config.toml)\n"
        << "  --verbose        trace pipeline stages in the processing log\n"
        << "  --help           show this help\n"
        << "  --version        show version\n";
    return oss.str();
}
