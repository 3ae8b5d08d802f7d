#include "Diagnostics.hpp"
#include "../utils/LogManager.hpp"

#include <algorithm>

#include <plog/Log.h>
#include <utf8proc.h>

namespace processing
{

namespace
{

// Bytes of the code point starting at pos; an invalid sequence counts as one byte.
std::size_t sequenceLength(std::string_view text, std::size_t pos)
{
    utf8proc_int32_t codepoint;
    utf8proc_ssize_t bytes = utf8proc_iterate(reinterpret_cast<const utf8proc_uint8_t*>(text.data() + pos),
                                              static_cast<utf8proc_ssize_t>(text.size() - pos), &codepoint);
    return bytes > 0 ? static_cast<std::size_t>(bytes) : 1;
}

} // anonymous namespace

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

bool Diagnostics::InitializeLogger(const std::string& file_name, bool console)
{
    utils::LogManager::LoggerConfig config;
    config.name = "processing";
    config.filepath = utils::LogManager::LogPath(file_name);
    config.add_console_appender = console;
    return utils::LogManager::RegisterLogger<kLogInstance>(config);
}

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t code_points) noexcept
{
    if (code_points == 0)
        code_points = 1;
    max_preview_.store(code_points, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = MaxPreview();
    std::string out;
    out.reserve(std::min(text.size(), limit * 2) + 16);

    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size() && count < limit)
    {
        const char ch = text[pos];
        switch (ch)
        {
        case '\n':
            out += "\\n";
            ++pos;
            break;
        case '\r':
            out += "\\r";
            ++pos;
            break;
        case '\t':
            out += "\\t";
            ++pos;
            break;
        default:
        {
            // Never split a multi-byte sequence
            std::size_t len = sequenceLength(text, pos);
            out.append(text.substr(pos, len));
            pos += len;
            break;
        }
        }
        ++count;
    }

    if (pos < text.size())
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    sanitize(out);
    return out;
}

void Diagnostics::LogDegradation(std::string_view component, std::string_view reason)
{
    PLOG_WARNING_(kLogInstance) << "[" << component << "] degraded reason=" << reason;
}

void Diagnostics::sanitize(std::string& text)
{
    auto is_control = [](unsigned char c)
    {
        return c < 0x20 && c != '\n' && c != '\r' && c != '\t';
    };
    std::replace_if(text.begin(), text.end(), is_control, '?');
}

} // namespace processing
