#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    // Registers the processing logger (instance kLogInstance) with utils::LogManager.
    static bool InitializeLogger(const std::string& file_name = "processing.log", bool console = false);

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    // Preview limit in code points; 0 is clamped to 1.
    static void SetMaxPreview(std::size_t code_points) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    [[nodiscard]] static std::string Preview(std::string_view text);

    // Logs that a call ran on a reduced path (e.g. no annotator available).
    static void LogDegradation(std::string_view component, std::string_view reason);

private:
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace processing
