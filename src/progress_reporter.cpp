#include "progress_reporter.hpp"

#include <fmt/core.h>

void ProgressReporter::report(const std::string &status)
{
    size_t padding = lastWidth_ > status.size() ? lastWidth_ - status.size() : 0;
    fmt::print(out_, "\r{}{}", status, std::string(padding, ' '));
    std::fflush(out_);
    lastWidth_ = status.size();
}

void ProgressReporter::finish()
{
    if (lastWidth_ == 0)
    {
        return;
    }
    fmt::print(out_, "\n");
    std::fflush(out_);
    lastWidth_ = 0;
}

std::string ProgressReporter::formatProgress(std::uint64_t bytesSoFar, std::uint64_t totalBytes)
{
    double percentage = totalBytes > 0
                            ? static_cast<double>(bytesSoFar) * 100.0 / static_cast<double>(totalBytes)
                            : 0.0;
    return fmt::format("{}  [{:.2f}%]", bytesSoFar, percentage);
}
