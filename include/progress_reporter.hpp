#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

/**
 * Single-line, in-place status display.
 */
class ProgressReporter
{
public:
    explicit ProgressReporter(std::FILE *out = stdout) : out_(out) {}

    /**
     * Overwrite the current status line with `status`: carriage return, the
     * text, then spaces over whatever the previous status left behind.
     * Never writes a newline.
     */
    void report(const std::string &status);

    /**
     * End the status line (newline) if one is showing.
     */
    void finish();

    /**
     * "<bytesSoFar>  [<percent>%]" with two decimals; 0.00% when the total is unknown.
     */
    static std::string formatProgress(std::uint64_t bytesSoFar, std::uint64_t totalBytes);

private:
    std::FILE *out_;
    size_t lastWidth_ = 0;
};
