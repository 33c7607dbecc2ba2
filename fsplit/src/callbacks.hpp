#pragma once

#include <cstdint>
#include <functional>
#include <string>

// Optional notification sinks for split and restore. Either may be left empty.
// They are called synchronously and must return promptly.
struct Callbacks
{
    // (bytes processed so far, total bytes of the original file), once per chunk.
    std::function<void(uint64_t, uint64_t)> progress;
    // Status text at operation start, finish and manifest save.
    std::function<void(const std::string&)> message;

    void report_progress(uint64_t done, uint64_t total) const
    {
        if (progress) {
            progress(done, total);
        }
    }

    void report_message(const std::string& text) const
    {
        if (message) {
            message(text);
        }
    }
};
