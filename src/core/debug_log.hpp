// File: src/core/debug_log.hpp
#pragma once

#include <iostream>
#include <mutex>
#include <string>

namespace engram {

/// Component-prefixed log sink
///
/// Writes "[Component] message" lines to a settable stream. Debug lines are
/// only written when debug logging is enabled; warnings and errors always are.
/// Lines from concurrent threads are never interleaved.
class DebugLog {
public:
    explicit DebugLog(std::string component, bool debug_enabled = false)
        : component_(std::move(component)), debug_enabled_(debug_enabled) {}

    /// Set output stream (nullptr silences the log entirely)
    void SetStream(std::ostream* os) { stream_ = os; }

    void SetDebugEnabled(bool enabled) { debug_enabled_ = enabled; }
    bool IsDebugEnabled() const { return debug_enabled_; }

    void Debug(const std::string& message) const {
        if (debug_enabled_) {
            Write("", message);
        }
    }

    void Warning(const std::string& message) const { Write("WARNING: ", message); }

    void Error(const std::string& message) const { Write("ERROR: ", message); }

private:
    void Write(const char* level, const std::string& message) const {
        if (!stream_) {
            return;
        }
        std::lock_guard<std::mutex> lock(StreamMutex());
        *stream_ << "[" << component_ << "] " << level << message << std::endl;
    }

    static std::mutex& StreamMutex() {
        static std::mutex mutex;
        return mutex;
    }

    std::string component_;
    bool debug_enabled_;
    std::ostream* stream_{&std::cerr};
};

} // namespace engram
