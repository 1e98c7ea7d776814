#pragma once

#include <cstdint>
#include <iostream>
#include <string>

struct ProgressEvent {
    enum class Kind {
        Started,   // total known (0 = indeterminate)
        Advanced,  // one chunk written
        Finished,  // clear the bar
        Status     // spinner message
    };
    Kind kind = Kind::Status;
    int64_t received = 0;
    int64_t total = 0;
    std::string text;
};

/// Consumer of progress events and user-facing log lines.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void on_event(const ProgressEvent& event) = 0;

    /// Print a line for the user (above any active bar)
    virtual void log(const std::string& line) = 0;

    /// Print an error line to stderr
    virtual void error(const std::string& line) = 0;

    void status(const std::string& text) {
        ProgressEvent e;
        e.kind = ProgressEvent::Kind::Status;
        e.text = text;
        on_event(e);
    }
};

/// Plain line output, no bar. Used for headless runs and --no-progress.
class ConsoleSink : public ProgressSink {
public:
    explicit ConsoleSink(bool quiet = false) : quiet_(quiet) {}

    void on_event(const ProgressEvent& event) override {
        if (event.kind == ProgressEvent::Kind::Status && !event.text.empty()) {
            log(event.text);
        }
    }

    void log(const std::string& line) override {
        if (!quiet_) std::cout << line << "\n";
    }

    void error(const std::string& line) override {
        std::cerr << line << "\n";
    }

private:
    bool quiet_;
};
