#pragma once

#include "core/progress.hpp"

#include <ftxui/dom/elements.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

/// Terminal progress: a spinner line for status text and a gauge for the
/// download, redrawn in place below the log lines.
class ProgressDisplay : public ProgressSink {
public:
    explicit ProgressDisplay(bool quiet = false);
    ~ProgressDisplay() override;

    void on_event(const ProgressEvent& event) override;
    void log(const std::string& line) override;
    void error(const std::string& line) override;

    /// Background redraw so the spinner moves while the main thread blocks
    void start_ticker(std::chrono::milliseconds interval = std::chrono::milliseconds(100));
    void stop_ticker();

    static std::string format_bytes(int64_t bytes);

private:
    bool quiet_;

    std::mutex mutex_;
    std::string status_;
    bool bar_active_ = false;
    int64_t received_ = 0;
    int64_t total_ = 0;
    size_t frame_ = 0;

    // Escape sequence that erases what was last drawn
    std::string clear_sequence_;

    std::atomic<bool> ticking_{false};
    std::condition_variable tick_cv_;
    std::thread ticker_;

    ftxui::Element render_locked() const;
    void redraw_locked();
    void clear_locked();
};
