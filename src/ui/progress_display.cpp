#include "ui/progress_display.hpp"

#include <ftxui/dom/node.hpp>
#include <ftxui/screen/screen.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>

using namespace ftxui;

ProgressDisplay::ProgressDisplay(bool quiet) : quiet_(quiet) {}

ProgressDisplay::~ProgressDisplay() {
    stop_ticker();
    std::lock_guard<std::mutex> lock(mutex_);
    clear_locked();
}

std::string ProgressDisplay::format_bytes(int64_t bytes) {
    std::ostringstream oss;
    if (bytes < 1024) {
        oss << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1)
            << (double)bytes / 1024.0 << " KiB";
    } else {
        oss << std::fixed << std::setprecision(1)
            << (double)bytes / (1024.0 * 1024.0) << " MiB";
    }
    return oss.str();
}

void ProgressDisplay::on_event(const ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (event.kind) {
        case ProgressEvent::Kind::Started:
            bar_active_ = true;
            received_ = 0;
            total_ = event.total;
            break;
        case ProgressEvent::Kind::Advanced:
            bar_active_ = true;
            received_ = event.received;
            total_ = event.total;
            break;
        case ProgressEvent::Kind::Finished:
            bar_active_ = false;
            break;
        case ProgressEvent::Kind::Status:
            status_ = event.text;
            break;
    }
    redraw_locked();
}

void ProgressDisplay::log(const std::string& line) {
    if (quiet_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    clear_locked();
    std::cout << line << "\n";
    redraw_locked();
}

void ProgressDisplay::error(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    clear_locked();
    std::cout << std::flush;
    std::cerr << line << "\n";
    redraw_locked();
}

void ProgressDisplay::start_ticker(std::chrono::milliseconds interval) {
    if (ticking_.exchange(true)) return;
    ticker_ = std::thread([this, interval]() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (ticking_.load()) {
            tick_cv_.wait_for(lock, interval, [this] { return !ticking_.load(); });
            if (!ticking_.load()) break;
            ++frame_;
            redraw_locked();
        }
    });
}

void ProgressDisplay::stop_ticker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ticking_.exchange(false)) return;
    }
    tick_cv_.notify_all();
    if (ticker_.joinable()) {
        ticker_.join();
    }
}

// ── Rendering ───────────────────────────────────────────────

Element ProgressDisplay::render_locked() const {
    Elements rows;

    if (!status_.empty()) {
        rows.push_back(hbox({
            spinner(5, frame_) | color(Color::Green),
            text(" " + status_),
        }));
    }

    if (bar_active_) {
        if (total_ > 0) {
            float ratio = static_cast<float>(received_) / static_cast<float>(total_);
            if (ratio > 1.0f) ratio = 1.0f;
            int pct = static_cast<int>(ratio * 100.0f);
            rows.push_back(hbox({
                text(" " + std::to_string(pct) + "% ") | dim,
                gauge(ratio) | flex,
                text(" " + format_bytes(received_) + "/" + format_bytes(total_)) | dim,
            }));
        } else {
            // Unknown length: show the byte count only
            rows.push_back(hbox({
                spinner(5, frame_),
                text(" " + format_bytes(received_)) | dim,
            }));
        }
    }

    return vbox(std::move(rows));
}

void ProgressDisplay::redraw_locked() {
    clear_locked();
    if (status_.empty() && !bar_active_) return;

    Element document = render_locked();
    auto screen = Screen::Create(Dimension::Full(), Dimension::Fit(document));
    Render(screen, document);
    std::cout << screen.ToString() << std::flush;
    clear_sequence_ = screen.ResetPosition(true);
}

void ProgressDisplay::clear_locked() {
    if (clear_sequence_.empty()) return;
    std::cout << clear_sequence_ << std::flush;
    clear_sequence_.clear();
}
