// progress.hpp: console progress bar for batch runs (indicators)
#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include <indicators/cursor_control.hpp>
#include <indicators/progress_bar.hpp>

#if !defined(_WIN32)
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace antsim::io {

inline int terminal_width() {
    if (const char* env = std::getenv("COLUMNS")) {
        int c = std::atoi(env); if (c > 0) return c;
    }
#if !defined(_WIN32)
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) return (int)w.ws_col;
#endif
    return 80;
}

// Workers call tick() (lock-free); a background thread redraws the bar every
// 100ms so the hot loop never touches the terminal.
class BatchProgress {
public:
    explicit BatchProgress(std::size_t total) : total_(total == 0 ? 1 : total) {}
    ~BatchProgress() { stop(); }

    BatchProgress(const BatchProgress&) = delete;
    BatchProgress& operator=(const BatchProgress&) = delete;

    void tick(std::size_t done) {
        std::size_t prev = done_.load(std::memory_order_relaxed);
        while (prev < done && !done_.compare_exchange_weak(prev, done, std::memory_order_relaxed)) {}
    }

    void start() {
        indicators::show_console_cursor(false);
        const int barW = std::clamp(terminal_width() - 40, 10, 50);
        bar_ = std::make_unique<indicators::ProgressBar>(
            indicators::option::BarWidth{barW},
            indicators::option::Start{"["},
            indicators::option::Fill{"="},
            indicators::option::Lead{">"},
            indicators::option::Remainder{" "},
            indicators::option::End{"]"},
            indicators::option::ForegroundColor{indicators::Color::green},
            indicators::option::ShowElapsedTime{true},
            indicators::option::ShowRemainingTime{true},
            indicators::option::MaxProgress{total_}
        );

        stop_flag_.store(false, std::memory_order_relaxed);
        th_ = std::thread([this]() {
            using namespace std::chrono_literals;
            std::size_t last = static_cast<std::size_t>(-1);
            while (true) {
                const std::size_t n = done_.load(std::memory_order_relaxed);
                if (n != last) {
                    bar_->set_option(indicators::option::PostfixText{
                        std::to_string(n) + "/" + std::to_string(total_) + " runs"});
                    bar_->set_progress(n);
                    last = n;
                }
                if (n >= total_ || stop_flag_.load(std::memory_order_relaxed)) break;
                std::this_thread::sleep_for(100ms);
            }
            if (!bar_->is_completed()) bar_->mark_as_completed();
            indicators::show_console_cursor(true);
        });
    }

    void stop() {
        stop_flag_.store(true, std::memory_order_relaxed);
        if (th_.joinable()) th_.join();
        bar_.reset();
    }

private:
    std::size_t total_;
    std::atomic<std::size_t> done_{0};
    std::unique_ptr<indicators::ProgressBar> bar_;
    std::atomic<bool> stop_flag_{false};
    std::thread th_;
};

} // namespace antsim::io
