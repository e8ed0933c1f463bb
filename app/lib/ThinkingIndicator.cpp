#include "ThinkingIndicator.hpp"

namespace {
constexpr int kMaxDots = 3;
constexpr std::size_t kClearWidth = 50;
}

ThinkingIndicator::ThinkingIndicator(std::ostream& out,
                                     std::string label,
                                     std::chrono::milliseconds interval)
    : out_(out)
    , label_(std::move(label))
    , interval_(interval)
{
}

ThinkingIndicator::~ThinkingIndicator()
{
    stop();
}

void ThinkingIndicator::start()
{
    if (worker_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        ticks_ = 0;
    }
    out_ << label_ << std::flush;
    worker_ = std::thread(&ThinkingIndicator::run, this);
}

void ThinkingIndicator::stop()
{
    if (!worker_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    stop_signal_.notify_all();
    worker_.join();

    out_ << '\r' << std::string(kClearWidth, ' ') << '\r' << std::flush;
}

bool ThinkingIndicator::running() const
{
    return worker_.joinable();
}

int ThinkingIndicator::ticks() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ticks_;
}

void ThinkingIndicator::run()
{
    int dots = 0;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_signal_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
        ++ticks_;
        out_ << '.';
        if (++dots > kMaxDots) {
            out_ << "\b\b\b\b    \b\b\b\b";
            dots = 0;
        }
        out_ << std::flush;
    }
}
