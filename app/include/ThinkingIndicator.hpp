#ifndef THINKING_INDICATOR_HPP
#define THINKING_INDICATOR_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

/**
 * "<bot> is thinking..." animation drawn on a background thread while a
 * provider call is in flight. Purely cosmetic.
 *
 * The worker only writes while the owning thread is blocked in the provider
 * call; stop() joins it and clears the line before the reply is printed.
 */
class ThinkingIndicator {
public:
    ThinkingIndicator(std::ostream& out,
                      std::string label,
                      std::chrono::milliseconds interval = std::chrono::milliseconds(500));
    ~ThinkingIndicator();

    ThinkingIndicator(const ThinkingIndicator&) = delete;
    ThinkingIndicator& operator=(const ThinkingIndicator&) = delete;

    void start();

    /**
     * Request cancellation, join the worker and erase the line. Idempotent.
     */
    void stop();

    bool running() const;

    /**
     * Number of dots drawn since start() (for testing)
     */
    int ticks() const;

private:
    void run();

    std::ostream& out_;
    std::string label_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable stop_signal_;
    bool stop_requested_{false};
    int ticks_{0};
    std::thread worker_;
};

#endif // THINKING_INDICATOR_HPP
