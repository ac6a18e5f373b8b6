#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace CONCURRENCY {
namespace asio = boost::asio;

// Source of the wait between two polls. Tests substitute a fake.
class IPollClock {
public:
    virtual ~IPollClock() = default;
    virtual void sleepFor(std::chrono::steady_clock::duration dur) = 0;
};

// Blocks the calling thread on an asio steady_timer.
class SteadyPollClock : public IPollClock {
public:
    SteadyPollClock() = default;

    SteadyPollClock(const SteadyPollClock&) = delete;
    SteadyPollClock& operator=(const SteadyPollClock&) = delete;

    void sleepFor(std::chrono::steady_clock::duration dur) override;

private:
    asio::io_context io_ctx_;
};

/**
 * Runs a poll step on a fixed cadence on the calling thread.
 *
 * The step runs immediately, then once per interval, until it returns true.
 * Not cancellable mid-wait; exceptions thrown by the step propagate.
 */
class PollScheduler {
public:
    PollScheduler(std::chrono::steady_clock::duration interval, std::shared_ptr<IPollClock> clock);

    // Returns the number of ticks the step ran.
    std::size_t runUntil(const std::function<bool()>& step);

    [[nodiscard]] std::chrono::steady_clock::duration interval() const noexcept { return interval_; }

private:
    std::chrono::steady_clock::duration interval_;
    std::shared_ptr<IPollClock> clock_;
};

} // namespace CONCURRENCY
