#include "Core/concurrency/PollScheduler.hpp"
#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <utility>

namespace CONCURRENCY {

void SteadyPollClock::sleepFor(std::chrono::steady_clock::duration dur) {
    asio::steady_timer timer(io_ctx_, dur);
    boost::system::error_code ec;
    timer.wait(ec);
    if (ec) {
        throw boost::system::system_error(ec, "poll timer");
    }
}

PollScheduler::PollScheduler(std::chrono::steady_clock::duration interval, std::shared_ptr<IPollClock> clock)
    : interval_(interval), clock_(std::move(clock))
{
    if (!clock_) throw std::invalid_argument("PollScheduler needs a clock");
    if (interval_ <= std::chrono::steady_clock::duration::zero()) {
        throw std::invalid_argument("PollScheduler interval must be positive");
    }
}

std::size_t PollScheduler::runUntil(const std::function<bool()>& step) {
    std::size_t ticks = 0;
    for (;;) {
        ++ticks;
        if (step()) return ticks;
        clock_->sleepFor(interval_);
    }
}

} // namespace CONCURRENCY
