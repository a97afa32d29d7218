#include "retry.h"

#include <algorithm>
#include <thread>

#include <glog/logging.h>

namespace UpgradeJourney {

Clock::TimePoint SteadyClock::Now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::SleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

Clock& DefaultClock() {
    static SteadyClock instance;
    return instance;
}

RetryPolicy RetryPolicy::Fixed(int max_attempts, std::chrono::milliseconds interval) {
    RetryPolicy policy;
    policy.max_attempts = max_attempts;
    policy.initial_interval = interval;
    policy.backoff_multiplier = 1.0;
    policy.max_interval = interval;
    return policy;
}

std::chrono::milliseconds RetryPolicy::IntervalAfter(int attempt) const {
    double interval = static_cast<double>(initial_interval.count());
    for (int i = 1; i < attempt; ++i) {
        interval *= backoff_multiplier;
        if (max_interval.count() > 0 && interval >= static_cast<double>(max_interval.count())) {
            break;
        }
    }
    auto result = std::chrono::milliseconds(static_cast<int64_t>(interval));
    if (max_interval.count() > 0) {
        result = std::min(result, max_interval);
    }
    return result;
}

std::chrono::milliseconds RetryPolicy::TotalBudget() const {
    std::chrono::milliseconds total{0};
    for (int attempt = 1; attempt < max_attempts; ++attempt) {
        total += IntervalAfter(attempt);
    }
    return total;
}

bool Retrier::Poll(const std::function<bool()>& condition, const std::string& operation) const {
    int attempts = std::max(policy_.max_attempts, 1);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (condition()) {
            VLOG(2) << operation << " succeeded after " << attempt << " attempt(s)";
            return true;
        }
        if (attempt == attempts) {
            break;
        }
        auto interval = policy_.IntervalAfter(attempt);
        VLOG(3) << operation << ": attempt " << attempt << "/" << attempts
                << " not yet satisfied, sleeping " << interval.count() << "ms";
        clock_.SleepFor(interval);
    }
    LOG(WARNING) << operation << " not satisfied after " << attempts << " attempt(s) over "
                 << policy_.TotalBudget().count() << "ms";
    return false;
}

} // namespace UpgradeJourney
