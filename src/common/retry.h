#ifndef UPGRADE_JOURNEY_SRC_COMMON_RETRY_H_
#define UPGRADE_JOURNEY_SRC_COMMON_RETRY_H_

#include <chrono>
#include <functional>
#include <string>

namespace UpgradeJourney {

/**
 * Time source for every bounded wait in the harness. Tests substitute a clock
 * whose SleepFor advances virtual time instead of blocking.
 */
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint Now() const = 0;
    virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint Now() const override;
    void SleepFor(std::chrono::milliseconds duration) override;
};

// Process-wide steady clock.
Clock& DefaultClock();

struct RetryPolicy {
    int max_attempts = 1;
    std::chrono::milliseconds initial_interval{0};
    double backoff_multiplier = 1.0;
    std::chrono::milliseconds max_interval{0};

    static RetryPolicy Fixed(int max_attempts, std::chrono::milliseconds interval);

    // Sleep taken after the given (1-based) failed attempt.
    std::chrono::milliseconds IntervalAfter(int attempt) const;

    // Total time slept when every attempt fails.
    std::chrono::milliseconds TotalBudget() const;
};

/**
 * Bounded polling: a condition is evaluated up to max_attempts times with a
 * back-off sleep between consecutive attempts. There is no sleep after the
 * last attempt. Exceptions thrown by the condition are not caught.
 */
class Retrier {
public:
    Retrier(RetryPolicy policy, Clock& clock) : policy_(policy), clock_(clock) {}

    // Returns true as soon as condition() does, false once attempts are exhausted.
    bool Poll(const std::function<bool()>& condition, const std::string& operation) const;

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    Clock& clock_;
};

} // namespace UpgradeJourney

#endif // UPGRADE_JOURNEY_SRC_COMMON_RETRY_H_
