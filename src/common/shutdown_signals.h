#ifndef UPGRADE_JOURNEY_SRC_COMMON_SHUTDOWN_SIGNALS_H_
#define UPGRADE_JOURNEY_SRC_COMMON_SHUTDOWN_SIGNALS_H_

#include <csignal>
#include <initializer_list>

namespace UpgradeJourney {

/**
 * Blocks the given signals in the calling thread for the lifetime of the
 * object, so threads created afterwards inherit the mask and never run a
 * handler. Wait() then takes a pending signal synchronously; whatever runs
 * after it is ordinary thread context, not a signal handler.
 */
class ShutdownSignals {
public:
    // Throws std::runtime_error when the signal mask cannot be changed.
    explicit ShutdownSignals(std::initializer_list<int> signals);
    ~ShutdownSignals();

    ShutdownSignals(const ShutdownSignals&) = delete;
    ShutdownSignals& operator=(const ShutdownSignals&) = delete;

    // Blocks until one of the signals is pending and returns its number.
    int Wait();

private:
    sigset_t signals_;
    sigset_t previous_;
};

} // namespace UpgradeJourney

#endif // UPGRADE_JOURNEY_SRC_COMMON_SHUTDOWN_SIGNALS_H_
