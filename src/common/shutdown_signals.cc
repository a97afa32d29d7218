#include "shutdown_signals.h"

#include <pthread.h>
#include <cstring>
#include <stdexcept>
#include <string>

#include <glog/logging.h>

namespace UpgradeJourney {

ShutdownSignals::ShutdownSignals(std::initializer_list<int> signals) {
    sigemptyset(&signals_);
    for (int sig : signals) {
        sigaddset(&signals_, sig);
    }
    int err = pthread_sigmask(SIG_BLOCK, &signals_, &previous_);
    if (err != 0) {
        throw std::runtime_error(std::string("pthread_sigmask failed: ") + strerror(err));
    }
}

ShutdownSignals::~ShutdownSignals() {
    int err = pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    if (err != 0) {
        LOG(ERROR) << "Restoring the signal mask failed: " << strerror(err);
    }
}

int ShutdownSignals::Wait() {
    int sig = 0;
    int err = sigwait(&signals_, &sig);
    if (err != 0) {
        throw std::runtime_error(std::string("sigwait failed: ") + strerror(err));
    }
    VLOG(1) << "Received signal " << sig << " (" << strsignal(sig) << ")";
    return sig;
}

} // namespace UpgradeJourney
