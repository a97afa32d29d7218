#include <gtest/gtest.h>
#include <pthread.h>
#include <csignal>
#include "../../src/common/shutdown_signals.h"

using namespace UpgradeJourney;

namespace {

bool IsBlocked(int sig) {
    sigset_t current;
    sigemptyset(&current);
    pthread_sigmask(SIG_BLOCK, nullptr, &current);
    return sigismember(&current, sig) == 1;
}

} // namespace

TEST(ShutdownSignalsTest, BlocksForItsLifetimeAndRestoresTheMask) {
    ASSERT_FALSE(IsBlocked(SIGUSR1));
    {
        ShutdownSignals signals({SIGUSR1, SIGUSR2});
        EXPECT_TRUE(IsBlocked(SIGUSR1));
        EXPECT_TRUE(IsBlocked(SIGUSR2));
    }
    EXPECT_FALSE(IsBlocked(SIGUSR1));
    EXPECT_FALSE(IsBlocked(SIGUSR2));
}

TEST(ShutdownSignalsTest, WaitTakesThePendingSignalWithoutAHandler) {
    ShutdownSignals signals({SIGUSR1, SIGUSR2});
    // Blocked, so the signal stays pending on this thread instead of
    // terminating the process.
    ASSERT_EQ(pthread_kill(pthread_self(), SIGUSR2), 0);
    EXPECT_EQ(signals.Wait(), SIGUSR2);
}

TEST(ShutdownSignalsTest, ThreadsStartedAfterwardInheritTheMask) {
    ShutdownSignals signals({SIGUSR1});
    bool blocked_in_thread = false;
    pthread_t thread;
    ASSERT_EQ(pthread_create(&thread, nullptr, [](void* arg) -> void* {
        *static_cast<bool*>(arg) = IsBlocked(SIGUSR1);
        return nullptr;
    }, &blocked_in_thread), 0);
    ASSERT_EQ(pthread_join(thread, nullptr), 0);
    EXPECT_TRUE(blocked_in_thread);
}
