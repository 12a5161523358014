#include "util/signal.hpp"

TError Signal(int signum, void (*handler)(int)) {
    struct sigaction sa = {};

    sa.sa_handler = handler;
    if (sigaction(signum, &sa, NULL))
        return TError::System("Cannot set signal {} action", signum);
    return OK;
}

TError ResetBlockedSignals() {
    sigset_t sigMask;

    sigemptyset(&sigMask);
    if (sigprocmask(SIG_SETMASK, &sigMask, NULL))
        return TError::System("Cannot unblock signals");
    return OK;
}
