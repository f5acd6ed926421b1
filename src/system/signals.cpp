#include "system/signals.hpp"

#include <csignal>

namespace updsrv {

std::atomic_bool g_cancel{false};

namespace {

void HandleTermination(int sig) {
    if (g_cancel.exchange(true, std::memory_order_relaxed)) {
        // Already cancelling: fall back to the default action.
        std::signal(sig, SIG_DFL);
        std::raise(sig);
    }
}

void Install(int sig, void (*handler)(int)) {
    struct sigaction sa{};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    ::sigaction(sig, &sa, nullptr);
}

} // namespace

void InstallSignalHandlers() {
    Install(SIGINT, HandleTermination);
    Install(SIGTERM, HandleTermination);
    Install(SIGPIPE, SIG_IGN);
}

CancelToken ProcessCancelToken() {
    return CancelToken::FromFlag(g_cancel);
}

} // namespace updsrv
