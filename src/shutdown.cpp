#include "shutdown.hpp"
#include <csignal>
#include <cstring>
#include <unistd.h>

namespace queuectl {

static std::atomic<ShutdownFlag*> g_shutdown{nullptr};

static void shutdown_signal_handler(int) {
    ShutdownFlag* flag = g_shutdown.load();
    if (flag && flag->request()) {
        static const char msg[] = "[worker] Shutdown requested, finishing current cycle...\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
    }
}

void install_shutdown_handlers(ShutdownFlag* flag) {
    g_shutdown = flag;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = flag ? shutdown_signal_handler : SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace queuectl
