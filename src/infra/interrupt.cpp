#include "interrupt.hpp"

#include <signal.h>

namespace ferry::infra {

std::atomic<bool> g_interrupted{false};

namespace {

// spdlog из обработчика сигнала звать нельзя: только флаг
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    struct sigaction action{};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

} // namespace ferry::infra
