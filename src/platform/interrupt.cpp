#include "ctxstage/interrupt.hpp"

#include <csignal>

#include <signal.h>

namespace ctxstage {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;
volatile std::sig_atomic_t g_signal = 0;

extern "C" void on_interrupt(int sig) {
    g_interrupted = 1;
    g_signal = sig;
}

} // namespace

struct InterruptGuard::Saved {
    struct sigaction sigint;
    struct sigaction sigterm;
};

InterruptGuard::InterruptGuard() : saved_(std::make_unique<Saved>()) {
    struct sigaction sa {};
    sa.sa_handler = on_interrupt;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocked read must wake up to forward the signal
    sa.sa_flags = 0;

    sigaction(SIGINT, &sa, &saved_->sigint);
    sigaction(SIGTERM, &sa, &saved_->sigterm);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &saved_->sigint, nullptr);
    sigaction(SIGTERM, &saved_->sigterm, nullptr);
}

bool interrupt_requested() {
    return g_interrupted != 0;
}

int interrupt_signal() {
    return static_cast<int>(g_signal);
}

void request_interrupt() {
    g_interrupted = 1;
}

void clear_interrupt() {
    g_interrupted = 0;
    g_signal = 0;
}

} // namespace ctxstage
