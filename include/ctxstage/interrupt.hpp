#pragma once

#include <memory>

namespace ctxstage {

// ============================================================================
// User Interrupt
// ============================================================================
//
// While an InterruptGuard is alive, SIGINT and SIGTERM do not terminate the
// process. They set a flag instead, blocking system calls return EINTR, and
// the pipeline unwinds through its normal cleanup path.

class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    struct Saved;
    std::unique_ptr<Saved> saved_;
};

bool interrupt_requested();

// Signal number that was caught, 0 if none (or the interrupt was simulated)
int interrupt_signal();

// Mark the run as interrupted without a signal
void request_interrupt();

void clear_interrupt();

} // namespace ctxstage
