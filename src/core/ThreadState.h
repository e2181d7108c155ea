#ifndef THREAD_STATE_H
#define THREAD_STATE_H

#include <atomic>

namespace Threading {

/**
 * @brief Application-wide "keep running" flag.
 *
 * Cleared once on shutdown so every background Task stops at its next
 * shouldContinue() check. Per-task cancellation goes through Task::cancel().
 */
class ThreadState {
public:
    /** @return false if a global cancellation was requested. */
    static bool shouldRun() {
        return s_shouldRun.load(std::memory_order_acquire);
    }

    static void setRun(bool run) {
        s_shouldRun.store(run, std::memory_order_release);
    }

private:
    static inline std::atomic<bool> s_shouldRun{true};
};

inline void setThreadRun(bool run) { ThreadState::setRun(run); }

} // namespace Threading

#endif // THREAD_STATE_H
