#ifndef DCARCHIVE_RUNTIME_CANCELLATION_H
#define DCARCHIVE_RUNTIME_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <thread>

namespace dcarchive {

enum class CancelReason { NONE, INTERRUPT, TIMEOUT };

const char *cancel_reason_name(CancelReason reason);

/**
 * Cooperative stop flag. Checked between tasks, never inside a flush.
 * The first reason to arrive wins.
 */
class CancellationToken {
   public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    // Async-signal-safe
    bool cancel(CancelReason reason);
    bool is_cancelled() const { return reason_.load() != 0; }
    CancelReason reason() const {
        return static_cast<CancelReason>(reason_.load());
    }

   private:
    std::atomic<int> reason_{0};
};

/**
 * Routes SIGINT and SIGTERM to a token while in scope and restores the
 * previous handlers on destruction. The first signal cancels the token; a
 * second signal terminates the process immediately with status 130 without
 * flushing staged data.
 * Only one guard may be active at a time.
 */
class InterruptGuard {
   public:
    explicit InterruptGuard(CancellationToken &token);
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard &) = delete;
    InterruptGuard &operator=(const InterruptGuard &) = delete;

   private:
    static void handle_signal(int signum);

    struct sigaction previous_int_;
    struct sigaction previous_term_;
};

/**
 * Cancels a token with TIMEOUT once a wall-clock budget elapses.
 */
class Watchdog {
   public:
    Watchdog(CancellationToken &token, std::chrono::milliseconds budget);
    ~Watchdog();

    Watchdog(const Watchdog &) = delete;
    Watchdog &operator=(const Watchdog &) = delete;

    void stop();

   private:
    void run(std::chrono::steady_clock::time_point deadline);

    CancellationToken &token_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
    std::thread thread_;
};

}  // namespace dcarchive

#endif  // DCARCHIVE_RUNTIME_CANCELLATION_H
