#include <dcarchive/common/logging.h>
#include <dcarchive/runtime/cancellation.h>
#include <unistd.h>

#include <cstring>
#include <stdexcept>

namespace dcarchive {

namespace {
std::atomic<CancellationToken *> g_signal_token{nullptr};
std::atomic<int> g_interrupt_count{0};
}  // namespace

const char *cancel_reason_name(CancelReason reason) {
    switch (reason) {
        case CancelReason::INTERRUPT:
            return "interrupt";
        case CancelReason::TIMEOUT:
            return "timeout";
        case CancelReason::NONE:
        default:
            return "none";
    }
}

bool CancellationToken::cancel(CancelReason reason) {
    int expected = 0;
    return reason_.compare_exchange_strong(expected, static_cast<int>(reason));
}

void InterruptGuard::handle_signal(int) {
    CancellationToken *token = g_signal_token.load();
    if (token == nullptr) return;

    token->cancel(CancelReason::INTERRUPT);
    if (g_interrupt_count.fetch_add(1) > 0) {
        static const char message[] =
            "\nSecond interrupt received, exiting immediately. Staged data "
            "that was not flushed is lost.\n";
        ssize_t ignored = ::write(STDERR_FILENO, message, sizeof(message) - 1);
        (void)ignored;
        ::_exit(130);
    }
    static const char message[] =
        "\nInterrupt received, finishing in-flight tasks and flushing. "
        "Interrupt again to force exit.\n";
    ssize_t ignored = ::write(STDERR_FILENO, message, sizeof(message) - 1);
    (void)ignored;
}

InterruptGuard::InterruptGuard(CancellationToken &token) {
    CancellationToken *expected = nullptr;
    if (!g_signal_token.compare_exchange_strong(expected, &token)) {
        throw std::logic_error("An InterruptGuard is already installed");
    }
    g_interrupt_count.store(0);

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &InterruptGuard::handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    sigaction(SIGINT, &action, &previous_int_);
    sigaction(SIGTERM, &action, &previous_term_);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &previous_int_, nullptr);
    sigaction(SIGTERM, &previous_term_, nullptr);
    g_signal_token.store(nullptr);
}

Watchdog::Watchdog(CancellationToken &token, std::chrono::milliseconds budget)
    : token_(token) {
    auto deadline = std::chrono::steady_clock::now() + budget;
    thread_ = std::thread([this, deadline] { run(deadline); });
}

Watchdog::~Watchdog() { stop(); }

void Watchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Watchdog::run(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_until(lock, deadline, [this] { return stopped_; })) {
        return;
    }
    if (token_.cancel(CancelReason::TIMEOUT)) {
        DCARCHIVE_LOG_WARN(
            "Time budget exhausted, no new tasks will be started");
    }
}

}  // namespace dcarchive
