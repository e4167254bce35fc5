#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <thread>

// Cooperative stop signal shared between the orchestration thread and
// whoever wants to abort it (signal thread, tests).
class CancellationToken {
public:
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    // Sleeps up to `interval`. Returns true if the token was cancelled.
    bool wait_for(std::chrono::milliseconds interval);

    // Blocks until cancel() is called.
    void wait();

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};


// Routes SIGINT/SIGTERM to a CancellationToken. Construct it before any
// other thread starts: it blocks both signals for the process and receives
// them on its own thread with sigwait().
class SignalCancellation {
public:
    explicit SignalCancellation(CancellationToken& token);
    ~SignalCancellation();

    SignalCancellation(const SignalCancellation&) = delete;
    SignalCancellation& operator=(const SignalCancellation&) = delete;

    int last_signal() const { return last_signal_.load(); }

private:
    CancellationToken& token_;
    sigset_t signals_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<int> last_signal_{0};
    std::thread watcher_;
};
