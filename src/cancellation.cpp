#include "cancellation.hpp"

#include <pthread.h>

#include <stdexcept>
#include <thread>

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        std::this_thread::yield();
        return cancelled();
    }
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, interval, [&] { return cancelled_.load(); });
}

void CancellationToken::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return cancelled_.load(); });
}


SignalCancellation::SignalCancellation(CancellationToken& token) : token_(token) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals_, nullptr) != 0) {
        throw std::runtime_error("pthread_sigmask failed");
    }
    watcher_ = std::thread([this] {
        int sig = 0;
        if (sigwait(&signals_, &sig) != 0) return;
        if (shutting_down_) return;
        last_signal_ = sig;
        token_.cancel();
    });
}

SignalCancellation::~SignalCancellation() {
    shutting_down_ = true;
    if (watcher_.joinable()) {
        if (last_signal_ == 0) pthread_kill(watcher_.native_handle(), SIGTERM);
        watcher_.join();
    }
}
