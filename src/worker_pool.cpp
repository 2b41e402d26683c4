#include "mojrpc/worker_pool.hpp"
#include "mojrpc/error.hpp"
#include <spdlog/spdlog.h>

namespace mojrpc {

WorkerPool::WorkerPool(int threads) {
    if (threads < 1) threads = 1;
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = true;
    threads_.reserve(static_cast<size_t>(threads));
    for (int i = 0; i < threads; ++i) {
        spawn_locked();
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    // No worker is added once running_ is false
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

size_t WorkerPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.size();
}

void WorkerPool::post(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            throw RpcError("Worker pool is stopped");
        }
        tasks_.push(std::move(fn));
        if (idle_ < tasks_.size()) {
            spawn_locked();
            spdlog::debug("worker pool saturated, grown to {} threads", threads_.size());
        }
    }
    cv_.notify_one();
}

void WorkerPool::spawn_locked() {
    // A new worker counts as idle until it takes a task
    ++idle_;
    threads_.emplace_back([this] { run(); });
}

void WorkerPool::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] {
            return !tasks_.empty() || !running_;
        });
        if (!running_ && tasks_.empty()) return;
        auto task = std::move(tasks_.front());
        tasks_.pop();
        --idle_;

        lock.unlock();
        task();
        lock.lock();
        ++idle_;
    }
}

} // namespace mojrpc
