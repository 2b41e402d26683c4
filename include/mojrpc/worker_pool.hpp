#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace mojrpc {

/// Thread pool that starts `threads` workers and adds one whenever a task is
/// queued while no worker is idle, so a queued task never waits behind a
/// running one. Added workers stay until destruction. Tasks still queued at
/// destruction are run before the workers are joined.
class WorkerPool {
public:
    explicit WorkerPool(int threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. The returned future does not block on destruction.
    template<typename F>
    [[nodiscard]] auto submit(F fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        auto fut = task->get_future();
        post([task] { (*task)(); });
        return fut;
    }

    void post(std::function<void()> fn);

    /// Current number of workers.
    [[nodiscard]] size_t size() const;

private:
    void spawn_locked();
    void run();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    size_t idle_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
};

} // namespace mojrpc
