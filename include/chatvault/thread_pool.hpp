#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace chatvault {

// Fixed-size worker pool shared by every workflow of a Vault.
// Per-workflow bounds (segment fan-out, delete concurrency) are enforced by
// the callers; the pool only caps total parallelism.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error after shutdown()
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        enqueue([task] { (*task)(); });
        return result;
    }

    // Stop accepting work. With wait=true, queued tasks run first;
    // otherwise they are dropped (their futures report broken_promise).
    void shutdown(bool wait = true);

    size_t size() const { return workers_.size(); }
    size_t pending() const;

private:
    void enqueue(std::function<void()> task);
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

}  // namespace chatvault
