#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace chromadex {

// Fixed-size pool for CPU-bound jobs. Sized once at construction.
class WorkerPool {
public:
    explicit WorkerPool(int size);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<typename std::invoke_result<Fn>::type> {
        using R = typename std::invoke_result<Fn>::type;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        std::future<R> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("worker pool is shut down");
            }
            jobs_.emplace_back([task]() { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    // Blocks until every worker thread has picked up and run one job.
    void warm_up();

    // Finishes queued jobs and joins the workers.
    void shutdown();

    int size() const { return static_cast<int>(workers_.size()); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

}
