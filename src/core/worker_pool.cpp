#include "core/worker_pool.hpp"
#include "core/log.hpp"
#include <string>
#include <system_error>

namespace chromadex {

WorkerPool::WorkerPool(int size) {
    if (size < 1) {
        throw std::runtime_error("worker pool size must be at least 1");
    }

    workers_.reserve(static_cast<size_t>(size));
    try {
        for (int i = 0; i < size; ++i) {
            workers_.emplace_back([this]() { worker_loop(); });
        }
    } catch (const std::system_error& e) {
        shutdown();
        throw std::runtime_error(std::string("failed to start worker pool: ") + e.what());
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job();
    }
}

void WorkerPool::warm_up() {
    const int n = size();
    std::mutex arrived_mutex;
    std::condition_variable arrived_cv;
    int arrived = 0;

    std::vector<std::future<void>> futures;
    futures.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        // Each job holds its worker until all of them have arrived, so every
        // thread is exercised once.
        futures.push_back(submit([&]() {
            std::unique_lock<std::mutex> lock(arrived_mutex);
            ++arrived;
            arrived_cv.notify_all();
            arrived_cv.wait(lock, [&] { return arrived >= n; });
        }));
    }
    for (auto& f : futures) {
        f.get();
    }
    log_debug("worker pool warmed up with " + std::to_string(n) + " threads");
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

}
