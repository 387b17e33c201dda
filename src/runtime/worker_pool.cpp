#include "streampump/runtime/worker_pool.hpp"

#include <algorithm>

namespace streampump::runtime {

worker_pool::worker_pool(std::size_t threads) {
    const auto count = std::max<std::size_t>(threads, 1U);
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this]() { run(); });
    }
}

worker_pool::~worker_pool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void worker_pool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

std::size_t worker_pool::size() const noexcept {
    return threads_.size();
}

void worker_pool::run() {
    while (true) {
        std::function<void()> next;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !jobs_.empty(); });

            if (stop_ && jobs_.empty()) {
                return;
            }

            next = std::move(jobs_.front());
            jobs_.pop_front();
        }

        next();
    }
}

} // namespace streampump::runtime
