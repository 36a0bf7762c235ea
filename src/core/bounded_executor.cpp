#include "core/bounded_executor.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <exception>

namespace core {

BoundedExecutor::BoundedExecutor(int max_workers)
    : max_workers_(std::max(1, max_workers)) {}

BoundedExecutor::~BoundedExecutor() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_task_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void BoundedExecutor::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(task));
        ++in_flight_;
        // Workers are spawned lazily, never more than max_workers_.
        if (static_cast<int>(workers_.size()) < max_workers_ && workers_.size() < in_flight_) {
            workers_.emplace_back(&BoundedExecutor::worker_loop, this);
        }
    }
    cv_task_.notify_one();
}

void BoundedExecutor::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_idle_.wait(lock, [this] { return in_flight_ == 0; });
}

void BoundedExecutor::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_task_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return; // stopping
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& e) {
            log_error(std::string("[executor] task failed: ") + e.what());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
        }
        cv_idle_.notify_all();
    }
}

}
