#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace core {

// Runs submitted tasks on at most `max_workers` threads. Tasks must not throw
// out of the executor; wait_all() blocks until every submitted task finished.
class BoundedExecutor {
public:
    explicit BoundedExecutor(int max_workers);
    ~BoundedExecutor();

    BoundedExecutor(const BoundedExecutor&) = delete;
    BoundedExecutor& operator=(const BoundedExecutor&) = delete;

    void submit(std::function<void()> task);
    void wait_all();

    int max_workers() const { return max_workers_; }

private:
    void worker_loop();

    int max_workers_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_task_;
    std::condition_variable cv_idle_;
    size_t in_flight_ = 0;
    bool stopping_ = false;
};

}
