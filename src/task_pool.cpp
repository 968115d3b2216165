#include "task_pool.h"
#include <exception>
#include <iostream>

namespace netspeed {

TaskPool::TaskPool(size_t workers, size_t max_pending)
    : max_pending_(max_pending) {
    if (workers == 0) {
        workers = 1;
    }
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back(&TaskPool::worker_loop, this);
    }
}

TaskPool::~TaskPool() {
    shutdown();
}

bool TaskPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stop_ || queue_.size() >= max_pending_) {
            return false;
        }
        queue_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void TaskPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

size_t TaskPool::pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

void TaskPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [&]{ return stop_ || !queue_.empty(); });
            if (stop_ && queue_.empty()) break;
            task = std::move(queue_.front());
            queue_.pop();
        }
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[TaskPool] Task failed: " << e.what() << std::endl;
        }
    }
}

} // namespace netspeed
