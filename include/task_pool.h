#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace netspeed {

// Fixed set of worker threads draining one FIFO. submit() never blocks: work
// beyond max_pending queued tasks is rejected so the caller can shed load.
class TaskPool {
public:
    using Task = std::function<void()>;

    TaskPool(size_t workers, size_t max_pending);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    bool submit(Task task);

    // Stops accepting work, runs what is already queued, joins the workers
    void shutdown();

    size_t pending() const;
    size_t worker_count() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<Task> queue_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    size_t max_pending_;
    bool stop_{false};
};

} // namespace netspeed
