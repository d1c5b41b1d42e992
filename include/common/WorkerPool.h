#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace gridpilot {

// Fixed-size pool for work that must not run on the caller thread
// (async event handlers, blocking notification delivery).
class WorkerPool {
public:
    explicit WorkerPool(std::size_t num_workers = 3);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Exceptions thrown by the task are stored in the returned future
    std::future<void> submit(std::function<void()> task);

    // Finish queued work and join all workers. Further submits throw.
    void shutdown();

    std::size_t size() const { return workers_.size(); }
    std::size_t pendingTasks() const;

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::packaged_task<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace gridpilot
