#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of threads running queued jobs in submission order.
// Destruction drains the queue before joining.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once the pool is shutting down.
    bool submit(Job job);

    // Stops accepting jobs, finishes the queued ones and joins the threads.
    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    void run(std::stop_token stop);

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Job> jobs_;
    bool closed_ = false;
    std::vector<std::jthread> workers_;
};
