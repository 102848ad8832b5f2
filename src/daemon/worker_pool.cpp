#include "worker_pool.hpp"

#include <algorithm>

WorkerPool::WorkerPool(size_t threads) {
    threads = std::max<size_t>(threads, 1);
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; i++) {
        workers_.emplace_back([this](std::stop_token stop) { run(stop); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Job job) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (closed_ && workers_.empty()) return;
        closed_ = true;
    }
    cv_.notify_all();
    workers_.clear(); // jthread joins; workers exit once the queue is empty
}

void WorkerPool::run(std::stop_token stop) {
    for (;;) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, stop, [this] { return closed_ || !jobs_.empty(); });
            if (jobs_.empty()) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job();
    }
}
