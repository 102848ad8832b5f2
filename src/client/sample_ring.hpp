#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer queue of float samples.
// The capture thread pushes whole periods; the streaming loop pops
// everything queued so far.
class SampleRing {
public:
    explicit SampleRing(size_t capacity)
        : slots_(std::max<size_t>(capacity, 1)) {}

    // Producer. Pushes all of `samples` or nothing.
    bool push(std::span<const float> samples) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t tail = tail_.load(std::memory_order_acquire);
        if (samples.size() > slots_.size() - (head - tail)) return false;

        for (float s : samples) {
            slots_[head++ % slots_.size()] = s;
        }
        head_.store(head, std::memory_order_release);
        return true;
    }

    // Consumer.
    std::vector<float> pop_all() {
        size_t tail = tail_.load(std::memory_order_relaxed);
        size_t head = head_.load(std::memory_order_acquire);

        std::vector<float> out;
        out.reserve(head - tail);
        for (; tail != head; ++tail) {
            out.push_back(slots_[tail % slots_.size()]);
        }
        tail_.store(tail, std::memory_order_release);
        return out;
    }

    size_t size() const {
        return head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire);
    }
    size_t capacity() const { return slots_.size(); }

    // Not safe while the producer is running.
    void clear() { tail_.store(head_.load(std::memory_order_acquire), std::memory_order_release); }

private:
    std::vector<float> slots_;
    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
};
