#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace fastpack::transfer {

// Bounded single-producer/single-consumer hand-off. The producer blocks while
// the channel is full; close() marks the end of the stream, cancel() tells the
// producer to stop and drops whatever is still queued.
template<typename T>
class SegmentChannel {
public:
    explicit SegmentChannel(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}
    
    SegmentChannel(const SegmentChannel&) = delete;
    SegmentChannel& operator=(const SegmentChannel&) = delete;
    
    // Returns false when the consumer cancelled; the item is dropped.
    bool push(T&& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return cancelled_ || items_.size() < capacity_; });
        if (cancelled_ || closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }
    
    // nullopt once the producer closed and the queue is drained, or on cancel.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return cancelled_ || closed_ || !items_.empty(); });
        if (cancelled_ || items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }
    
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
    }
    
    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        items_.clear();
        not_full_.notify_all();
        not_empty_.notify_all();
    }
    
    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }
    
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }
    
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
    bool cancelled_ = false;
};

} // namespace fastpack::transfer
