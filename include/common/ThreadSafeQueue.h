#ifndef OPENFAN_THREAD_SAFE_QUEUE_H
#define OPENFAN_THREAD_SAFE_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace openfan::common {

/**
 * @brief A closable thread-safe FIFO used to hand events from worker threads to a consumer thread.
 * @tparam T The type of data to be stored in the queue.
 *
 * After close(), push() is ignored and pops drain what is left, then return std::nullopt.
 */
template <typename T>
class ThreadSafeQueue {
public:
    /**
     * @brief Pushes data to the queue.
     * @param value The data to be pushed.
     * @return False if the queue has been closed.
     */
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) return false;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Pops data from the queue. Waits until data arrives or the queue is closed.
     * @return The data popped from the queue, or std::nullopt once closed and drained.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return takeFront();
    }

    /**
     * @brief Tries to pop data from the queue with a timeout.
     * @param timeout Maximum time to wait.
     * @return The data popped, or std::nullopt on timeout / closed-and-drained.
     */
    std::optional<T> try_pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return takeFront();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

private:
    // caller holds mtx_
    std::optional<T> takeFront() {
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    std::deque<T> queue_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool closed_{false};
};

} // namespace openfan::common

#endif // OPENFAN_THREAD_SAFE_QUEUE_H
