#include "common/WorkerPool.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace openfan::common {

WorkerPool::WorkerPool(std::string name, std::size_t workers)
    : name_(std::move(name)),
      workerCount_(workers == 0 ? 1 : workers) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> lk(lifecycleMtx_);
    if (running_.load()) return;
    running_.store(true);
    for (std::size_t i = 0; i < workerCount_; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
}

void WorkerPool::stop() {
    std::lock_guard<std::mutex> lk(lifecycleMtx_);
    {
        std::lock_guard<std::mutex> tk(taskMtx_);
        if (!running_.load() && workers_.empty()) return;
        running_.store(false);
        if (!taskQueue_.empty()) {
            spdlog::debug("[WorkerPool:{}] discarding {} queued task(s)", name_, taskQueue_.size());
        }
        taskQueue_.clear();
    }
    taskCv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) {
            try {
                t.join();
            } catch (const std::exception& ex) {
                spdlog::error("[WorkerPool:{}] worker join error: {}", name_, ex.what());
            }
        }
    }
    workers_.clear();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lk(taskMtx_);
        if (!running_.load()) return false;
        taskQueue_.push_back(std::move(task));
    }
    taskCv_.notify_one();
    return true;
}

void WorkerPool::workerLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lk(taskMtx_);
            taskCv_.wait(lk, [this]() { return !running_.load() || !taskQueue_.empty(); });
            if (!running_.load()) break;
            task = std::move(taskQueue_.front());
            taskQueue_.pop_front();
        }
        try {
            if (task) task();
        } catch (const std::exception& ex) {
            spdlog::error("[WorkerPool:{}] task threw: {}", name_, ex.what());
        } catch (...) {
            spdlog::error("[WorkerPool:{}] task threw unknown exception", name_);
        }
    }
}

} // namespace openfan::common
