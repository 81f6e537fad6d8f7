#pragma once
/**
 * WorkerPool.hpp
 *
 * 고정 크기 worker thread pool. 호출 스레드(mDNS 수신, dispatcher io 스레드)가
 * 네트워크 I/O 로 막히지 않도록 블로킹 작업을 넘겨받아 실행한다.
 *
 * 사용:
 *   WorkerPool pool("poll", 4);
 *   pool.start();
 *   auto fut = pool.submitTask([] { return device->getStatus(); });
 *   pool.stop();   // 대기 중인 작업은 버리고, 실행 중인 작업은 끝날 때까지 join
 *
 * 주의:
 *  - task 에서 던진 예외는 worker 가 잡아 로그로 남긴다 (worker 는 죽지 않음).
 *    submitTask() 로 넣은 경우 예외는 future 로 전달된다.
 *  - stop() 이후 start() 로 다시 시작할 수 있다.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace openfan::common {

class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(std::string name, std::size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    // queued (not yet started) tasks are discarded; running tasks are joined
    void stop();

    bool isRunning() const noexcept { return running_.load(); }

    // returns false if the pool is not running
    bool submit(Task task);

    // packaged variant: result (or exception) is delivered through the future.
    // If the pool is not running the future carries std::runtime_error.
    template <typename F>
    auto submitTask(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        if (!submit([task]() { (*task)(); })) {
            std::promise<R> failed;
            failed.set_exception(std::make_exception_ptr(
                std::runtime_error("WorkerPool '" + name_ + "' is not running")));
            return failed.get_future();
        }
        return fut;
    }

private:
    void workerLoop();

    const std::string name_;
    const std::size_t workerCount_;

    std::deque<Task> taskQueue_;
    mutable std::mutex taskMtx_;
    std::condition_variable taskCv_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::mutex lifecycleMtx_;
};

} // namespace openfan::common
