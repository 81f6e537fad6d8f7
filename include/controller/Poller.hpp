#pragma once
/**
 * Poller.hpp
 *
 * Poller: registry 에 있는 장치들을 주기적으로 폴링하여 live Device 를 갱신.
 *
 * 사용법 (간단):
 *   auto poller = std::make_shared<Poller>(registry, std::chrono::milliseconds(500));
 *   poller->startUpdates();
 *   poller->setInterval(std::chrono::seconds(10));   // 창이 숨겨졌을 때
 *   poller->pollNow();                               // 즉시 한 사이클
 *   poller->stopUpdates();
 *
 * 주요 동작:
 *  - interval 이 지난 장치마다 worker pool 에서 detach() 한 snapshot 으로 getStatus()
 *  - 장치별 inflight 요청을 추적하여 중복 요청을 피함 (busy 장치는 이번 tick 에서 skip)
 *  - 결과가 live Device 와 같으면 아무 이벤트도 내지 않음, 다르면 StateChanged
 *  - registry 에서 빠졌거나 같은 serial 의 새 Device 로 교체된 경우 결과는 버림
 *  - stopUpdates() 이후 도착한 결과는 버림
 */

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "../common/WorkerPool.hpp"
#include "../config/Config.hpp"
#include "DeviceRegistry.hpp"

namespace openfan::controller {

class Poller {
public:
    using ms = std::chrono::milliseconds;

    Poller(std::shared_ptr<DeviceRegistry> registry,
           ms interval = config::DEFAULT_ACTIVE_POLL_INTERVAL_MS,
           std::size_t workers = config::DEFAULT_POLL_WORKERS);

    ~Poller();

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    // start/stop background poll loop; both idempotent
    void startUpdates();
    void stopUpdates();
    bool isRunning() const;

    // takes effect on the next tick
    void setInterval(ms interval);
    ms interval() const;

    // every idle device is fetched on the next tick regardless of its interval
    void pollNow();

private:
    struct PollOutcome {
        protocol::Result<protocol::FanStatus> result;
        FanState state;
    };

    struct Inflight {
        std::shared_ptr<Device> live;
        std::future<PollOutcome> future;
    };

    void runLoop();
    void scheduleFetch(const std::shared_ptr<Device>& device);
    void handleCompletedInflight();

    std::shared_ptr<DeviceRegistry> registry_;
    common::WorkerPool pool_;

    std::thread worker_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool running_{false};
    bool forceCycle_{false};
    ms interval_;

    // serial -> outstanding fetch; touched only by the loop thread and stopUpdates() after join
    std::unordered_map<std::string, Inflight> inflight_;

    // last polled time per serial (loop thread only)
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> lastPolled_;
};

} // namespace openfan::controller
