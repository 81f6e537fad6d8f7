#pragma once
/**
 * DiscoveryEngine.hpp
 *
 * DNS-SD announcement -> DeviceRegistry.
 *
 * announcement(Added/Updated) 처리 순서 (worker pool 에서):
 *   1. 이름이 namePrefix("uOpenFan")로 시작하지 않으면 무시
 *   2. resolve -> 주소가 없으면 버림 (다음 announcement 를 기다림), port 0 -> 80
 *   3. serial / provisional name 계산
 *   4. 모르는 serial: Device 생성 + 초기 getStatus() (실패해도 등록) + friendly name -> registry.add
 *   5. 아는 serial: address/port 만 갱신 (DeviceFound 재발행 없음)
 *
 * Removed 는 browser 스레드에서 바로 처리. 먼저 큐에 들어갔지만 아직 끝나지 않은
 * announcement 보다 나중에 관측된 removal 이 이긴다 (늦은 insert 는 skip).
 * stop() 이후 끝난 작업의 결과는 버린다.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../comm/IHttpClient.hpp"
#include "../comm/IServiceBrowser.hpp"
#include "../common/WorkerPool.hpp"
#include "../config/Config.hpp"
#include "DeviceRegistry.hpp"

namespace openfan::controller {

struct DiscoveryOptions {
    std::string serviceType{config::SERVICE_TYPE};
    std::string namePrefix{config::DEVICE_NAME_PREFIX};
    std::chrono::milliseconds resolveTimeout{config::DEFAULT_RESOLVE_TIMEOUT_MS};
    std::chrono::milliseconds requestTimeout{config::DEFAULT_REQUEST_TIMEOUT_MS};
    std::size_t workers{config::DEFAULT_DISCOVERY_WORKERS};
};

class DiscoveryEngine {
public:
    using ClientFactory =
        std::function<std::shared_ptr<comm::IHttpClient>(const std::string& host, uint16_t port)>;

    DiscoveryEngine(std::shared_ptr<comm::IServiceBrowser> browser,
                    std::shared_ptr<DeviceRegistry> registry,
                    ClientFactory clientFactory,
                    DiscoveryOptions options = {});
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    // idempotent; start() propagates ConnectionException from the browser
    void start();
    void stop();
    void restart();
    bool isRunning() const noexcept { return running_.load(); }

    // "uOpenFan-AB12._http._tcp.local" -> "AB12"
    static std::string serialFromInstance(const std::string& instanceName);
    // segment of the serial before the first '-', or the whole serial
    static std::string provisionalName(const std::string& serial);
    // provisional name without a leading "uOpenFan-"; "Fan " + last 4 of serial if that is empty
    static std::string friendlyName(const std::string& provisional, const std::string& serial);

private:
    void onServiceEvent(const comm::ServiceEvent& event);
    void processAnnouncement(const std::string& instanceName, uint64_t sequence);
    void processRemoval(const std::string& instanceName);

    std::shared_ptr<comm::IServiceBrowser> browser_;
    std::shared_ptr<DeviceRegistry> registry_;
    ClientFactory clientFactory_;
    const DiscoveryOptions options_;
    common::WorkerPool pool_;

    std::mutex lifecycleMtx_;
    std::atomic<bool> running_{false};

    // orders registry inserts against removals
    std::mutex sequenceMtx_;
    uint64_t nextSequence_{1};
    std::unordered_map<std::string, uint64_t> removedAt_;
};

} // namespace openfan::controller
