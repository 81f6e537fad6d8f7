#pragma once
/**
 * FanManager.hpp
 *
 * Manager that orchestrates discovery, polling and command dispatch for every OpenFan on the LAN.
 *
 * Responsibilities:
 *  - own the DeviceRegistry and hand it (shared) to every component
 *  - create and manage DiscoveryEngine, Poller and CommandDispatcher lifecycles
 *  - switch the poll cadence between active (view visible) and idle keep-alive
 *  - provide a simplified API for front ends (intents, presets, event subscription)
 *
 * Threading:
 *  - All public methods are thread-safe
 *  - Event handlers run on the publishing component's thread; keep them short
 *
 * Teardown order on stop(): discovery -> poller -> dispatcher.
 */

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../comm/IHttpClient.hpp"
#include "../comm/IServiceBrowser.hpp"
#include "../config/Config.hpp"
#include "CommandDispatcher.hpp"
#include "DeviceRegistry.hpp"
#include "DiscoveryEngine.hpp"
#include "Poller.hpp"

namespace openfan::controller {

struct ManagerOptions {
    std::chrono::milliseconds activeInterval{config::DEFAULT_ACTIVE_POLL_INTERVAL_MS};
    std::chrono::milliseconds idleInterval{config::DEFAULT_IDLE_POLL_INTERVAL_MS};
    std::chrono::milliseconds debounce{config::DEFAULT_DEBOUNCE_MS};
    std::chrono::milliseconds requestTimeout{config::DEFAULT_REQUEST_TIMEOUT_MS};
    std::chrono::milliseconds resolveTimeout{config::DEFAULT_RESOLVE_TIMEOUT_MS};
    std::chrono::milliseconds mdnsRequeryInterval{config::DEFAULT_MDNS_REQUERY_INTERVAL_MS};
    std::size_t discoveryWorkers{config::DEFAULT_DISCOVERY_WORKERS};
    std::size_t pollWorkers{config::DEFAULT_POLL_WORKERS};
    std::size_t commandWorkers{config::DEFAULT_COMMAND_WORKERS};
    std::size_t httpPoolCapacity{config::DEFAULT_HTTP_POOL_CAPACITY};
    std::string serviceType{config::SERVICE_TYPE};
    std::string namePrefix{config::DEVICE_NAME_PREFIX};
    bool startVisible{false};
};

class FanManager {
public:
    using EventHandler = DeviceRegistry::EventHandler;
    using SubscriptionId = DeviceRegistry::SubscriptionId;

    // real network: mDNS browser + Beast HTTP clients
    explicit FanManager(ManagerOptions options = {});

    // injected browser / client factory (tests, alternative transports)
    FanManager(ManagerOptions options,
               std::shared_ptr<comm::IServiceBrowser> browser,
               DiscoveryEngine::ClientFactory clientFactory);

    ~FanManager();

    // non-copyable
    FanManager(const FanManager&) = delete;
    FanManager& operator=(const FanManager&) = delete;

    // throws protocol::ConnectionException if the browser socket cannot be opened
    void start();
    void stop();
    bool isRunning() const;

    // "Refresh fans": restart browsing from scratch (registry is kept)
    void refreshDiscovery();

    // visible -> active poll interval + immediate poll; hidden -> idle keep-alive interval
    void setVisible(bool visible);
    bool isVisible() const;
    void pollNow();

    // intents
    bool setSpeed(const std::string& serial, int percent);
    bool setPower(const std::string& serial, bool on);
    bool toggle(const std::string& serial);
    // preset: same speed for every registered device; returns how many accepted it
    std::size_t setAllSpeed(int percent);

    bool waitIdle(std::chrono::milliseconds timeout);

    SubscriptionId subscribe(EventHandler handler);
    void unsubscribe(SubscriptionId id);

    std::vector<std::shared_ptr<Device>> devices() const;
    std::shared_ptr<DeviceRegistry> registry() const noexcept { return registry_; }

private:
    ManagerOptions options_;

    // core owned components
    std::shared_ptr<DeviceRegistry> registry_;
    std::shared_ptr<comm::IServiceBrowser> browser_;
    std::unique_ptr<DiscoveryEngine> discovery_;
    std::unique_ptr<Poller> poller_;
    std::unique_ptr<CommandDispatcher> dispatcher_;

    mutable std::mutex mtx_;
    bool running_{false};
    bool visible_{false};
};

} // namespace openfan::controller
