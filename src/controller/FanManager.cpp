// src/controller/FanManager.cpp
#include "controller/FanManager.hpp"
#include "comm/BeastHttpClient.hpp"
#include "comm/MdnsServiceBrowser.hpp"

#include <spdlog/spdlog.h>

namespace openfan::controller {

namespace {

DiscoveryOptions discoveryOptionsFrom(const ManagerOptions& o) {
    DiscoveryOptions d;
    d.serviceType = o.serviceType;
    d.namePrefix = o.namePrefix;
    d.resolveTimeout = o.resolveTimeout;
    d.requestTimeout = o.requestTimeout;
    d.workers = o.discoveryWorkers;
    return d;
}

} // namespace

FanManager::FanManager(ManagerOptions options)
    : FanManager(options,
                 std::make_shared<comm::MdnsServiceBrowser>(options.mdnsRequeryInterval),
                 [capacity = options.httpPoolCapacity](const std::string& host, uint16_t port) {
                     return std::make_shared<comm::BeastHttpClient>(host, port, capacity);
                 }) {}

FanManager::FanManager(ManagerOptions options,
                       std::shared_ptr<comm::IServiceBrowser> browser,
                       DiscoveryEngine::ClientFactory clientFactory)
    : options_(std::move(options)),
      registry_(std::make_shared<DeviceRegistry>()),
      browser_(std::move(browser)),
      visible_(options_.startVisible) {
    discovery_ = std::make_unique<DiscoveryEngine>(browser_, registry_, std::move(clientFactory),
                                                   discoveryOptionsFrom(options_));
    poller_ = std::make_unique<Poller>(registry_,
                                       visible_ ? options_.activeInterval : options_.idleInterval,
                                       options_.pollWorkers);
    dispatcher_ = std::make_unique<CommandDispatcher>(registry_, options_.debounce, options_.commandWorkers);
}

FanManager::~FanManager() {
    stop();
}

void FanManager::start() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_) return;

    dispatcher_->start();
    poller_->startUpdates();
    try {
        discovery_->start();
    } catch (const std::exception& ex) {
        poller_->stopUpdates();
        dispatcher_->stop();
        spdlog::error("[FanManager] start failed: {}", ex.what());
        throw;
    }
    running_ = true;
    spdlog::info("[FanManager] started ({} poll {} ms)", visible_ ? "active" : "idle",
                 poller_->interval().count());
}

void FanManager::stop() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!running_) return;
    running_ = false;

    discovery_->stop();
    poller_->stopUpdates();
    dispatcher_->stop();
    spdlog::info("[FanManager] stopped");
}

bool FanManager::isRunning() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return running_;
}

void FanManager::refreshDiscovery() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!running_) return;
    discovery_->restart();
}

void FanManager::setVisible(bool visible) {
    std::lock_guard<std::mutex> lk(mtx_);
    visible_ = visible;
    poller_->setInterval(visible ? options_.activeInterval : options_.idleInterval);
    if (visible) poller_->pollNow();
}

bool FanManager::isVisible() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return visible_;
}

void FanManager::pollNow() {
    poller_->pollNow();
}

bool FanManager::setSpeed(const std::string& serial, int percent) {
    return dispatcher_->setSpeed(serial, percent);
}

bool FanManager::setPower(const std::string& serial, bool on) {
    return dispatcher_->setPower(serial, on);
}

bool FanManager::toggle(const std::string& serial) {
    return dispatcher_->toggle(serial);
}

std::size_t FanManager::setAllSpeed(int percent) {
    std::size_t accepted = 0;
    for (const auto& device : registry_->all()) {
        if (dispatcher_->setSpeed(device->serial(), percent)) ++accepted;
    }
    return accepted;
}

bool FanManager::waitIdle(std::chrono::milliseconds timeout) {
    return dispatcher_->waitIdle(timeout);
}

FanManager::SubscriptionId FanManager::subscribe(EventHandler handler) {
    return registry_->subscribe(std::move(handler));
}

void FanManager::unsubscribe(SubscriptionId id) {
    registry_->unsubscribe(id);
}

std::vector<std::shared_ptr<Device>> FanManager::devices() const {
    return registry_->all();
}

} // namespace openfan::controller
