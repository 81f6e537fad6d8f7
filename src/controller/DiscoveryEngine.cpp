#include "controller/DiscoveryEngine.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace openfan::controller {

namespace {

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string eraseAll(std::string s, const std::string& needle) {
    if (needle.empty()) return s;
    std::string::size_type pos;
    while ((pos = s.find(needle)) != std::string::npos) s.erase(pos, needle.size());
    return s;
}

} // namespace

DiscoveryEngine::DiscoveryEngine(std::shared_ptr<comm::IServiceBrowser> browser,
                                 std::shared_ptr<DeviceRegistry> registry,
                                 ClientFactory clientFactory,
                                 DiscoveryOptions options)
    : browser_(std::move(browser)),
      registry_(std::move(registry)),
      clientFactory_(std::move(clientFactory)),
      options_(std::move(options)),
      pool_("discovery", options_.workers) {}

DiscoveryEngine::~DiscoveryEngine() {
    stop();
}

std::string DiscoveryEngine::serialFromInstance(const std::string& instanceName) {
    const std::string hostname = instanceName.substr(0, instanceName.find('.'));
    return eraseAll(hostname, config::SERIAL_PREFIX);
}

std::string DiscoveryEngine::provisionalName(const std::string& serial) {
    return serial.substr(0, serial.find('-'));
}

std::string DiscoveryEngine::friendlyName(const std::string& provisional, const std::string& serial) {
    std::string name = provisional;
    if (startsWith(name, config::SERIAL_PREFIX)) name = eraseAll(name, config::SERIAL_PREFIX);
    if (!name.empty()) return name;
    return "Fan " + (serial.size() > 4 ? serial.substr(serial.size() - 4) : serial);
}

void DiscoveryEngine::start() {
    std::lock_guard<std::mutex> lk(lifecycleMtx_);
    if (running_.load()) return;

    {
        std::lock_guard<std::mutex> sk(sequenceMtx_);
        removedAt_.clear();
    }
    pool_.start();
    running_.store(true);
    try {
        browser_->start(options_.serviceType, [this](const comm::ServiceEvent& ev) { onServiceEvent(ev); });
    } catch (const std::exception& ex) {
        running_.store(false);
        pool_.stop();
        spdlog::error("[DiscoveryEngine] browser failed to start: {}", ex.what());
        throw;
    }
    spdlog::info("[DiscoveryEngine] browsing {} for {}*", options_.serviceType, options_.namePrefix);
}

void DiscoveryEngine::stop() {
    std::lock_guard<std::mutex> lk(lifecycleMtx_);
    if (!running_.exchange(false)) return;

    browser_->stop();
    // drops queued announcements, waits for ones mid-resolve; their results are discarded
    pool_.stop();
    spdlog::info("[DiscoveryEngine] stopped");
}

void DiscoveryEngine::restart() {
    spdlog::info("[DiscoveryEngine] restarting discovery");
    stop();
    start();
}

void DiscoveryEngine::onServiceEvent(const comm::ServiceEvent& event) {
    if (!running_.load()) return;
    if (!startsWith(event.name, options_.namePrefix)) return;

    if (event.kind == comm::ServiceEvent::Kind::Removed) {
        processRemoval(event.name);
        return;
    }

    uint64_t sequence = 0;
    {
        std::lock_guard<std::mutex> sk(sequenceMtx_);
        sequence = nextSequence_++;
    }
    const std::string name = event.name;
    if (!pool_.submit([this, name, sequence]() { processAnnouncement(name, sequence); })) {
        spdlog::debug("[DiscoveryEngine] pool stopped, dropping announcement {}", name);
    }
}

void DiscoveryEngine::processAnnouncement(const std::string& instanceName, uint64_t sequence) {
    if (!running_.load()) return;

    const std::string serial = serialFromInstance(instanceName);
    if (serial.empty()) {
        spdlog::debug("[DiscoveryEngine] {} carries no serial, ignored", instanceName);
        return;
    }

    auto resolved = browser_->resolve(instanceName, options_.resolveTimeout);
    if (!resolved || resolved->addresses.empty()) {
        spdlog::debug("[DiscoveryEngine] {} has no address yet, dropped", instanceName);
        return;
    }
    const std::string address = resolved->addresses.front();
    const uint16_t port = resolved->port == 0 ? config::DEFAULT_DEVICE_PORT : resolved->port;

    if (auto known = registry_->get(serial)) {
        if (known->address() != address || known->port() != port) {
            known->updateEndpoint(address, port, clientFactory_(address, port));
            spdlog::info("[DiscoveryEngine] {} moved to {}:{}", serial, address, port);
        }
        return;
    }

    auto device = std::make_shared<Device>(serial, provisionalName(serial), address, port,
                                           clientFactory_(address, port), options_.requestTimeout);
    // best effort; a device that does not answer yet is still registered
    if (!device->getStatus()) {
        spdlog::debug("[DiscoveryEngine] initial status for {} unavailable", serial);
    }
    device->setName(friendlyName(device->name(), serial));

    std::lock_guard<std::mutex> sk(sequenceMtx_);
    if (!running_.load()) {
        spdlog::debug("[DiscoveryEngine] stopped, dropping {}", serial);
        return;
    }
    auto removed = removedAt_.find(serial);
    if (removed != removedAt_.end() && removed->second > sequence) {
        spdlog::debug("[DiscoveryEngine] {} was removed while resolving, skipped", serial);
        return;
    }
    if (registry_->add(device)) {
        spdlog::info("[DiscoveryEngine] discovered {} ({}) at {}:{}", device->name(), serial, address, port);
        return;
    }
    // a concurrent announcement for the same serial won the insert; last write wins for the endpoint
    if (auto existing = registry_->get(serial)) {
        existing->updateEndpoint(address, port, clientFactory_(address, port));
    }
}

void DiscoveryEngine::processRemoval(const std::string& instanceName) {
    const std::string serial = serialFromInstance(instanceName);
    std::lock_guard<std::mutex> sk(sequenceMtx_);
    removedAt_[serial] = nextSequence_++;
    if (registry_->remove(serial)) {
        spdlog::info("[DiscoveryEngine] lost {}", serial);
    }
}

} // namespace openfan::controller
