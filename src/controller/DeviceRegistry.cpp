#include "controller/DeviceRegistry.hpp"

#include <spdlog/spdlog.h>

namespace openfan::controller {

const char* toString(DeviceEvent::Type type) noexcept {
    switch (type) {
        case DeviceEvent::Type::DeviceFound: return "DeviceFound";
        case DeviceEvent::Type::DeviceLost: return "DeviceLost";
        case DeviceEvent::Type::StateChanged: return "StateChanged";
    }
    return "Unknown";
}

std::vector<std::shared_ptr<Device>> DeviceRegistry::all() const {
    std::lock_guard<std::mutex> lk(mapMtx_);
    std::vector<std::shared_ptr<Device>> out;
    out.reserve(devices_.size());
    for (const auto& kv : devices_) out.push_back(kv.second);
    return out;
}

std::shared_ptr<Device> DeviceRegistry::get(const std::string& serial) const {
    std::lock_guard<std::mutex> lk(mapMtx_);
    auto it = devices_.find(serial);
    return it == devices_.end() ? nullptr : it->second;
}

bool DeviceRegistry::contains(const std::string& serial) const {
    std::lock_guard<std::mutex> lk(mapMtx_);
    return devices_.count(serial) > 0;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lk(mapMtx_);
    return devices_.size();
}

bool DeviceRegistry::add(std::shared_ptr<Device> device) {
    if (!device) return false;
    std::lock_guard<std::recursive_mutex> pub(publishMtx_);
    {
        std::lock_guard<std::mutex> lk(mapMtx_);
        if (!devices_.emplace(device->serial(), device).second) return false;
    }
    publish(DeviceEvent{DeviceEvent::Type::DeviceFound, device->serial(), device});
    return true;
}

bool DeviceRegistry::remove(const std::string& serial) {
    std::lock_guard<std::recursive_mutex> pub(publishMtx_);
    std::shared_ptr<Device> removed;
    {
        std::lock_guard<std::mutex> lk(mapMtx_);
        auto it = devices_.find(serial);
        if (it == devices_.end()) return false;
        removed = std::move(it->second);
        devices_.erase(it);
    }
    publish(DeviceEvent{DeviceEvent::Type::DeviceLost, serial, std::move(removed)});
    return true;
}

void DeviceRegistry::notifyStateChanged(const std::string& serial) {
    std::lock_guard<std::recursive_mutex> pub(publishMtx_);
    auto device = get(serial);
    if (!device) return;
    publish(DeviceEvent{DeviceEvent::Type::StateChanged, serial, std::move(device)});
}

DeviceRegistry::SubscriptionId DeviceRegistry::subscribe(EventHandler handler) {
    std::lock_guard<std::mutex> lk(subscribersMtx_);
    SubscriptionId id = nextId_++;
    subscribers_.emplace(id, std::move(handler));
    return id;
}

void DeviceRegistry::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lk(subscribersMtx_);
    subscribers_.erase(id);
}

void DeviceRegistry::publish(const DeviceEvent& event) {
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lk(subscribersMtx_);
        handlers.reserve(subscribers_.size());
        for (const auto& kv : subscribers_) handlers.push_back(kv.second);
    }
    for (auto& h : handlers) {
        if (!h) continue;
        try {
            h(event);
        } catch (const std::exception& ex) {
            spdlog::error("[DeviceRegistry] subscriber threw on {} {}: {}", toString(event.type), event.serial, ex.what());
        }
    }
}

} // namespace openfan::controller
