#pragma once
/**
 * DeviceRegistry.hpp
 *
 * serial -> Device 매핑 + 이벤트 채널.
 *
 * 설계 목표:
 *  - UI/CLI 가 렌더링하는 동안(all()/get()) 다른 스레드가 add/remove 해도 안전
 *  - 이벤트(DeviceFound / DeviceLost / StateChanged)는 발행 순서대로 모든 subscriber 에 전달
 *  - 발행은 직렬화됨: 어떤 serial 의 DeviceFound 는 그 serial 의 StateChanged 보다 항상 먼저
 *
 * 사용법 예:
 *   auto reg = std::make_shared<DeviceRegistry>();
 *   auto id = reg->subscribe([](const DeviceEvent& ev) { ... });
 *   reg->add(device);                 // DeviceFound
 *   reg->notifyStateChanged(serial);  // StateChanged
 *   reg->remove(serial);              // DeviceLost
 *   reg->unsubscribe(id);
 *
 * 주의:
 *  - handler 는 발행한 스레드에서 동기적으로 호출된다. 블로킹 작업 금지.
 *  - handler 안에서 get()/all() 호출 가능. 같은 스레드에서의 재발행도 허용 (recursive).
 */

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "Device.hpp"

namespace openfan::controller {

struct DeviceEvent {
    enum class Type { DeviceFound, DeviceLost, StateChanged };

    Type type{Type::StateChanged};
    std::string serial;
    // set for DeviceFound and StateChanged; DeviceLost carries the removed device when known
    std::shared_ptr<Device> device;
};

const char* toString(DeviceEvent::Type type) noexcept;

class DeviceRegistry {
public:
    using EventHandler = std::function<void(const DeviceEvent&)>;
    using SubscriptionId = uint64_t;

    DeviceRegistry() = default;
    ~DeviceRegistry() = default;

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // snapshot ordered by serial
    std::vector<std::shared_ptr<Device>> all() const;
    std::shared_ptr<Device> get(const std::string& serial) const;
    bool contains(const std::string& serial) const;
    std::size_t size() const;

    // insert if the serial is unknown and publish DeviceFound; false if already present
    bool add(std::shared_ptr<Device> device);

    // erase and publish DeviceLost; false (no event) for unknown serials
    bool remove(const std::string& serial);

    // publishes StateChanged if the serial is still registered
    void notifyStateChanged(const std::string& serial);

    SubscriptionId subscribe(EventHandler handler);
    void unsubscribe(SubscriptionId id);

private:
    // caller holds publishMtx_
    void publish(const DeviceEvent& event);

    mutable std::mutex mapMtx_;
    std::map<std::string, std::shared_ptr<Device>> devices_;

    std::recursive_mutex publishMtx_;
    std::mutex subscribersMtx_;
    std::map<SubscriptionId, EventHandler> subscribers_;
    SubscriptionId nextId_{1};
};

} // namespace openfan::controller
