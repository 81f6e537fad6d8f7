#pragma once
/**
 * Device.hpp
 *
 * OpenFan 장치 하나: identity + endpoint + 상태 + 원격 제어 연산.
 *
 * 상태는 두 벌을 유지한다.
 *  - displayed: UI 가 보는 값. CommandDispatcher 의 optimistic 값이 들어갈 수 있음
 *  - confirmed: 장치가 마지막으로 보고/승인한 값. rollback() 의 기준
 *
 * 불변식 (모든 전이 후): isOn == (speedPercent > 0), speedPercent ∈ [0,100],
 *                        lastNonZeroSpeed > 0
 *
 * 원격 연산(getStatus/setSpeed/setPower/toggle)은 호출 스레드에서 블로킹한다.
 * 실패는 예외가 아니라 protocol::Result 로 돌려주며, 실패 시 상태는 바뀌지 않는다.
 * 모든 public 메서드는 thread-safe.
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "../comm/IHttpClient.hpp"
#include "../config/Config.hpp"
#include "../protocol/Parser.hpp"
#include "../protocol/Result.hpp"

namespace openfan::controller {

struct FanState {
    bool isOn{false};
    int speedPercent{0};
    int rpm{0};
    int lastNonZeroSpeed{config::DEFAULT_RESUME_SPEED_PERCENT};

    // fields a poll result is compared on
    bool sameReading(const FanState& other) const noexcept {
        return isOn == other.isOn && speedPercent == other.speedPercent && rpm == other.rpm;
    }
};

class Device {
public:
    using ms = std::chrono::milliseconds;

    Device(std::string serial,
           std::string name,
           std::string address,
           uint16_t port,
           std::shared_ptr<comm::IHttpClient> client,
           ms requestTimeout = config::DEFAULT_REQUEST_TIMEOUT_MS);

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    const std::string& serial() const noexcept { return serial_; }

    std::string name() const;
    void setName(const std::string& name);

    std::string address() const;
    uint16_t port() const;
    std::string baseUrl() const;

    // replaces address/port and the client bound to them
    void updateEndpoint(const std::string& address, uint16_t port, std::shared_ptr<comm::IHttpClient> client);

    FanState state() const;
    FanState confirmedState() const;

    // --- remote operations ---
    protocol::Result<protocol::FanStatus> getStatus();
    // returns the clamped value that was applied
    protocol::Result<int> setSpeed(int percent);
    protocol::Result<int> setPower(bool on);
    protocol::Result<int> toggle();

    // --- local state helpers used by Poller / CommandDispatcher ---

    // copy with the same identity, endpoint, client and state; mutations do not touch this Device
    std::shared_ptr<Device> detach() const;

    // adopt a fetched reading; returns true if isOn/speedPercent/rpm differed
    bool reconcile(const FanState& fetched);

    // show value before the device confirms it; returns true if displayed state changed
    bool applyOptimistic(int percent);

    // restore displayed speed/power from confirmed; returns true if displayed state changed
    bool rollback();

    // speed a power-on restores
    int resumeSpeed() const;

private:
    // caller holds mtx_
    void applyConfirmedSpeed(int percent);

    std::shared_ptr<comm::IHttpClient> client() const;

    const std::string serial_;
    const ms requestTimeout_;

    mutable std::mutex mtx_;
    std::string name_;
    std::string address_;
    uint16_t port_;
    std::shared_ptr<comm::IHttpClient> client_;
    FanState displayed_;
    FanState confirmed_;
};

} // namespace openfan::controller
