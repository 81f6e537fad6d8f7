#include "controller/Device.hpp"
#include "protocol/CommandBuilder.hpp"
#include "protocol/exceptions/ConnectionException.h"
#include "protocol/exceptions/TimeoutException.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace openfan::controller {

using protocol::ErrorKind;
using protocol::Result;

namespace {

// one GET; every exception from the transport becomes ErrorKind::Transport
Result<comm::HttpResponse> exchange(const std::shared_ptr<comm::IHttpClient>& client,
                                    const std::string& target,
                                    std::chrono::milliseconds timeout) {
    if (!client) {
        return Result<comm::HttpResponse>::failure(ErrorKind::Transport, "no HTTP client bound");
    }
    try {
        return Result<comm::HttpResponse>::success(client->get(target, timeout));
    } catch (const protocol::TimeoutException& ex) {
        return Result<comm::HttpResponse>::failure(ErrorKind::Transport, ex.what());
    } catch (const protocol::ConnectionException& ex) {
        return Result<comm::HttpResponse>::failure(ErrorKind::Transport, ex.what());
    } catch (const std::exception& ex) {
        return Result<comm::HttpResponse>::failure(ErrorKind::Transport,
                                                   std::string("transport error: ") + ex.what());
    }
}

} // namespace

Device::Device(std::string serial,
               std::string name,
               std::string address,
               uint16_t port,
               std::shared_ptr<comm::IHttpClient> client,
               ms requestTimeout)
    : serial_(std::move(serial)),
      requestTimeout_(requestTimeout),
      name_(std::move(name)),
      address_(std::move(address)),
      port_(port),
      client_(std::move(client)) {}

std::string Device::name() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return name_;
}

void Device::setName(const std::string& name) {
    std::lock_guard<std::mutex> lk(mtx_);
    name_ = name;
}

std::string Device::address() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return address_;
}

uint16_t Device::port() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return port_;
}

std::string Device::baseUrl() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return "http://" + address_ + ":" + std::to_string(port_);
}

void Device::updateEndpoint(const std::string& address, uint16_t port, std::shared_ptr<comm::IHttpClient> client) {
    std::lock_guard<std::mutex> lk(mtx_);
    address_ = address;
    port_ = port;
    client_ = std::move(client);
}

FanState Device::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return displayed_;
}

FanState Device::confirmedState() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return confirmed_;
}

std::shared_ptr<comm::IHttpClient> Device::client() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return client_;
}

Result<protocol::FanStatus> Device::getStatus() {
    auto resp = exchange(client(), protocol::CommandBuilder::statusTarget(), requestTimeout_);
    if (!resp) {
        spdlog::warn("[Device] {} status fetch failed ({}): {}", serial_, toString(resp.error), resp.message);
        return Result<protocol::FanStatus>::failure(resp);
    }
    auto parsed = protocol::Parser::parseStatus(resp.value);
    if (!parsed) {
        spdlog::warn("[Device] {} status rejected ({}): {}", serial_, toString(parsed.error), parsed.message);
        return parsed;
    }

    std::lock_guard<std::mutex> lk(mtx_);
    for (FanState* st : {&confirmed_, &displayed_}) {
        st->rpm = parsed.value.rpm;
        st->speedPercent = parsed.value.pwmPercent;
        st->isOn = st->speedPercent > 0;
        if (st->isOn) st->lastNonZeroSpeed = st->speedPercent;
    }
    return parsed;
}

Result<int> Device::setSpeed(int percent) {
    const int value = protocol::clampSpeed(percent);
    auto resp = exchange(client(), protocol::CommandBuilder::setSpeedTarget(value), requestTimeout_);
    if (!resp) {
        spdlog::warn("[Device] {} set speed {} failed ({}): {}", serial_, value, toString(resp.error), resp.message);
        return Result<int>::failure(resp);
    }
    auto ack = protocol::Parser::parseCommandAck(resp.value);
    if (!ack) {
        spdlog::warn("[Device] {} set speed {} rejected ({}): {}", serial_, value, toString(ack.error), ack.message);
        return Result<int>::failure(ack);
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        applyConfirmedSpeed(value);
    }
    spdlog::debug("[Device] {} speed set to {}%", serial_, value);
    return Result<int>::success(value);
}

Result<int> Device::setPower(bool on) {
    return setSpeed(on ? resumeSpeed() : 0);
}

Result<int> Device::toggle() {
    bool on = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        on = displayed_.isOn;
    }
    return setPower(!on);
}

std::shared_ptr<Device> Device::detach() const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto copy = std::make_shared<Device>(serial_, name_, address_, port_, client_, requestTimeout_);
    copy->displayed_ = displayed_;
    copy->confirmed_ = confirmed_;
    return copy;
}

bool Device::reconcile(const FanState& fetched) {
    FanState reading = fetched;
    reading.speedPercent = protocol::clampSpeed(reading.speedPercent);
    reading.isOn = reading.speedPercent > 0;
    if (reading.rpm < 0) reading.rpm = 0;

    std::lock_guard<std::mutex> lk(mtx_);
    const bool changed = !displayed_.sameReading(reading);
    for (FanState* st : {&confirmed_, &displayed_}) {
        st->isOn = reading.isOn;
        st->speedPercent = reading.speedPercent;
        st->rpm = reading.rpm;
        if (reading.isOn) st->lastNonZeroSpeed = reading.speedPercent;
    }
    return changed;
}

bool Device::applyOptimistic(int percent) {
    const int value = protocol::clampSpeed(percent);
    std::lock_guard<std::mutex> lk(mtx_);
    const bool changed = displayed_.speedPercent != value || displayed_.isOn != (value > 0);
    displayed_.speedPercent = value;
    displayed_.isOn = value > 0;
    return changed;
}

bool Device::rollback() {
    std::lock_guard<std::mutex> lk(mtx_);
    const bool changed = displayed_.speedPercent != confirmed_.speedPercent ||
                         displayed_.isOn != confirmed_.isOn;
    displayed_.speedPercent = confirmed_.speedPercent;
    displayed_.isOn = confirmed_.isOn;
    return changed;
}

int Device::resumeSpeed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return confirmed_.lastNonZeroSpeed > 0 ? confirmed_.lastNonZeroSpeed : config::DEFAULT_RESUME_SPEED_PERCENT;
}

void Device::applyConfirmedSpeed(int percent) {
    for (FanState* st : {&confirmed_, &displayed_}) {
        st->speedPercent = percent;
        st->isOn = percent > 0;
        if (percent > 0) st->lastNonZeroSpeed = percent;
    }
}

} // namespace openfan::controller
