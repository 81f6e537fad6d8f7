#pragma once
// TestDoubles.hpp
// In-process stand-ins for the network edges: one simulated fan behind IHttpClient
// and a scriptable DNS-SD browser behind IServiceBrowser.

#include "comm/IHttpClient.hpp"
#include "comm/IServiceBrowser.hpp"
#include "config/Config.hpp"
#include "protocol/exceptions/ConnectionException.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace openfan::test {

//==============================================================================
// FakeHttpClient: behaves like the fan firmware's tiny HTTP API
//==============================================================================

class FakeHttpClient : public comm::IHttpClient {
public:
    enum class Failure { None, Transport, HttpError, NotOk };

    explicit FakeHttpClient(std::string host = "10.0.0.5", uint16_t port = 80)
        : host_(std::move(host)), port_(port) {}

    comm::HttpResponse get(const std::string& target, std::chrono::milliseconds /*timeout*/) override {
        std::unique_lock<std::mutex> lk(mtx_);
        targets_.push_back(target);
        ++active_;
        maxActive_ = std::max(maxActive_, active_);
        cv_.notify_all();
        cv_.wait(lk, [this]() { return !blocked_; });
        auto delay = delay_;
        lk.unlock();
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        lk.lock();

        --active_;
        cv_.notify_all();
        Failure failure = failure_;
        if (scriptedFailures_ > 0) {
            --scriptedFailures_;
            failure = scriptedFailure_;
        }
        switch (failure) {
            case Failure::Transport:
                throw protocol::ConnectionException("connection refused");
            case Failure::HttpError:
                return {500, "internal error"};
            case Failure::NotOk:
                return {200, R"({"status":"error","message":"busy"})"};
            case Failure::None:
                break;
        }

        if (target.rfind(config::SET_SPEED_PATH, 0) == 0) {
            auto pos = target.find("value=");
            pwm_ = pos == std::string::npos ? 0 : std::stoi(target.substr(pos + 6));
            rpm_ = pwm_ * 30;
            return {200, R"({"status":"ok"})"};
        }
        if (target == config::STATUS_PATH) {
            nlohmann::json body = {{"status", "ok"}, {"rpm", rpm_}, {"pwm_percent", pwm_}};
            return {200, body.dump()};
        }
        return {404, "not found"};
    }

    std::string host() const override { return host_; }
    uint16_t port() const noexcept override { return port_; }

    // --- scripting ---
    void setReading(int rpm, int pwm) {
        std::lock_guard<std::mutex> lk(mtx_);
        rpm_ = rpm;
        pwm_ = pwm;
    }
    void setFailure(Failure f) {
        std::lock_guard<std::mutex> lk(mtx_);
        failure_ = f;
    }
    // only the next n requests fail; later ones follow setFailure()
    void failNext(Failure f, int n = 1) {
        std::lock_guard<std::mutex> lk(mtx_);
        scriptedFailure_ = f;
        scriptedFailures_ = n;
    }
    void setDelay(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lk(mtx_);
        delay_ = d;
    }
    // requests park inside get() until release()
    void block() {
        std::lock_guard<std::mutex> lk(mtx_);
        blocked_ = true;
    }
    void release() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            blocked_ = false;
        }
        cv_.notify_all();
    }

    // --- inspection ---
    std::vector<std::string> targets() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return targets_;
    }
    std::vector<std::string> setTargets() const {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<std::string> out;
        for (const auto& t : targets_) {
            if (t.rfind(config::SET_SPEED_PATH, 0) == 0) out.push_back(t);
        }
        return out;
    }
    std::size_t statusRequests() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return static_cast<std::size_t>(std::count(targets_.begin(), targets_.end(), config::STATUS_PATH));
    }
    int maxConcurrent() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return maxActive_;
    }
    int pwm() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return pwm_;
    }
    bool waitForRequests(std::size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, timeout, [&]() { return targets_.size() >= n; });
    }

private:
    const std::string host_;
    const uint16_t port_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<std::string> targets_;
    int active_{0};
    int maxActive_{0};
    bool blocked_{false};
    std::chrono::milliseconds delay_{0};
    Failure failure_{Failure::None};
    Failure scriptedFailure_{Failure::None};
    int scriptedFailures_{0};
    int rpm_{0};
    int pwm_{0};
};

//==============================================================================
// FakeServiceBrowser: announcements are pushed by the test
//==============================================================================

class FakeServiceBrowser : public comm::IServiceBrowser {
public:
    void start(const std::string& serviceType, EventHandler handler) override {
        std::lock_guard<std::mutex> lk(mtx_);
        serviceType_ = serviceType;
        handler_ = std::move(handler);
        running_ = true;
        ++startCount_;
    }

    void stop() override {
        std::lock_guard<std::mutex> lk(mtx_);
        running_ = false;
        handler_ = nullptr;
    }

    bool isRunning() const noexcept override {
        std::lock_guard<std::mutex> lk(mtx_);
        return running_;
    }

    std::optional<comm::ResolvedService> resolve(const std::string& name,
                                                 std::chrono::milliseconds /*timeout*/) override {
        std::chrono::milliseconds delay;
        std::optional<comm::ResolvedService> out;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            delay = resolveDelay_;
            auto it = resolutions_.find(name);
            if (it != resolutions_.end()) out = it->second;
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        return out;
    }

    // --- scripting ---
    void setResolution(const std::string& name, const std::string& address, uint16_t port) {
        comm::ResolvedService rs;
        rs.name = name;
        rs.host = name.substr(0, name.find('.')) + ".local";
        if (!address.empty()) rs.addresses.push_back(address);
        rs.port = port;
        std::lock_guard<std::mutex> lk(mtx_);
        resolutions_[name] = rs;
    }
    void setResolveDelay(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lk(mtx_);
        resolveDelay_ = d;
    }

    void announce(const std::string& name, comm::ServiceEvent::Kind kind = comm::ServiceEvent::Kind::Added) {
        EventHandler h;
        std::string type;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            h = handler_;
            type = serviceType_;
        }
        if (h) h(comm::ServiceEvent{kind, type, name});
    }
    void withdraw(const std::string& name) { announce(name, comm::ServiceEvent::Kind::Removed); }

    int startCount() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return startCount_;
    }
    std::string serviceType() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return serviceType_;
    }

private:
    mutable std::mutex mtx_;
    EventHandler handler_;
    std::string serviceType_;
    bool running_{false};
    int startCount_{0};
    std::chrono::milliseconds resolveDelay_{0};
    std::map<std::string, comm::ResolvedService> resolutions_;
};

//==============================================================================
// helpers
//==============================================================================

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace openfan::test
