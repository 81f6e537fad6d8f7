#include "controller/Poller.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>
#include <vector>

namespace openfan::controller {

Poller::Poller(std::shared_ptr<DeviceRegistry> registry, ms interval, std::size_t workers)
    : registry_(std::move(registry)),
      pool_("poll", workers),
      interval_(interval) {}

Poller::~Poller() {
    stopUpdates();
}

void Poller::startUpdates() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_) return;
    pool_.start();
    running_ = true;
    forceCycle_ = true;
    worker_ = std::thread(&Poller::runLoop, this);
    spdlog::info("[Poller] started, interval {} ms", interval_.count());
}

void Poller::stopUpdates() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    // queued fetches are discarded, running ones are joined; their results are never applied
    pool_.stop();
    inflight_.clear();
    lastPolled_.clear();
    spdlog::info("[Poller] stopped");
}

bool Poller::isRunning() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return running_;
}

void Poller::setInterval(ms interval) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (interval_ == interval) return;
        interval_ = interval;
    }
    spdlog::debug("[Poller] interval set to {} ms", interval.count());
    cv_.notify_all();
}

Poller::ms Poller::interval() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return interval_;
}

void Poller::pollNow() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        forceCycle_ = true;
    }
    cv_.notify_all();
}

void Poller::scheduleFetch(const std::shared_ptr<Device>& device) {
    if (inflight_.count(device->serial())) return;

    auto probe = device->detach();
    auto fut = pool_.submitTask([probe]() {
        PollOutcome out;
        out.result = probe->getStatus();
        out.state = probe->state();
        return out;
    });
    inflight_.emplace(device->serial(), Inflight{device, std::move(fut)});
}

void Poller::handleCompletedInflight() {
    std::vector<std::string> finished;
    for (auto& kv : inflight_) {
        if (kv.second.future.wait_for(ms(0)) == std::future_status::ready) {
            finished.push_back(kv.first);
        }
    }

    for (const auto& serial : finished) {
        auto it = inflight_.find(serial);
        if (it == inflight_.end()) continue;
        Inflight done = std::move(it->second);
        inflight_.erase(it);

        PollOutcome outcome;
        try {
            outcome = done.future.get();
        } catch (const std::exception& e) {
            spdlog::warn("[Poller] fetch for {} did not complete: {}", serial, e.what());
            continue;
        }
        // Device already logged the failure
        if (!outcome.result) continue;

        if (registry_->get(serial) != done.live) {
            spdlog::debug("[Poller] dropping result for {} (no longer registered)", serial);
            continue;
        }
        if (done.live->reconcile(outcome.state)) {
            registry_->notifyStateChanged(serial);
        }
    }
}

void Poller::runLoop() {
    while (true) {
        bool force = false;
        ms interval;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (!running_) break;
            force = forceCycle_;
            forceCycle_ = false;
            interval = interval_;
        }

        handleCompletedInflight();

        auto devices = registry_->all();
        std::unordered_set<std::string> present;
        auto now = std::chrono::steady_clock::now();
        for (const auto& device : devices) {
            const std::string& serial = device->serial();
            present.insert(serial);
            if (inflight_.count(serial)) continue;

            auto lastIt = lastPolled_.find(serial);
            bool due = force || lastIt == lastPolled_.end() || now - lastIt->second >= interval;
            if (!due) continue;
            scheduleFetch(device);
            lastPolled_[serial] = now;
        }
        for (auto it = lastPolled_.begin(); it != lastPolled_.end();) {
            if (present.count(it->first)) ++it;
            else it = lastPolled_.erase(it);
        }

        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, config::POLLER_TICK_MS, [this]() { return !running_ || forceCycle_; });
    }
}

} // namespace openfan::controller
