#include "controller/CommandDispatcher.hpp"
#include "common/WorkerPool.hpp"
#include "protocol/CommandBuilder.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <variant>

namespace openfan::controller {

namespace net = boost::asio;

const char* toString(CommandDispatcher::Phase phase) noexcept {
    switch (phase) {
        case CommandDispatcher::Phase::Idle: return "Idle";
        case CommandDispatcher::Phase::Pending: return "Pending";
        case CommandDispatcher::Phase::InFlight: return "InFlight";
        case CommandDispatcher::Phase::Queued: return "Queued";
    }
    return "Unknown";
}

namespace {

struct Idle {};
struct Pending { int value; };
struct InFlight { int value; };
struct Queued { int inFlight; int next; };

using SlotState = std::variant<Idle, Pending, InFlight, Queued>;

CommandDispatcher::Phase phaseOf(const SlotState& s) {
    switch (s.index()) {
        case 1: return CommandDispatcher::Phase::Pending;
        case 2: return CommandDispatcher::Phase::InFlight;
        case 3: return CommandDispatcher::Phase::Queued;
        default: return CommandDispatcher::Phase::Idle;
    }
}

} // namespace

class CommandDispatcher::Impl {
public:
    using WorkGuard = net::executor_work_guard<net::io_context::executor_type>;
    using Phase = CommandDispatcher::Phase;

    struct Slot {
        SlotState state{Idle{}};
        std::shared_ptr<Device> device;
        std::unique_ptr<net::steady_timer> timer;
        uint64_t timerGeneration{0};
    };

    Impl(std::shared_ptr<DeviceRegistry> reg, ms debounceDelay, std::size_t workers)
        : registry(std::move(reg)), debounce(debounceDelay), pool("command", workers) {}

    std::shared_ptr<DeviceRegistry> registry;
    const ms debounce;
    common::WorkerPool pool;

    std::mutex lifecycleMtx;
    std::unique_ptr<net::io_context> ioc;
    std::unique_ptr<WorkGuard> workGuard;
    std::thread ioThread;
    std::atomic<bool> running{false};

    // io thread only; a slot exists only while its device is not Idle
    std::unordered_map<std::string, Slot> slots;
    uint64_t nextTimerGeneration{0};

    // mirror of slot phases for phase()/waitIdle() callers; Idle devices are absent
    mutable std::mutex phaseMtx;
    std::condition_variable phaseCv;
    std::unordered_map<std::string, Phase> phases;
    std::size_t unprocessedIntents{0};

    void publishPhase(const std::string& serial, const Slot& slot) {
        const Phase p = phaseOf(slot.state);
        {
            std::lock_guard<std::mutex> lk(phaseMtx);
            if (p == Phase::Idle) phases.erase(serial);
            else phases[serial] = p;
        }
        phaseCv.notify_all();
    }

    void intentProcessed() {
        {
            std::lock_guard<std::mutex> lk(phaseMtx);
            if (unprocessedIntents > 0) --unprocessedIntents;
        }
        phaseCv.notify_all();
    }

    int resolveValue(const Device& device, IntentKind kind, int value) const {
        switch (kind) {
            case IntentKind::Speed: return protocol::clampSpeed(value);
            case IntentKind::PowerOn: return device.resumeSpeed();
            case IntentKind::PowerOff: return 0;
            case IntentKind::Toggle: return device.state().isOn ? 0 : device.resumeSpeed();
        }
        return protocol::clampSpeed(value);
    }

    // io thread
    void onIntent(const std::string& serial, IntentKind kind, int rawValue) {
        if (!running.load()) return;
        auto device = registry->get(serial);
        if (!device) {
            spdlog::debug("[CommandDispatcher] {} vanished before its intent ran", serial);
            return;
        }
        const int value = resolveValue(*device, kind, rawValue);

        Slot& slot = slots[serial];
        slot.device = device;
        if (device->applyOptimistic(value)) registry->notifyStateChanged(serial);

        if (auto* inflight = std::get_if<InFlight>(&slot.state)) {
            slot.state = Queued{inflight->value, value};
        } else if (auto* queued = std::get_if<Queued>(&slot.state)) {
            queued->next = value;
        } else {
            slot.state = Pending{value};
            armTimer(serial, slot);
        }
        spdlog::debug("[CommandDispatcher] {} intent {} -> {}", serial, value, toString(phaseOf(slot.state)));
        publishPhase(serial, slot);
    }

    // io thread; restarting invalidates any expiry already queued for the previous arm
    void armTimer(const std::string& serial, Slot& slot) {
        if (!slot.timer) slot.timer = std::make_unique<net::steady_timer>(*ioc);
        const uint64_t generation = ++nextTimerGeneration;
        slot.timerGeneration = generation;
        slot.timer->expires_after(debounce);
        slot.timer->async_wait([this, serial, generation](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted || !running.load()) return;
            onTimer(serial, generation);
        });
    }

    // io thread
    void onTimer(const std::string& serial, uint64_t generation) {
        auto it = slots.find(serial);
        if (it == slots.end() || it->second.timerGeneration != generation) return;
        Slot& slot = it->second;
        auto* pending = std::get_if<Pending>(&slot.state);
        if (!pending) return;

        const int value = pending->value;
        slot.state = InFlight{value};
        publishPhase(serial, slot);
        send(serial, slot.device, value);
    }

    // io thread; the request itself runs on the worker pool
    void send(const std::string& serial, std::shared_ptr<Device> device, int value) {
        spdlog::debug("[CommandDispatcher] {} sending speed {}", serial, value);
        bool queued = pool.submit([this, serial, device, value]() {
            const FanState before = device->state();
            auto res = device->setSpeed(value);
            const bool changed = res.ok() && !before.sameReading(device->state());
            net::post(*ioc, [this, serial, device, ok = res.ok(), changed]() {
                onComplete(serial, device, ok, changed);
            });
        });
        if (!queued) {
            // pool already stopped; treat as a failed send so the slot does not stay InFlight
            onComplete(serial, device, false, false);
        }
    }

    // io thread
    void onComplete(const std::string& serial, const std::shared_ptr<Device>& device, bool ok, bool changed) {
        if (!running.load()) return;
        auto it = slots.find(serial);
        if (it == slots.end()) return;
        Slot& slot = it->second;

        if (auto* queued = std::get_if<Queued>(&slot.state)) {
            const int next = queued->next;
            slot.state = InFlight{next};
            publishPhase(serial, slot);
            // the confirmed value may have overwritten the newer optimistic one
            if (device->applyOptimistic(next) || changed) registry->notifyStateChanged(serial);
            send(serial, slot.device, next);
            return;
        }

        if (!std::holds_alternative<InFlight>(slot.state)) return;
        slot.state = Idle{};
        if (!ok) {
            if (device->rollback()) registry->notifyStateChanged(serial);
        } else if (changed) {
            registry->notifyStateChanged(serial);
        }
        publishPhase(serial, slot);
        // releases the Device (and its HTTP client) once nothing is outstanding
        slots.erase(it);
    }
};

CommandDispatcher::CommandDispatcher(std::shared_ptr<DeviceRegistry> registry, ms debounce, std::size_t workers)
    : impl_(std::make_unique<Impl>(std::move(registry), debounce, workers)) {}

CommandDispatcher::~CommandDispatcher() {
    stop();
}

void CommandDispatcher::start() {
    std::lock_guard<std::mutex> lk(impl_->lifecycleMtx);
    if (impl_->running.load()) return;

    impl_->ioc = std::make_unique<net::io_context>();
    impl_->workGuard = std::make_unique<Impl::WorkGuard>(net::make_work_guard(*impl_->ioc));
    impl_->pool.start();
    impl_->running.store(true);

    Impl* impl = impl_.get();
    impl->ioThread = std::thread([impl]() {
        try {
            impl->ioc->run();
        } catch (const std::exception& ex) {
            spdlog::error("[CommandDispatcher] io_context.run() threw: {}", ex.what());
        }
    });
    spdlog::info("[CommandDispatcher] started, debounce {} ms", impl_->debounce.count());
}

void CommandDispatcher::stop() {
    std::lock_guard<std::mutex> lk(impl_->lifecycleMtx);
    if (!impl_->running.exchange(false)) return;

    Impl* impl = impl_.get();
    // requests already on the wire finish here; their completions are ignored
    impl->pool.stop();
    net::post(*impl->ioc, [impl]() {
        for (auto& kv : impl->slots) {
            if (kv.second.timer) kv.second.timer->cancel();
        }
        impl->slots.clear();
    });
    impl->workGuard.reset();
    if (impl->ioThread.joinable()) impl->ioThread.join();
    impl->ioc.reset();

    {
        std::lock_guard<std::mutex> pk(impl->phaseMtx);
        impl->phases.clear();
        impl->unprocessedIntents = 0;
    }
    impl->phaseCv.notify_all();
    spdlog::info("[CommandDispatcher] stopped");
}

bool CommandDispatcher::isRunning() const noexcept {
    return impl_->running.load();
}

bool CommandDispatcher::setSpeed(const std::string& serial, int percent) {
    return submit(serial, IntentKind::Speed, percent);
}

bool CommandDispatcher::setPower(const std::string& serial, bool on) {
    return submit(serial, on ? IntentKind::PowerOn : IntentKind::PowerOff, 0);
}

bool CommandDispatcher::toggle(const std::string& serial) {
    return submit(serial, IntentKind::Toggle, 0);
}

bool CommandDispatcher::submit(const std::string& serial, IntentKind kind, int value) {
    std::lock_guard<std::mutex> lk(impl_->lifecycleMtx);
    if (!impl_->running.load()) {
        spdlog::warn("[CommandDispatcher] intent for {} ignored: dispatcher stopped", serial);
        return false;
    }
    if (!impl_->registry->contains(serial)) {
        spdlog::warn("[CommandDispatcher] intent for unknown device {}", serial);
        return false;
    }
    {
        std::lock_guard<std::mutex> pk(impl_->phaseMtx);
        ++impl_->unprocessedIntents;
    }
    Impl* impl = impl_.get();
    net::post(*impl->ioc, [impl, serial, kind, value]() {
        impl->onIntent(serial, kind, value);
        impl->intentProcessed();
    });
    return true;
}

bool CommandDispatcher::waitIdle(ms timeout) {
    std::unique_lock<std::mutex> lk(impl_->phaseMtx);
    return impl_->phaseCv.wait_for(lk, timeout, [this]() {
        return impl_->unprocessedIntents == 0 && impl_->phases.empty();
    });
}

CommandDispatcher::Phase CommandDispatcher::phase(const std::string& serial) const {
    std::lock_guard<std::mutex> lk(impl_->phaseMtx);
    auto it = impl_->phases.find(serial);
    return it == impl_->phases.end() ? Phase::Idle : it->second;
}

} // namespace openfan::controller
