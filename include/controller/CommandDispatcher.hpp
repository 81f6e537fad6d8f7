#pragma once
/**
 * CommandDispatcher.hpp
 *
 * 사용자 intent(setSpeed / setPower / toggle)를 장치별로 debounce + 직렬화하여 전송.
 *
 * 장치별 상태 (dispatcher 시점):
 *   Idle --intent--> Pending(v) --timer--> InFlight(v) --response--> Idle
 *   Pending + intent            : 값 교체, timer 재시작
 *   InFlight(v) + intent(n)     : Queued(v, n)
 *   Queued(v, n) + intent(m)    : Queued(v, m)   (가장 최근 값만 남음)
 *   Queued(v, n) --response-->  : InFlight(n), 즉시 전송
 *
 * 스레드 모델:
 *  - 모든 상태 전이는 하나의 io 스레드(boost::asio::io_context)에서 실행
 *  - 실제 HTTP 요청은 worker pool 에서 실행; 완료는 io 스레드로 post 됨
 *
 * optimistic update:
 *  - intent 수신 즉시 displayed 상태에 반영 (바뀌었으면 StateChanged)
 *  - 실패 시 뒤에 대기 중인 intent 가 없으면 confirmed 로 rollback + StateChanged
 *
 * 사용:
 *   CommandDispatcher disp(registry);
 *   disp.start();
 *   disp.setSpeed("AB12", 73);
 *   disp.waitIdle(std::chrono::seconds(5));
 *   disp.stop();   // timer 취소, 진행 중인 요청 결과는 버림
 */

#include <chrono>
#include <memory>
#include <string>

#include "../config/Config.hpp"
#include "DeviceRegistry.hpp"

namespace openfan::controller {

class CommandDispatcher {
public:
    using ms = std::chrono::milliseconds;

    enum class Phase { Idle, Pending, InFlight, Queued };

    CommandDispatcher(std::shared_ptr<DeviceRegistry> registry,
                      ms debounce = config::DEFAULT_DEBOUNCE_MS,
                      std::size_t workers = config::DEFAULT_COMMAND_WORKERS);
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    void start();
    void stop();
    bool isRunning() const noexcept;

    // intents; false if the dispatcher is stopped or the serial is not registered
    bool setSpeed(const std::string& serial, int percent);
    bool setPower(const std::string& serial, bool on);
    bool toggle(const std::string& serial);

    // true once every device is Idle and no submitted intent is waiting to be processed
    bool waitIdle(ms timeout);

    Phase phase(const std::string& serial) const;

private:
    enum class IntentKind { Speed, PowerOn, PowerOff, Toggle };

    bool submit(const std::string& serial, IntentKind kind, int value);

    class Impl;
    std::unique_ptr<Impl> impl_;
};

const char* toString(CommandDispatcher::Phase phase) noexcept;

} // namespace openfan::controller
