#pragma once

/**
 * IServiceBrowser.hpp
 *
 * DNS-SD service browsing 추상 인터페이스
 *
 *  - start(type, handler): 해당 service type 의 announcement 수신 시작.
 *      handler 는 browser 내부 스레드에서 호출되므로 빠르게 반환해야 한다
 *      (무거운 처리는 worker pool 로 넘길 것).
 *  - stop(): 수신 중지, 소켓/스레드 정리. 여러 번 호출해도 안전.
 *  - resolve(name, timeout): instance 이름 -> 주소 목록 + port.
 *      캐시에 없으면 질의를 보내고 timeout 까지 기다린다. 실패 시 std::nullopt.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace openfan::comm {

struct ServiceEvent {
    enum class Kind { Added, Updated, Removed };

    Kind kind{Kind::Added};
    std::string serviceType;
    std::string name;   // full instance name, e.g. "uOpenFan-AB12._http._tcp.local"
};

struct ResolvedService {
    std::string name;
    std::string host;
    std::vector<std::string> addresses;  // IPv4 dotted quads
    uint16_t port{0};                    // 0 if the announcement carried none
};

class IServiceBrowser {
public:
    using EventHandler = std::function<void(const ServiceEvent&)>;

    virtual ~IServiceBrowser() = default;

    virtual void start(const std::string& serviceType, EventHandler handler) = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const noexcept = 0;

    virtual std::optional<ResolvedService> resolve(const std::string& name,
                                                   std::chrono::milliseconds timeout) = 0;
};

} // namespace openfan::comm
