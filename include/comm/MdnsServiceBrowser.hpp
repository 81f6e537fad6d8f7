#pragma once

/**
 * MdnsServiceBrowser.hpp
 *
 * Boost.Asio 기반 IServiceBrowser 구현 (mDNS, IPv4 multicast)
 *
 * 동작 요약:
 *  - start(): UDP 5353 bind (reuse_address), 224.0.0.251 join, 백그라운드 io 스레드 시작
 *  - 시작 직후 + requeryInterval 마다 PTR <serviceType> 질의 송신
 *  - 수신한 응답은 MdnsCache 에 반영하고 Added/Updated/Removed 를 handler 로 전달 (io 스레드)
 *  - resolve(): 캐시에 없으면 SRV/A 질의를 보내고 condition_variable 로 timeout 까지 대기
 *  - stop(): 소켓 close, io_context stop, thread join. 대기 중인 resolve() 는 즉시 깨어나 nullopt.
 *
 * 주의:
 *  - handler 는 io 스레드에서 호출된다. 네트워크 I/O 등 블로킹 작업 금지.
 */

#include "IServiceBrowser.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace openfan::comm {

class MdnsServiceBrowser : public IServiceBrowser {
public:
    explicit MdnsServiceBrowser(std::chrono::milliseconds requeryInterval = std::chrono::milliseconds(30000));
    ~MdnsServiceBrowser() override;

    MdnsServiceBrowser(const MdnsServiceBrowser&) = delete;
    MdnsServiceBrowser& operator=(const MdnsServiceBrowser&) = delete;

    // throws openfan::protocol::ConnectionException if the multicast socket cannot be set up
    void start(const std::string& serviceType, EventHandler handler) override;
    void stop() override;
    bool isRunning() const noexcept override;

    std::optional<ResolvedService> resolve(const std::string& name,
                                           std::chrono::milliseconds timeout) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace openfan::comm
