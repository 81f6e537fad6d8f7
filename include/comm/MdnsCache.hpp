#pragma once
/**
 * MdnsCache.hpp
 *
 * Record cache behind MdnsServiceBrowser. Pure bookkeeping, no sockets; the
 * browser serializes access.
 *
 *  - PTR <serviceType> -> instance      : instance appears (Added) / goodbye TTL 0 (Removed)
 *  - SRV <instance>    -> host, port
 *  - A   <host>        -> IPv4 address(es)
 *
 * A known instance whose SRV or host addresses change yields Updated.
 * Records may arrive in any order and in separate packets.
 *
 * SRV 와 A 레코드도 각자의 TTL 로 만료된다. LAN 의 다른 서비스가 보낸 레코드도
 * 같이 들어오므로 expire() 가 주기적으로 정리하지 않으면 캐시가 계속 커진다.
 */

#include "IServiceBrowser.hpp"
#include "../protocol/DnsMessage.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace openfan::comm {

class MdnsCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit MdnsCache(std::string serviceType);

    std::vector<ServiceEvent> apply(const protocol::dns::Message& msg, Clock::time_point now);

    // instances whose PTR TTL elapsed are dropped and reported as Removed;
    // SRV records and host addresses past their own TTL are dropped silently
    std::vector<ServiceEvent> expire(Clock::time_point now);

    // complete only once both SRV and at least one A record are known
    std::optional<ResolvedService> lookup(const std::string& instance) const;

    // SRV and/or A questions still needed to resolve instance
    std::vector<protocol::dns::Question> missingQuestions(const std::string& instance) const;

    std::size_t instanceCount() const noexcept { return instances_.size(); }
    std::size_t srvCount() const noexcept { return srv_.size(); }
    std::size_t hostCount() const noexcept { return hosts_.size(); }
    const std::string& serviceType() const noexcept { return serviceType_; }

    void clear();

private:
    struct Instance {
        std::string name;   // as announced (case preserved)
        Clock::time_point expires;
    };
    struct Srv {
        std::string host;
        uint16_t port{0};
        Clock::time_point expires;
    };
    struct Address {
        std::string value;
        Clock::time_point expires;
    };
    struct Host {
        std::vector<Address> addresses;  // newest first
    };

    ServiceEvent makeEvent(ServiceEvent::Kind kind, const std::string& name) const;

    std::string serviceType_;
    std::map<std::string, Instance> instances_;  // keyed by normalized name
    std::map<std::string, Srv> srv_;
    std::map<std::string, Host> hosts_;
};

} // namespace openfan::comm
