#include "comm/MdnsCache.hpp"

#include <algorithm>
#include <set>

namespace openfan::comm {

namespace dns = openfan::protocol::dns;

namespace {

std::string stripDot(const std::string& name) {
    if (!name.empty() && name.back() == '.') return name.substr(0, name.size() - 1);
    return name;
}

} // namespace

MdnsCache::MdnsCache(std::string serviceType)
    : serviceType_(stripDot(serviceType)) {}

ServiceEvent MdnsCache::makeEvent(ServiceEvent::Kind kind, const std::string& name) const {
    ServiceEvent ev;
    ev.kind = kind;
    ev.serviceType = serviceType_;
    ev.name = name;
    return ev;
}

std::vector<ServiceEvent> MdnsCache::apply(const dns::Message& msg, Clock::time_point now) {
    std::vector<ServiceEvent> events;
    std::vector<const dns::Record*> records;
    for (const auto& r : msg.answers) records.push_back(&r);
    for (const auto& r : msg.additionals) records.push_back(&r);

    std::set<std::string> changedHosts;
    std::set<std::string> changedSrv;
    std::set<std::string> added;

    for (const auto* rec : records) {
        if (rec->type != dns::TYPE_A) continue;
        const std::string key = dns::normalizeName(rec->name);
        if (rec->ttl == 0) {
            auto host = hosts_.find(key);
            if (host == hosts_.end()) continue;
            auto& addrs = host->second.addresses;
            auto it = std::find_if(addrs.begin(), addrs.end(),
                                   [&](const Address& a) { return a.value == rec->address; });
            if (it != addrs.end()) {
                addrs.erase(it);
                changedHosts.insert(key);
            }
            if (addrs.empty()) hosts_.erase(host);
            continue;
        }
        const auto expires = now + std::chrono::seconds(rec->ttl);
        auto& addrs = hosts_[key].addresses;
        auto it = std::find_if(addrs.begin(), addrs.end(),
                               [&](const Address& a) { return a.value == rec->address; });
        if (it == addrs.end()) {
            // newest first: a re-announced address becomes the preferred one
            addrs.insert(addrs.begin(), Address{rec->address, expires});
            changedHosts.insert(key);
        } else {
            it->expires = expires;
        }
    }

    for (const auto* rec : records) {
        if (rec->type != dns::TYPE_SRV) continue;
        const std::string key = dns::normalizeName(rec->name);
        if (rec->ttl == 0) {
            if (srv_.erase(key) > 0) changedSrv.insert(key);
            continue;
        }
        Srv next{dns::normalizeName(rec->target), rec->port, now + std::chrono::seconds(rec->ttl)};
        auto it = srv_.find(key);
        if (it == srv_.end() || it->second.host != next.host || it->second.port != next.port) {
            changedSrv.insert(key);
        }
        srv_[key] = next;
    }

    for (const auto* rec : records) {
        if (rec->type != dns::TYPE_PTR || !dns::sameName(rec->name, serviceType_)) continue;
        const std::string key = dns::normalizeName(rec->target);
        auto it = instances_.find(key);
        if (rec->ttl == 0) {
            if (it != instances_.end()) {
                events.push_back(makeEvent(ServiceEvent::Kind::Removed, it->second.name));
                instances_.erase(it);
                srv_.erase(key);
            }
            continue;
        }
        const auto expires = now + std::chrono::seconds(rec->ttl);
        if (it == instances_.end()) {
            instances_[key] = Instance{stripDot(rec->target), expires};
            added.insert(key);
            events.push_back(makeEvent(ServiceEvent::Kind::Added, stripDot(rec->target)));
        } else {
            it->second.expires = expires;
        }
    }

    for (const auto& [key, inst] : instances_) {
        if (added.count(key)) continue;
        bool updated = changedSrv.count(key) > 0;
        if (!updated) {
            auto s = srv_.find(key);
            updated = s != srv_.end() && changedHosts.count(s->second.host) > 0;
        }
        if (updated) events.push_back(makeEvent(ServiceEvent::Kind::Updated, inst.name));
    }
    return events;
}

std::vector<ServiceEvent> MdnsCache::expire(Clock::time_point now) {
    std::vector<ServiceEvent> events;
    for (auto it = instances_.begin(); it != instances_.end();) {
        if (it->second.expires <= now) {
            events.push_back(makeEvent(ServiceEvent::Kind::Removed, it->second.name));
            srv_.erase(it->first);
            it = instances_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = srv_.begin(); it != srv_.end();) {
        if (it->second.expires <= now) {
            it = srv_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = hosts_.begin(); it != hosts_.end();) {
        auto& addrs = it->second.addresses;
        addrs.erase(std::remove_if(addrs.begin(), addrs.end(),
                                   [now](const Address& a) { return a.expires <= now; }),
                    addrs.end());
        if (addrs.empty()) {
            it = hosts_.erase(it);
        } else {
            ++it;
        }
    }
    return events;
}

std::optional<ResolvedService> MdnsCache::lookup(const std::string& instance) const {
    auto s = srv_.find(dns::normalizeName(instance));
    if (s == srv_.end()) return std::nullopt;
    auto h = hosts_.find(s->second.host);
    if (h == hosts_.end() || h->second.addresses.empty()) return std::nullopt;

    ResolvedService out;
    out.name = stripDot(instance);
    out.host = s->second.host;
    for (const auto& a : h->second.addresses) out.addresses.push_back(a.value);
    out.port = s->second.port;
    return out;
}

std::vector<dns::Question> MdnsCache::missingQuestions(const std::string& instance) const {
    std::vector<dns::Question> out;
    auto s = srv_.find(dns::normalizeName(instance));
    if (s == srv_.end()) {
        out.push_back(dns::Question{stripDot(instance), dns::TYPE_SRV, dns::CLASS_IN});
        return out;
    }
    auto h = hosts_.find(s->second.host);
    if (h == hosts_.end() || h->second.addresses.empty()) {
        out.push_back(dns::Question{s->second.host, dns::TYPE_A, dns::CLASS_IN});
    }
    return out;
}

void MdnsCache::clear() {
    instances_.clear();
    srv_.clear();
    hosts_.clear();
}

} // namespace openfan::comm
