// MdnsCacheTests.cpp
// Record bookkeeping behind the mDNS browser: PTR/SRV/A records in, service events out.

#include <gtest/gtest.h>

#include "comm/MdnsCache.hpp"

using namespace openfan::comm;
using namespace openfan::protocol::dns;
using Clock = MdnsCache::Clock;

namespace {

const std::string kService = "_http._tcp.local";
const std::string kInstance = "uOpenFan-AB12._http._tcp.local";
const std::string kHost = "uOpenFan-AB12.local";

Record ptr(const std::string& instance, uint32_t ttl = 120) {
    Record r;
    r.name = kService;
    r.type = TYPE_PTR;
    r.ttl = ttl;
    r.target = instance;
    return r;
}

Record srv(const std::string& instance, const std::string& host, uint16_t port, uint32_t ttl = 120) {
    Record r;
    r.name = instance;
    r.type = TYPE_SRV;
    r.ttl = ttl;
    r.target = host;
    r.port = port;
    return r;
}

Record a(const std::string& host, const std::string& address, uint32_t ttl = 120) {
    Record r;
    r.name = host;
    r.type = TYPE_A;
    r.ttl = ttl;
    r.address = address;
    return r;
}

Message response(std::vector<Record> answers, std::vector<Record> additionals = {}) {
    Message m;
    m.flags = FLAG_RESPONSE;
    m.answers = std::move(answers);
    m.additionals = std::move(additionals);
    return m;
}

} // namespace

class MdnsCacheTest : public ::testing::Test {
protected:
    MdnsCache cache{kService};
    Clock::time_point now = Clock::now();
};

//==============================================================================
// Announcements
//==============================================================================

TEST_F(MdnsCacheTest, FullAnnouncementAddsAndResolves) {
    auto events = cache.apply(response({ptr(kInstance)}, {srv(kInstance, kHost, 80), a(kHost, "10.0.0.5")}), now);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, ServiceEvent::Kind::Added);
    EXPECT_EQ(events[0].name, kInstance);
    EXPECT_EQ(events[0].serviceType, kService);

    auto resolved = cache.lookup(kInstance);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->port, 80);
    ASSERT_EQ(resolved->addresses.size(), 1u);
    EXPECT_EQ(resolved->addresses[0], "10.0.0.5");
    EXPECT_TRUE(cache.missingQuestions(kInstance).empty());
}

TEST_F(MdnsCacheTest, RepeatedAnnouncementIsQuiet) {
    auto msg = response({ptr(kInstance)}, {srv(kInstance, kHost, 80), a(kHost, "10.0.0.5")});
    cache.apply(msg, now);
    EXPECT_TRUE(cache.apply(msg, now).empty());
    EXPECT_EQ(cache.instanceCount(), 1u);
}

TEST_F(MdnsCacheTest, IgnoresOtherServiceTypes) {
    Record other = ptr("printer._ipp._tcp.local");
    other.name = "_ipp._tcp.local";
    EXPECT_TRUE(cache.apply(response({other}), now).empty());
    EXPECT_EQ(cache.instanceCount(), 0u);
}

TEST_F(MdnsCacheTest, RecordsInSeparatePacketsResolveIncrementally) {
    cache.apply(response({ptr(kInstance)}), now);
    EXPECT_FALSE(cache.lookup(kInstance).has_value());
    auto q = cache.missingQuestions(kInstance);
    ASSERT_EQ(q.size(), 1u);
    EXPECT_EQ(q[0].type, TYPE_SRV);

    cache.apply(response({srv(kInstance, kHost, 8080)}), now);
    q = cache.missingQuestions(kInstance);
    ASSERT_EQ(q.size(), 1u);
    EXPECT_EQ(q[0].type, TYPE_A);

    cache.apply(response({a(kHost, "10.0.0.9")}), now);
    auto resolved = cache.lookup(kInstance);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->port, 8080);
    EXPECT_EQ(resolved->addresses.front(), "10.0.0.9");
}

//==============================================================================
// Changes and removal
//==============================================================================

TEST_F(MdnsCacheTest, NewAddressForKnownInstanceIsUpdated) {
    cache.apply(response({ptr(kInstance)}, {srv(kInstance, kHost, 80), a(kHost, "10.0.0.5")}), now);

    auto events = cache.apply(response({a(kHost, "10.0.0.7")}), now);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, ServiceEvent::Kind::Updated);
    EXPECT_EQ(cache.lookup(kInstance)->addresses.front(), "10.0.0.7");
}

TEST_F(MdnsCacheTest, GoodbyeRemovesInstance) {
    cache.apply(response({ptr(kInstance)}, {srv(kInstance, kHost, 80), a(kHost, "10.0.0.5")}), now);

    auto events = cache.apply(response({ptr(kInstance, 0)}), now);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, ServiceEvent::Kind::Removed);
    EXPECT_EQ(events[0].name, kInstance);
    EXPECT_EQ(cache.instanceCount(), 0u);
    EXPECT_FALSE(cache.lookup(kInstance).has_value());
}

TEST_F(MdnsCacheTest, GoodbyeForUnknownInstanceIsIgnored) {
    EXPECT_TRUE(cache.apply(response({ptr(kInstance, 0)}), now).empty());
}

TEST_F(MdnsCacheTest, ExpiredInstancesAreRemoved) {
    cache.apply(response({ptr(kInstance, 10)}), now);
    EXPECT_TRUE(cache.expire(now + std::chrono::seconds(5)).empty());

    auto events = cache.expire(now + std::chrono::seconds(11));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, ServiceEvent::Kind::Removed);
    EXPECT_EQ(cache.instanceCount(), 0u);
}

TEST_F(MdnsCacheTest, NamesMatchCaseInsensitively) {
    cache.apply(response({ptr("UOPENFAN-AB12._http._tcp.local")},
                         {srv("uopenfan-ab12._http._tcp.local", "UOPENFAN-AB12.local", 80),
                          a("uOpenFan-AB12.local", "10.0.0.5")}),
                now);
    EXPECT_EQ(cache.instanceCount(), 1u);
    EXPECT_TRUE(cache.lookup(kInstance).has_value());
}

//==============================================================================
// Unrelated records / record expiry
//==============================================================================

TEST_F(MdnsCacheTest, UnrelatedHostsArePrunedAfterTheirTtl) {
    // other devices on the LAN answer too; their SRV and A records land in the cache
    for (int i = 0; i < 50; ++i) {
        const std::string host = "printer-" + std::to_string(i) + ".local";
        cache.apply(response({srv("printer-" + std::to_string(i) + "._ipp._tcp.local", host, 631, 120),
                              a(host, "10.0.1." + std::to_string(i), 120)}),
                    now);
    }
    EXPECT_EQ(cache.srvCount(), 50u);
    EXPECT_EQ(cache.hostCount(), 50u);

    EXPECT_TRUE(cache.expire(now + std::chrono::seconds(60)).empty());
    EXPECT_EQ(cache.hostCount(), 50u);

    EXPECT_TRUE(cache.expire(now + std::chrono::seconds(121)).empty());
    EXPECT_EQ(cache.srvCount(), 0u);
    EXPECT_EQ(cache.hostCount(), 0u);
}

TEST_F(MdnsCacheTest, RefreshedRecordsSurviveExpiry) {
    cache.apply(response({ptr(kInstance, 4500)}, {srv(kInstance, kHost, 80), a(kHost, "10.0.0.5")}), now);

    // re-announced at +100 s, so still valid at +150 s
    cache.apply(response({ptr(kInstance, 4500)}, {srv(kInstance, kHost, 80), a(kHost, "10.0.0.5")}),
                now + std::chrono::seconds(100));
    EXPECT_TRUE(cache.expire(now + std::chrono::seconds(150)).empty());
    ASSERT_TRUE(cache.lookup(kInstance).has_value());

    // not refreshed again: SRV/A lapse but the instance itself stays known
    EXPECT_TRUE(cache.expire(now + std::chrono::seconds(221)).empty());
    EXPECT_EQ(cache.instanceCount(), 1u);
    EXPECT_FALSE(cache.lookup(kInstance).has_value());
    auto q = cache.missingQuestions(kInstance);
    ASSERT_EQ(q.size(), 1u);
    EXPECT_EQ(q[0].type, TYPE_SRV);
}

TEST_F(MdnsCacheTest, StaleAddressIsDroppedWhileFreshOneStays) {
    cache.apply(response({ptr(kInstance, 4500)}, {srv(kInstance, kHost, 80, 4500), a(kHost, "10.0.0.5", 60)}), now);
    cache.apply(response({a(kHost, "10.0.0.7", 600)}), now);

    cache.expire(now + std::chrono::seconds(61));
    auto resolved = cache.lookup(kInstance);
    ASSERT_TRUE(resolved.has_value());
    ASSERT_EQ(resolved->addresses.size(), 1u);
    EXPECT_EQ(resolved->addresses[0], "10.0.0.7");
}

TEST_F(MdnsCacheTest, AddressGoodbyeForUnknownHostCreatesNothing) {
    EXPECT_TRUE(cache.apply(response({a("elsewhere.local", "10.0.2.1", 0)}), now).empty());
    EXPECT_EQ(cache.hostCount(), 0u);
}
