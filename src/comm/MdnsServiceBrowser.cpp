#include "comm/MdnsServiceBrowser.hpp"
#include "comm/MdnsCache.hpp"
#include "config/Config.hpp"
#include "protocol/DnsMessage.hpp"
#include "protocol/exceptions/ConnectionException.h"
#include "protocol/exceptions/ProtocolException.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace openfan::comm {

namespace net = boost::asio;
namespace dns = openfan::protocol::dns;
using udp = net::ip::udp;

class MdnsServiceBrowser::Impl {
public:
    using Clock = std::chrono::steady_clock;
    using WorkGuard = net::executor_work_guard<net::io_context::executor_type>;

    explicit Impl(std::chrono::milliseconds requery)
        : requeryInterval(requery),
          groupEndpoint(net::ip::make_address_v4(config::MDNS_GROUP_V4), config::MDNS_PORT) {}

    const std::chrono::milliseconds requeryInterval;
    const udp::endpoint groupEndpoint;

    // lifecycle: start/stop and anything that posts into ioc from outside
    std::mutex lifecycleMtx;
    std::unique_ptr<net::io_context> ioc;
    std::unique_ptr<udp::socket> socket;
    std::unique_ptr<net::steady_timer> requeryTimer;
    std::unique_ptr<WorkGuard> workGuard;
    std::thread ioThread;
    std::atomic<bool> running{false};

    // io thread only
    udp::endpoint sender;
    std::array<uint8_t, 9000> recvBuf{};

    // cache + handler, shared with resolve() callers
    std::mutex cacheMtx;
    std::condition_variable cacheCv;
    std::unique_ptr<MdnsCache> cache;
    EventHandler handler;
    std::string serviceType;

    void deliver(const std::vector<ServiceEvent>& events, const EventHandler& h) {
        if (!h) return;
        for (const auto& ev : events) {
            try {
                h(ev);
            } catch (const std::exception& ex) {
                spdlog::error("[MdnsServiceBrowser] event handler threw for {}: {}", ev.name, ex.what());
            }
        }
    }

    // io thread
    void sendQuery(const std::vector<dns::Question>& questions) {
        if (questions.empty() || !socket || !socket->is_open()) return;
        auto packet = std::make_shared<std::vector<uint8_t>>();
        try {
            *packet = dns::encodeQuery(questions);
        } catch (const protocol::ProtocolException& ex) {
            spdlog::warn("[MdnsServiceBrowser] cannot encode query: {}", ex.what());
            return;
        }
        socket->async_send_to(net::buffer(*packet), groupEndpoint,
            [packet](const boost::system::error_code& ec, std::size_t) {
                if (ec && ec != net::error::operation_aborted) {
                    spdlog::warn("[MdnsServiceBrowser] query send failed: {}", ec.message());
                }
            });
    }

    // any thread; caller must hold lifecycleMtx
    void postQuery(std::vector<dns::Question> questions) {
        if (!running.load() || !ioc) return;
        net::post(*ioc, [this, qs = std::move(questions)]() { sendQuery(qs); });
    }

    void startReceive() {
        if (!socket || !socket->is_open()) return;
        socket->async_receive_from(net::buffer(recvBuf), sender,
            [this](const boost::system::error_code& ec, std::size_t bytes) {
                if (ec == net::error::operation_aborted || !running.load()) return;
                if (ec) {
                    spdlog::warn("[MdnsServiceBrowser] receive error: {}", ec.message());
                } else {
                    onPacket(bytes);
                }
                startReceive();
            });
    }

    void onPacket(std::size_t bytes) {
        dns::Message msg;
        try {
            msg = dns::decode(recvBuf.data(), bytes);
        } catch (const protocol::ProtocolException& ex) {
            spdlog::debug("[MdnsServiceBrowser] dropping packet from {}: {}",
                          sender.address().to_string(), ex.what());
            return;
        }
        if (!msg.isResponse()) return;

        std::vector<ServiceEvent> events;
        EventHandler h;
        {
            std::lock_guard<std::mutex> lk(cacheMtx);
            if (!cache) return;
            events = cache->apply(msg, Clock::now());
            h = handler;
        }
        cacheCv.notify_all();
        deliver(events, h);
    }

    void scheduleRequery() {
        requeryTimer->expires_after(requeryInterval);
        requeryTimer->async_wait([this](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted || !running.load()) return;
            std::vector<ServiceEvent> expired;
            EventHandler h;
            std::string type;
            {
                std::lock_guard<std::mutex> lk(cacheMtx);
                if (!cache) return;
                expired = cache->expire(Clock::now());
                h = handler;
                type = serviceType;
                spdlog::debug("[MdnsServiceBrowser] cache: {} instance(s), {} srv, {} host(s)",
                              cache->instanceCount(), cache->srvCount(), cache->hostCount());
            }
            deliver(expired, h);
            sendQuery({dns::Question{type, dns::TYPE_PTR, dns::CLASS_IN}});
            scheduleRequery();
        });
    }
};

MdnsServiceBrowser::MdnsServiceBrowser(std::chrono::milliseconds requeryInterval)
    : impl_(std::make_unique<Impl>(requeryInterval)) {}

MdnsServiceBrowser::~MdnsServiceBrowser() {
    stop();
}

void MdnsServiceBrowser::start(const std::string& serviceType, EventHandler handler) {
    std::lock_guard<std::mutex> lk(impl_->lifecycleMtx);
    if (impl_->running.load()) return;

    auto ioc = std::make_unique<net::io_context>();
    auto socket = std::make_unique<udp::socket>(*ioc);
    try {
        socket->open(udp::v4());
        socket->set_option(udp::socket::reuse_address(true));
        socket->bind(udp::endpoint(net::ip::address_v4::any(), config::MDNS_PORT));
        socket->set_option(net::ip::multicast::join_group(impl_->groupEndpoint.address().to_v4()));
        socket->set_option(net::ip::multicast::enable_loopback(true));
        socket->set_option(net::ip::multicast::hops(255));
    } catch (const boost::system::system_error& ex) {
        throw protocol::ConnectionException(std::string("mDNS socket setup failed: ") + ex.what());
    }

    {
        std::lock_guard<std::mutex> ck(impl_->cacheMtx);
        impl_->cache = std::make_unique<MdnsCache>(serviceType);
        impl_->handler = std::move(handler);
        impl_->serviceType = serviceType;
    }

    impl_->ioc = std::move(ioc);
    impl_->socket = std::move(socket);
    impl_->requeryTimer = std::make_unique<net::steady_timer>(*impl_->ioc);
    impl_->workGuard = std::make_unique<Impl::WorkGuard>(net::make_work_guard(*impl_->ioc));
    impl_->running.store(true);

    Impl* impl = impl_.get();
    net::post(*impl->ioc, [impl, serviceType]() {
        impl->startReceive();
        impl->sendQuery({dns::Question{serviceType, dns::TYPE_PTR, dns::CLASS_IN}});
        impl->scheduleRequery();
    });
    impl->ioThread = std::thread([impl]() {
        try {
            impl->ioc->run();
        } catch (const std::exception& ex) {
            spdlog::error("[MdnsServiceBrowser] io_context.run() threw: {}", ex.what());
        }
    });
    spdlog::info("[MdnsServiceBrowser] browsing {} on {}:{}", serviceType,
                 config::MDNS_GROUP_V4, config::MDNS_PORT);
}

void MdnsServiceBrowser::stop() {
    std::lock_guard<std::mutex> lk(impl_->lifecycleMtx);
    if (!impl_->running.exchange(false)) return;

    Impl* impl = impl_.get();
    net::post(*impl->ioc, [impl]() {
        boost::system::error_code ec;
        impl->requeryTimer->cancel();
        impl->socket->close(ec);
    });
    impl->workGuard.reset();
    if (impl->ioThread.joinable()) impl->ioThread.join();

    impl->requeryTimer.reset();
    impl->socket.reset();
    impl->ioc.reset();
    {
        std::lock_guard<std::mutex> ck(impl->cacheMtx);
        impl->cache.reset();
        impl->handler = nullptr;
    }
    impl->cacheCv.notify_all();
    spdlog::info("[MdnsServiceBrowser] stopped");
}

bool MdnsServiceBrowser::isRunning() const noexcept {
    return impl_->running.load();
}

std::optional<ResolvedService> MdnsServiceBrowser::resolve(const std::string& name,
                                                           std::chrono::milliseconds timeout) {
    const auto deadline = Impl::Clock::now() + timeout;
    std::vector<dns::Question> questions;
    {
        std::lock_guard<std::mutex> ck(impl_->cacheMtx);
        if (!impl_->cache) return std::nullopt;
        if (auto hit = impl_->cache->lookup(name)) return hit;
        questions = impl_->cache->missingQuestions(name);
    }
    {
        std::lock_guard<std::mutex> lk(impl_->lifecycleMtx);
        impl_->postQuery(std::move(questions));
    }

    std::unique_lock<std::mutex> ck(impl_->cacheMtx);
    impl_->cacheCv.wait_until(ck, deadline, [&]() {
        return !impl_->cache || impl_->cache->lookup(name).has_value();
    });
    if (!impl_->cache) return std::nullopt;
    return impl_->cache->lookup(name);
}

} // namespace openfan::comm
