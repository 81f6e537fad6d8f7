#include "comm/BeastHttpClient.hpp"
#include "protocol/exceptions/ConnectionException.h"
#include "protocol/exceptions/TimeoutException.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <mutex>
#include <vector>

namespace openfan::comm {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using openfan::protocol::ConnectionException;
using openfan::protocol::TimeoutException;

namespace {

struct Connection {
    net::io_context ioc;
    beast::tcp_stream stream{ioc};
    beast::flat_buffer buffer;
    bool open{false};

    // run queued async ops to completion on the calling thread
    void runOps() {
        ioc.restart();
        ioc.run();
    }

    void close() {
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream.close();
        buffer.consume(buffer.size());
        open = false;
    }
};

bool isStaleConnectionError(const beast::error_code& ec) {
    return ec == http::error::end_of_stream ||
           ec == net::error::eof ||
           ec == net::error::connection_reset ||
           ec == net::error::broken_pipe ||
           ec == net::error::connection_aborted;
}

} // namespace

class BeastHttpClient::Impl {
public:
    using Clock = std::chrono::steady_clock;

    Impl(std::string h, uint16_t p, std::size_t capacity)
        : host(std::move(h)), port(p), capacity(capacity == 0 ? 1 : capacity) {}

    const std::string host;
    const uint16_t port;
    const std::size_t capacity;

    mutable std::mutex poolMtx;
    std::condition_variable poolCv;
    std::vector<std::unique_ptr<Connection>> idle;
    std::size_t total{0};

    std::string endpoint() const { return host + ":" + std::to_string(port); }

    std::unique_ptr<Connection> acquire(Clock::time_point deadline) {
        std::unique_lock<std::mutex> lk(poolMtx);
        bool available = poolCv.wait_until(lk, deadline, [this]() {
            return !idle.empty() || total < capacity;
        });
        if (!available) {
            throw TimeoutException("no free connection to " + endpoint());
        }
        if (!idle.empty()) {
            auto conn = std::move(idle.back());
            idle.pop_back();
            return conn;
        }
        ++total;
        return std::make_unique<Connection>();
    }

    void release(std::unique_ptr<Connection> conn) {
        {
            std::lock_guard<std::mutex> lk(poolMtx);
            idle.push_back(std::move(conn));
        }
        poolCv.notify_one();
    }

    void connect(Connection& c, Clock::time_point deadline) {
        beast::error_code ec;
        tcp::resolver resolver(c.ioc);
        tcp::resolver::results_type results;
        resolver.async_resolve(host, std::to_string(port),
            [&](const beast::error_code& e, tcp::resolver::results_type r) {
                ec = e;
                results = std::move(r);
            });
        c.runOps();
        if (ec) {
            throw ConnectionException("resolve " + endpoint() + " failed: " + ec.message());
        }

        c.stream.expires_at(deadline);
        c.stream.async_connect(results,
            [&](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
        c.runOps();
        if (ec == beast::error::timeout) {
            throw TimeoutException("connect " + endpoint() + " timed out");
        }
        if (ec) {
            throw ConnectionException("connect " + endpoint() + " failed: " + ec.message());
        }
        c.open = true;
    }

    // single request on an already connected stream; returns error instead of throwing
    beast::error_code exchange(Connection& c,
                               const std::string& target,
                               Clock::time_point deadline,
                               http::response<http::string_body>& res) {
        beast::error_code ec;
        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, host);
        req.set(http::field::user_agent, "openfan-controller");
        req.set(http::field::accept, "application/json");
        req.keep_alive(true);

        c.stream.expires_at(deadline);
        http::async_write(c.stream, req,
            [&](const beast::error_code& e, std::size_t) { ec = e; });
        c.runOps();
        if (ec) return ec;

        http::async_read(c.stream, c.buffer, res,
            [&](const beast::error_code& e, std::size_t) { ec = e; });
        c.runOps();
        return ec;
    }

    HttpResponse get(const std::string& target, std::chrono::milliseconds timeout) {
        const auto deadline = Clock::now() + timeout;
        auto conn = acquire(deadline);

        try {
            http::response<http::string_body> res;
            bool reused = conn->open;
            if (!conn->open) connect(*conn, deadline);

            beast::error_code ec = exchange(*conn, target, deadline, res);
            if (ec && reused && isStaleConnectionError(ec)) {
                spdlog::debug("[BeastHttpClient] stale pooled connection to {} ({}), reconnecting",
                              endpoint(), ec.message());
                conn->close();
                connect(*conn, deadline);
                res = {};
                ec = exchange(*conn, target, deadline, res);
            }
            if (ec == beast::error::timeout) {
                throw TimeoutException("GET " + target + " on " + endpoint() + " timed out");
            }
            if (ec) {
                throw ConnectionException("GET " + target + " on " + endpoint() + " failed: " + ec.message());
            }

            conn->stream.expires_never();
            if (!res.keep_alive()) conn->close();

            HttpResponse out;
            out.status = static_cast<int>(res.result_int());
            out.body = std::move(res.body());
            release(std::move(conn));
            return out;
        } catch (...) {
            conn->close();
            release(std::move(conn));
            throw;
        }
    }
};

BeastHttpClient::BeastHttpClient(std::string host, uint16_t port, std::size_t poolCapacity)
    : impl_(std::make_unique<Impl>(std::move(host), port, poolCapacity)) {}

BeastHttpClient::~BeastHttpClient() = default;

HttpResponse BeastHttpClient::get(const std::string& target, std::chrono::milliseconds timeout) {
    return impl_->get(target, timeout);
}

std::string BeastHttpClient::host() const {
    return impl_->host;
}

uint16_t BeastHttpClient::port() const noexcept {
    return impl_->port;
}

} // namespace openfan::comm
