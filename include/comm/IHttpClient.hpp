#pragma once

/**
 * IHttpClient.hpp
 *
 * 장치 하나(host:port)에 대한 HTTP 요청 추상 인터페이스
 *
 * 핵심 포인트:
 *  - 생성 시 대상 endpoint 가 고정됨. endpoint 가 바뀌면 새 client 를 만든다.
 *  - get(): 동기 unary GET. 호출 스레드에서 블로킹하며 timeout 을 넘기지 않는다.
 *  - 구현은 연결을 재사용해야 한다 (폴링 주기가 짧으므로 요청마다 연결하지 않음).
 *  - 여러 스레드에서 동시에 호출해도 안전해야 한다 (poller + dispatcher).
 *
 * 실패 정책:
 *  - 연결 실패/리셋 -> openfan::protocol::ConnectionException
 *  - 기한 초과     -> openfan::protocol::TimeoutException
 *  - HTTP status 가 200 이 아닌 것은 예외가 아님. HttpResponse 로 그대로 돌려준다.
 */

#include <chrono>
#include <cstdint>
#include <string>

namespace openfan::comm {

struct HttpResponse {
    int status{0};
    std::string body;
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /// target: origin-form request target, e.g. "/api/v0/fan/status"
    virtual HttpResponse get(const std::string& target, std::chrono::milliseconds timeout) = 0;

    virtual std::string host() const = 0;
    virtual uint16_t port() const noexcept = 0;
};

} // namespace openfan::comm
