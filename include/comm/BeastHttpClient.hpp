#pragma once

/**
 * BeastHttpClient.hpp
 *
 * Boost.Beast 기반 IHttpClient 구현 (헤더)
 *
 * 설계 요약:
 *  - 연결 풀: 최대 poolCapacity 개의 keep-alive 연결. 모두 사용 중이면 하나가 반납될 때까지 대기.
 *  - 각 연결은 자신의 io_context 를 소유하고, get() 을 호출한 스레드에서 run() 한다.
 *    (별도 io 스레드 없음: 호출자가 이미 worker pool 스레드이므로)
 *  - timeout 은 beast::tcp_stream 의 expires_at() 으로 요청 전체(connect+write+read)에 적용.
 *  - 재사용한 연결이 서버 쪽에서 이미 닫혀 있으면 새 연결로 한 번 재시도.
 */

#include "IHttpClient.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace openfan::comm {

class BeastHttpClient : public IHttpClient {
public:
    BeastHttpClient(std::string host, uint16_t port, std::size_t poolCapacity = 2);
    ~BeastHttpClient() override;

    BeastHttpClient(const BeastHttpClient&) = delete;
    BeastHttpClient& operator=(const BeastHttpClient&) = delete;

    HttpResponse get(const std::string& target, std::chrono::milliseconds timeout) override;

    std::string host() const override;
    uint16_t port() const noexcept override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace openfan::comm
