#pragma once
/**
 * DnsMessage.hpp
 *
 * mDNS (RFC 6762) / DNS-SD (RFC 6763) 에 필요한 만큼의 DNS wire codec.
 *
 *  - encodeQuery(): question 만 있는 query 패킷 생성 (id=0, flags=0, 압축 없음)
 *  - decode(): 응답 패킷 파싱. name compression 지원. 잘못된 패킷은 ProtocolException.
 *  - rdata 는 A / PTR / SRV / TXT 만 해석. 그 외 타입은 name/type/ttl 만 채운다.
 *
 * 이름은 마지막 '.' 없이 저장한다 ("uOpenFan-AB12._http._tcp.local").
 * 비교는 sameName() (대소문자 무시) 으로 한다.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace openfan::protocol::dns {

enum RecordType : uint16_t {
    TYPE_A = 1,
    TYPE_PTR = 12,
    TYPE_TXT = 16,
    TYPE_AAAA = 28,
    TYPE_SRV = 33
};

constexpr uint16_t CLASS_IN = 1;
// top bit of rrclass: cache-flush in answers, unicast-response in questions
constexpr uint16_t CLASS_TOP_BIT = 0x8000;
constexpr uint16_t FLAG_RESPONSE = 0x8000;

struct Question {
    std::string name;
    uint16_t type{TYPE_PTR};
    uint16_t qclass{CLASS_IN};
};

struct Record {
    std::string name;
    uint16_t type{0};
    uint16_t rclass{CLASS_IN};
    uint32_t ttl{0};

    std::string target;            // PTR target, SRV target host
    uint16_t priority{0};          // SRV
    uint16_t weight{0};            // SRV
    uint16_t port{0};              // SRV
    std::string address;           // A, dotted quad
    std::vector<std::string> txt;  // TXT strings
};

struct Message {
    uint16_t id{0};
    uint16_t flags{0};
    std::vector<Question> questions;
    std::vector<Record> answers;
    std::vector<Record> authorities;
    std::vector<Record> additionals;

    bool isResponse() const noexcept { return (flags & FLAG_RESPONSE) != 0; }
};

std::vector<uint8_t> encodeQuery(const std::vector<Question>& questions, uint16_t id = 0);

Message decode(const uint8_t* data, std::size_t size);

inline Message decode(const std::vector<uint8_t>& packet) {
    return decode(packet.data(), packet.size());
}

// lower-case, trailing dot stripped
std::string normalizeName(const std::string& name);

bool sameName(const std::string& a, const std::string& b);

} // namespace openfan::protocol::dns
