#include "protocol/DnsMessage.hpp"
#include "protocol/exceptions/ProtocolException.h"

#include <algorithm>
#include <cctype>

namespace openfan::protocol::dns {

namespace {

constexpr std::size_t HEADER_SIZE = 12;
constexpr std::size_t MAX_LABEL = 63;
constexpr std::size_t MAX_NAME = 255;
constexpr int MAX_POINTER_JUMPS = 32;

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void putName(std::vector<uint8_t>& out, const std::string& name) {
    std::size_t start = 0;
    std::string trimmed = name;
    if (!trimmed.empty() && trimmed.back() == '.') trimmed.pop_back();
    while (start < trimmed.size()) {
        std::size_t dot = trimmed.find('.', start);
        if (dot == std::string::npos) dot = trimmed.size();
        std::size_t len = dot - start;
        if (len == 0 || len > MAX_LABEL) {
            throw ProtocolException("invalid label in name '" + name + "'");
        }
        out.push_back(static_cast<uint8_t>(len));
        out.insert(out.end(), trimmed.begin() + start, trimmed.begin() + dot);
        start = dot + 1;
    }
    out.push_back(0);
}

class Reader {
public:
    Reader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    std::size_t pos() const { return pos_; }
    void seek(std::size_t p) {
        if (p > size_) throw ProtocolException("record data runs past end of packet");
        pos_ = p;
    }

    uint8_t u8() {
        need(1);
        return data_[pos_++];
    }

    uint16_t u16() {
        need(2);
        uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return v;
    }

    uint32_t u32() {
        uint32_t hi = u16();
        uint32_t lo = u16();
        return (hi << 16) | lo;
    }

    std::string bytes(std::size_t n) {
        need(n);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

    // reads a (possibly compressed) name at the cursor and advances past it
    std::string name() {
        std::string out;
        std::size_t cursor = pos_;
        bool jumped = false;
        int jumps = 0;

        while (true) {
            if (cursor >= size_) throw ProtocolException("name runs past end of packet");
            uint8_t len = data_[cursor];
            if ((len & 0xC0) == 0xC0) {
                if (cursor + 1 >= size_) throw ProtocolException("truncated compression pointer");
                std::size_t target = (static_cast<std::size_t>(len & 0x3F) << 8) | data_[cursor + 1];
                if (target >= size_) throw ProtocolException("compression pointer out of range");
                if (++jumps > MAX_POINTER_JUMPS) throw ProtocolException("compression pointer loop");
                if (!jumped) pos_ = cursor + 2;
                jumped = true;
                cursor = target;
                continue;
            }
            if ((len & 0xC0) != 0) throw ProtocolException("unsupported label type");
            if (len == 0) {
                if (!jumped) pos_ = cursor + 1;
                break;
            }
            if (cursor + 1 + len > size_) throw ProtocolException("label runs past end of packet");
            if (!out.empty()) out.push_back('.');
            out.append(reinterpret_cast<const char*>(data_ + cursor + 1), len);
            if (out.size() > MAX_NAME) throw ProtocolException("name too long");
            cursor += 1 + len;
        }
        return out;
    }

private:
    void need(std::size_t n) const {
        if (pos_ + n > size_) throw ProtocolException("packet truncated");
    }

    const uint8_t* data_;
    std::size_t size_;
    std::size_t pos_{0};
};

Record readRecord(Reader& r) {
    Record rec;
    rec.name = r.name();
    rec.type = r.u16();
    rec.rclass = r.u16();
    rec.ttl = r.u32();
    uint16_t rdlength = r.u16();
    std::size_t rdataStart = r.pos();
    std::size_t rdataEnd = rdataStart + rdlength;

    switch (rec.type) {
        case TYPE_A: {
            if (rdlength != 4) throw ProtocolException("A record with rdlength " + std::to_string(rdlength));
            std::string raw = r.bytes(4);
            rec.address = std::to_string(static_cast<uint8_t>(raw[0])) + "." +
                          std::to_string(static_cast<uint8_t>(raw[1])) + "." +
                          std::to_string(static_cast<uint8_t>(raw[2])) + "." +
                          std::to_string(static_cast<uint8_t>(raw[3]));
            break;
        }
        case TYPE_PTR:
            rec.target = r.name();
            break;
        case TYPE_SRV:
            rec.priority = r.u16();
            rec.weight = r.u16();
            rec.port = r.u16();
            rec.target = r.name();
            break;
        case TYPE_TXT:
            while (r.pos() < rdataEnd) {
                uint8_t len = r.u8();
                rec.txt.push_back(r.bytes(len));
            }
            break;
        default:
            break;
    }

    if (r.pos() > rdataEnd) throw ProtocolException("record data overruns rdlength");
    r.seek(rdataEnd);
    return rec;
}

} // namespace

std::vector<uint8_t> encodeQuery(const std::vector<Question>& questions, uint16_t id) {
    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + questions.size() * 48);
    putU16(out, id);
    putU16(out, 0);  // standard query
    putU16(out, static_cast<uint16_t>(questions.size()));
    putU16(out, 0);
    putU16(out, 0);
    putU16(out, 0);
    for (const auto& q : questions) {
        putName(out, q.name);
        putU16(out, q.type);
        putU16(out, q.qclass);
    }
    return out;
}

Message decode(const uint8_t* data, std::size_t size) {
    if (data == nullptr || size < HEADER_SIZE) {
        throw ProtocolException("packet shorter than DNS header");
    }
    Reader r(data, size);
    Message msg;
    msg.id = r.u16();
    msg.flags = r.u16();
    uint16_t qd = r.u16();
    uint16_t an = r.u16();
    uint16_t ns = r.u16();
    uint16_t ar = r.u16();

    for (uint16_t i = 0; i < qd; ++i) {
        Question q;
        q.name = r.name();
        q.type = r.u16();
        q.qclass = r.u16();
        msg.questions.push_back(std::move(q));
    }
    for (uint16_t i = 0; i < an; ++i) msg.answers.push_back(readRecord(r));
    for (uint16_t i = 0; i < ns; ++i) msg.authorities.push_back(readRecord(r));
    for (uint16_t i = 0; i < ar; ++i) msg.additionals.push_back(readRecord(r));
    return msg;
}

std::string normalizeName(const std::string& name) {
    std::string out = name;
    if (!out.empty() && out.back() == '.') out.pop_back();
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool sameName(const std::string& a, const std::string& b) {
    return normalizeName(a) == normalizeName(b);
}

} // namespace openfan::protocol::dns
