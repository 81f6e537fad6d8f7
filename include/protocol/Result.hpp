#pragma once
#include <string>
#include <utility>

namespace openfan::protocol {

/**
 * ErrorKind: why a device operation failed.
 * - Transport: connection refused / reset / timeout
 * - Protocol:  HTTP status != 200, or body is not the expected JSON
 * - Semantic:  body parsed but "status" != "ok"
 */
enum class ErrorKind {
    None,
    Transport,
    Protocol,
    Semantic
};

inline const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Semantic: return "semantic";
    }
    return "unknown";
}

/**
 * Result: value on success, ErrorKind + message on failure.
 * Every network-facing operation returns one of these instead of throwing.
 */
template <typename T>
struct Result {
    ErrorKind error{ErrorKind::None};
    T value{};
    std::string message;

    bool ok() const noexcept { return error == ErrorKind::None; }
    explicit operator bool() const noexcept { return ok(); }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(ErrorKind kind, std::string msg) {
        Result r;
        r.error = kind;
        r.message = std::move(msg);
        return r;
    }

    // re-tag an error of another Result type
    template <typename U>
    static Result failure(const Result<U>& other) {
        return failure(other.error, other.message);
    }
};

} // namespace openfan::protocol
