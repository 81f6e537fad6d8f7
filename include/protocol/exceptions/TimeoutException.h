#ifndef OPENFAN_TIMEOUT_EXCEPTION_H
#define OPENFAN_TIMEOUT_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace openfan::protocol {

/**
 * @brief The request deadline expired before a complete HTTP response arrived.
 *
 * Treated the same as ConnectionException by callers (ErrorKind::Transport).
 */
class TimeoutException : public std::runtime_error {
public:
    explicit TimeoutException(const std::string& message)
        : std::runtime_error("Timeout Error: " + message) {}
};

} // namespace openfan::protocol

#endif // OPENFAN_TIMEOUT_EXCEPTION_H
