#ifndef OPENFAN_CONNECTION_EXCEPTION_H
#define OPENFAN_CONNECTION_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace openfan::protocol {

/**
 * @brief Transport failure talking to a fan: resolve failure, connection refused/reset, EOF mid-response.
 *
 * Thrown by the HTTP transport; converted into ErrorKind::Transport at the Device boundary.
 */
class ConnectionException : public std::runtime_error {
public:
    explicit ConnectionException(const std::string& message)
        : std::runtime_error("Connection Error: " + message) {}
};

} // namespace openfan::protocol

#endif // OPENFAN_CONNECTION_EXCEPTION_H
