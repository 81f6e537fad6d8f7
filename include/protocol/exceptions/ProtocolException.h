#ifndef OPENFAN_PROTOCOL_EXCEPTION_H
#define OPENFAN_PROTOCOL_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace openfan::protocol {

/**
 * @brief Malformed wire data: truncated DNS packet, bad name compression pointer, etc.
 */
class ProtocolException : public std::runtime_error {
public:
    explicit ProtocolException(const std::string& message)
        : std::runtime_error("Protocol Error: " + message) {}
};

} // namespace openfan::protocol

#endif // OPENFAN_PROTOCOL_EXCEPTION_H
