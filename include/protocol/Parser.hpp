#pragma once
#include <string>

#include "Result.hpp"
#include "../comm/IHttpClient.hpp"

namespace openfan::protocol {

/**
 * FanStatus: parsed body of GET /api/v0/fan/status
 * - rpm: measured tachometer speed (clamped to >= 0)
 * - pwmPercent: current duty cycle 0..100 (clamped)
 */
struct FanStatus {
    int rpm{0};
    int pwmPercent{0};
};

struct Parser {
    // {"status":"ok","rpm":<int>,"pwm_percent":<int>}; missing numeric fields read as 0
    static Result<FanStatus> parseStatus(const comm::HttpResponse& response);

    // {"status":"ok", ...}; anything else after a 200 is a Semantic failure
    static Result<bool> parseCommandAck(const comm::HttpResponse& response);
};

} // namespace openfan::protocol
