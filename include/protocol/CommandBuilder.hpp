#pragma once
#include <algorithm>
#include <string>

#include "../config/Config.hpp"

namespace openfan::protocol {

// wide input so user-typed numbers are clamped before any narrowing to int
inline int clampSpeed(long long percent) noexcept {
    return static_cast<int>(std::clamp<long long>(percent, config::MIN_SPEED_PERCENT, config::MAX_SPEED_PERCENT));
}

struct CommandBuilder {
    // GET /api/v0/fan/status
    static std::string statusTarget() {
        return config::STATUS_PATH;
    }

    // GET /api/v0/fan/0/set?value=<0-100>; value is clamped before it is written
    static std::string setSpeedTarget(int percent) {
        std::string out = config::SET_SPEED_PATH;
        out += "?value=";
        out += std::to_string(clampSpeed(percent));
        return out;
    }
};

} // namespace openfan::protocol
