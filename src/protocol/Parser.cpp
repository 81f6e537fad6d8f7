#include "protocol/Parser.hpp"
#include "protocol/CommandBuilder.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace openfan::protocol {

namespace {

using json = nlohmann::json;

// HTTP status + JSON object + "status":"ok"; returns the object on success
Result<json> checkEnvelope(const comm::HttpResponse& response) {
    if (response.status != 200) {
        return Result<json>::failure(ErrorKind::Protocol,
                                     "unexpected HTTP status " + std::to_string(response.status));
    }
    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Result<json>::failure(ErrorKind::Protocol, "response body is not a JSON object");
    }
    auto it = body.find("status");
    if (it == body.end() || !it->is_string() || it->get<std::string>() != "ok") {
        std::string msg = "device reported status ";
        msg += (it != body.end()) ? it->dump() : std::string("<missing>");
        auto m = body.find("message");
        if (m != body.end() && m->is_string()) {
            msg += ": " + m->get<std::string>();
        }
        return Result<json>::failure(ErrorKind::Semantic, msg);
    }
    return Result<json>::success(std::move(body));
}

// absent -> 0, number -> truncated int saturated to the int range, anything else -> error
bool readInt(const json& body, const char* key, int& out) {
    constexpr int kMax = std::numeric_limits<int>::max();
    constexpr int kMin = std::numeric_limits<int>::min();

    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        out = 0;
        return true;
    }
    if (it->is_number_unsigned()) {
        const auto v = it->get<unsigned long long>();
        out = v > static_cast<unsigned long long>(kMax) ? kMax : static_cast<int>(v);
        return true;
    }
    if (it->is_number_integer()) {
        const auto v = it->get<long long>();
        out = static_cast<int>(std::clamp<long long>(v, kMin, kMax));
        return true;
    }
    if (it->is_number_float()) {
        const double v = it->get<double>();
        if (!std::isfinite(v)) return false;
        if (v >= static_cast<double>(kMax)) {
            out = kMax;
        } else if (v <= static_cast<double>(kMin)) {
            out = kMin;
        } else {
            out = static_cast<int>(v);
        }
        return true;
    }
    return false;
}

} // namespace

Result<FanStatus> Parser::parseStatus(const comm::HttpResponse& response) {
    auto env = checkEnvelope(response);
    if (!env) return Result<FanStatus>::failure(env);

    FanStatus status;
    if (!readInt(env.value, "rpm", status.rpm)) {
        return Result<FanStatus>::failure(ErrorKind::Protocol, "field 'rpm' is not a number");
    }
    if (!readInt(env.value, "pwm_percent", status.pwmPercent)) {
        return Result<FanStatus>::failure(ErrorKind::Protocol, "field 'pwm_percent' is not a number");
    }
    status.rpm = std::max(0, status.rpm);
    status.pwmPercent = clampSpeed(status.pwmPercent);
    return Result<FanStatus>::success(status);
}

Result<bool> Parser::parseCommandAck(const comm::HttpResponse& response) {
    auto env = checkEnvelope(response);
    if (!env) return Result<bool>::failure(env);
    return Result<bool>::success(true);
}

} // namespace openfan::protocol
