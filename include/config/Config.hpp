#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace openfan::config {

using ms = std::chrono::milliseconds;

// mDNS / DNS-SD
constexpr const char* SERVICE_TYPE = "_http._tcp.local";
constexpr const char* DEVICE_NAME_PREFIX = "uOpenFan";
constexpr const char* SERIAL_PREFIX = "uOpenFan-";
constexpr const char* MDNS_GROUP_V4 = "224.0.0.251";
constexpr uint16_t MDNS_PORT = 5353;
constexpr ms DEFAULT_MDNS_REQUERY_INTERVAL_MS = ms(30000);
constexpr ms DEFAULT_RESOLVE_TIMEOUT_MS = ms(3000);

// 장치 HTTP API
constexpr uint16_t DEFAULT_DEVICE_PORT = 80;
constexpr const char* STATUS_PATH = "/api/v0/fan/status";
constexpr const char* SET_SPEED_PATH = "/api/v0/fan/0/set";
constexpr ms DEFAULT_REQUEST_TIMEOUT_MS = ms(3000);
constexpr std::size_t DEFAULT_HTTP_POOL_CAPACITY = 2;

// speed
constexpr int MIN_SPEED_PERCENT = 0;
constexpr int MAX_SPEED_PERCENT = 100;
constexpr int DEFAULT_RESUME_SPEED_PERCENT = 50;

// Poller 기본 간격 (popup 표시 중 / 백그라운드)
constexpr ms DEFAULT_ACTIVE_POLL_INTERVAL_MS = ms(500);
constexpr ms DEFAULT_IDLE_POLL_INTERVAL_MS = ms(10000);
constexpr ms POLLER_TICK_MS = ms(50);

// CommandDispatcher debounce
constexpr ms DEFAULT_DEBOUNCE_MS = ms(500);

// worker pool sizes
constexpr std::size_t DEFAULT_DISCOVERY_WORKERS = 2;
constexpr std::size_t DEFAULT_POLL_WORKERS = 4;
constexpr std::size_t DEFAULT_COMMAND_WORKERS = 2;

} // namespace openfan::config
