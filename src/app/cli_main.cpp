// src/app/cli_main.cpp
#include <iostream>
#include <string>
#include <sstream>
#include <vector>
#include <atomic>
#include <csignal>
#include <chrono>
#include <iomanip>
#include <optional>

#include <sys/select.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "common/ThreadSafeQueue.h"
#include "controller/FanManager.hpp"
#include "protocol/CommandBuilder.hpp"

using namespace std::chrono_literals;
using namespace openfan::controller;

static std::atomic<bool> g_stop{false};

void sigint_handler(int /*signum*/) {
    // 시그널 핸들러에서는 안전한 동작(atomic flag 설정)만 수행
    g_stop.store(true);
}

static std::vector<std::string> split_ws(const std::string& s) {
    std::istringstream iss(s);
    std::vector<std::string> out;
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

static std::optional<long> parse_number(const std::string& s) {
    try {
        size_t used = 0;
        long v = std::stol(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --active-interval <ms>   poll interval while shown (default "
              << openfan::config::DEFAULT_ACTIVE_POLL_INTERVAL_MS.count() << ")\n"
              << "  --idle-interval <ms>     keep-alive poll interval while hidden (default "
              << openfan::config::DEFAULT_IDLE_POLL_INTERVAL_MS.count() << ")\n"
              << "  --debounce <ms>          command debounce delay (default "
              << openfan::config::DEFAULT_DEBOUNCE_MS.count() << ")\n"
              << "  --log-level <lvl>        trace|debug|info|warn|error|off (default info)\n"
              << "  --help                   show this help\n";
}

static void print_help() {
    std::cout << "Commands:\n"
              << "  help                        : show this help\n"
              << "  list                        : list discovered fans\n"
              << "  speed <serial> <0-100>      : set fan speed (debounced)\n"
              << "  on <serial>                 : power on (restores last speed)\n"
              << "  off <serial>                : power off\n"
              << "  toggle <serial>             : toggle power\n"
              << "  all <0-100>                 : set every fan to the same speed\n"
              << "  refresh                     : restart discovery\n"
              << "  poll                        : poll every fan now\n"
              << "  show / hide                 : active (fast) or idle (slow) polling\n"
              << "  quit                        : exit CLI\n";
}

static void print_devices(const FanManager& manager) {
    auto devices = manager.devices();
    if (devices.empty()) {
        std::cout << "[CLI] no fans found\n";
        return;
    }
    std::cout << "Fans (" << devices.size() << "):\n";
    for (const auto& d : devices) {
        auto st = d->state();
        std::cout << "  " << std::left << std::setw(12) << d->serial()
                  << " " << std::setw(12) << d->name()
                  << " " << std::setw(21) << (d->address() + ":" + std::to_string(d->port()))
                  << (st.isOn ? " ON " : " OFF")
                  << " speed=" << std::right << std::setw(3) << st.speedPercent << "%"
                  << " rpm=" << st.rpm << "\n";
    }
}

static std::string describe(const DeviceEvent& ev) {
    std::ostringstream os;
    os << "[" << toString(ev.type) << "] " << ev.serial;
    if (ev.device && ev.type != DeviceEvent::Type::DeviceLost) {
        auto st = ev.device->state();
        os << " (" << ev.device->name() << ") " << (st.isOn ? "ON" : "OFF")
           << " speed=" << st.speedPercent << "% rpm=" << st.rpm;
    }
    return os.str();
}

int main(int argc, char** argv) {
    ManagerOptions options;
    std::string logLevel = "info";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (i + 1 >= argc) {
            std::cerr << "[CLI] missing value for " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
        std::string value = argv[++i];
        if (arg == "--log-level") {
            logLevel = value;
            continue;
        }
        auto n = parse_number(value);
        if (!n || *n <= 0) {
            std::cerr << "[CLI] invalid value for " << arg << ": " << value << "\n";
            return 2;
        }
        if (arg == "--active-interval") options.activeInterval = std::chrono::milliseconds(*n);
        else if (arg == "--idle-interval") options.idleInterval = std::chrono::milliseconds(*n);
        else if (arg == "--debounce") options.debounce = std::chrono::milliseconds(*n);
        else {
            std::cerr << "[CLI] unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    auto level = spdlog::level::from_str(logLevel);
    if (level == spdlog::level::off && logLevel != "off") {
        std::cerr << "[CLI] unknown log level: " << logLevel << "\n";
        return 2;
    }
    spdlog::set_level(level);

    // install SIGINT handler for graceful shutdown (handler only sets flag)
    std::signal(SIGINT, sigint_handler);

    FanManager manager(options);

    // registry events arrive on worker threads; only the main thread prints
    openfan::common::ThreadSafeQueue<std::string> events;
    auto subId = manager.subscribe([&events](const DeviceEvent& ev) { events.push(describe(ev)); });

    try {
        manager.start();
    } catch (const std::exception& e) {
        std::cerr << "[CLI] failed to start: " << e.what() << "\n";
        manager.unsubscribe(subId);
        return 1;
    }

    std::cout << "openfan-controller CLI\n";
    std::cout << "Type 'help' for commands.\n> " << std::flush;

    // Main interactive loop using select() so we can wake periodically and check g_stop
    const int STDIN_FD = fileno(stdin);
    std::string line;
    while (!g_stop.load()) {
        bool printed = false;
        while (auto msg = events.try_pop(0ms)) {
            std::cout << "\n" << *msg;
            printed = true;
        }
        if (printed) std::cout << "\n> " << std::flush;

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(STDIN_FD, &readfds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 200000; // 200 ms

        int rv = select(STDIN_FD + 1, &readfds, NULL, NULL, &tv);
        if (rv <= 0 || !FD_ISSET(STDIN_FD, &readfds)) continue;

        if (!std::getline(std::cin, line)) {
            // EOF or error -> exit loop
            break;
        }
        auto toks = split_ws(line);
        if (toks.empty()) {
            std::cout << "> " << std::flush;
            continue;
        }

        const std::string& cmd = toks[0];
        if (cmd == "help") {
            print_help();
        } else if (cmd == "list") {
            print_devices(manager);
        } else if (cmd == "speed") {
            std::optional<long> v = toks.size() >= 3 ? parse_number(toks[2]) : std::nullopt;
            if (!v) {
                std::cerr << "[CLI] usage: speed <serial> <0-100>\n";
            } else if (!manager.setSpeed(toks[1], openfan::protocol::clampSpeed(*v))) {
                std::cerr << "[CLI] unknown fan: " << toks[1] << "\n";
            }
        } else if (cmd == "on" || cmd == "off") {
            if (toks.size() < 2) {
                std::cerr << "[CLI] usage: " << cmd << " <serial>\n";
            } else if (!manager.setPower(toks[1], cmd == "on")) {
                std::cerr << "[CLI] unknown fan: " << toks[1] << "\n";
            }
        } else if (cmd == "toggle") {
            if (toks.size() < 2) {
                std::cerr << "[CLI] usage: toggle <serial>\n";
            } else if (!manager.toggle(toks[1])) {
                std::cerr << "[CLI] unknown fan: " << toks[1] << "\n";
            }
        } else if (cmd == "all") {
            std::optional<long> v = toks.size() >= 2 ? parse_number(toks[1]) : std::nullopt;
            if (!v) {
                std::cerr << "[CLI] usage: all <0-100>\n";
            } else {
                auto n = manager.setAllSpeed(openfan::protocol::clampSpeed(*v));
                std::cout << "[CLI] preset " << *v << "% sent to " << n << " fan(s)\n";
            }
        } else if (cmd == "refresh") {
            try {
                manager.refreshDiscovery();
                std::cout << "[CLI] discovery restarted\n";
            } catch (const std::exception& e) {
                std::cerr << "[CLI] refresh failed: " << e.what() << "\n";
            }
        } else if (cmd == "poll") {
            manager.pollNow();
        } else if (cmd == "show") {
            manager.setVisible(true);
            std::cout << "[CLI] active polling\n";
        } else if (cmd == "hide") {
            manager.setVisible(false);
            std::cout << "[CLI] idle polling\n";
        } else if (cmd == "quit" || cmd == "exit") {
            std::cout << "[CLI] quitting...\n";
            break;
        } else {
            std::cerr << "[CLI] unknown command: " << cmd << " (type 'help')\n";
        }
        std::cout << "> " << std::flush;
    } // main loop

    // let debounced commands reach the fans before tearing down
    if (!manager.waitIdle(options.debounce + openfan::config::DEFAULT_REQUEST_TIMEOUT_MS)) {
        std::cerr << "[CLI] some commands did not finish before exit\n";
    }
    manager.unsubscribe(subId);
    manager.stop();
    events.close();
    std::cout << "[CLI] exited\n";
    return 0;
}
