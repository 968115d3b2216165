#pragma once

#include "speedtest_types.h"
#include <type_traits>
#include <variant>

namespace netspeed {

// Client lifecycle: STARTUP -> LOOKING_FOR_SERVER -> SPEED_TEST -> LOOKING_FOR_SERVER
namespace state {

struct Startup {};

struct LookingForServer {
    RoundRequest request;
};

struct SpeedTest {
    RoundRequest request;
    DiscoveredServer server;
};

} // namespace state

using ClientState = std::variant<state::Startup, state::LookingForServer, state::SpeedTest>;

// Start (or restart) a search for the given round. Not allowed mid-test.
inline ClientState begin_search(const ClientState& current, const RoundRequest& request) {
    if (std::holds_alternative<state::SpeedTest>(current)) {
        return current;
    }
    return state::LookingForServer{request};
}

// Only a listener that is looking takes an offer; everything else ignores it
inline ClientState accept_offer(const ClientState& current, const DiscoveredServer& server) {
    if (const auto* looking = std::get_if<state::LookingForServer>(&current)) {
        return state::SpeedTest{looking->request, server};
    }
    return current;
}

inline ClientState finish_round(const ClientState& current) {
    if (const auto* test = std::get_if<state::SpeedTest>(&current)) {
        return state::LookingForServer{test->request};
    }
    return current;
}

inline const char* state_name(const ClientState& current) {
    return std::visit([](const auto& s) -> const char* {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, state::Startup>) {
            return "STARTUP";
        } else if constexpr (std::is_same_v<T, state::LookingForServer>) {
            return "LOOKING_FOR_SERVER";
        } else {
            return "SPEED_TEST";
        }
    }, current);
}

} // namespace netspeed
