#include "client_state.h"
#include <gtest/gtest.h>
#include <string>

using namespace netspeed;

namespace {

RoundRequest sample_request() {
    RoundRequest request;
    request.file_size = 1048576;
    request.tcp_connections = 2;
    request.udp_connections = 2;
    return request;
}

DiscoveredServer sample_server() {
    DiscoveredServer server;
    server.ip = "10.0.0.5";
    server.udp_port = 30000;
    server.tcp_port = 30001;
    return server;
}

} // namespace

TEST(ClientStateTest, FullCycle) {
    ClientState s = state::Startup{};
    EXPECT_STREQ(state_name(s), "STARTUP");

    s = begin_search(s, sample_request());
    EXPECT_STREQ(state_name(s), "LOOKING_FOR_SERVER");

    s = accept_offer(s, sample_server());
    ASSERT_STREQ(state_name(s), "SPEED_TEST");
    const auto& test = std::get<state::SpeedTest>(s);
    EXPECT_EQ(test.server.ip, "10.0.0.5");
    EXPECT_EQ(test.server.tcp_port, 30001);
    EXPECT_EQ(test.request.tcp_connections, 2u);

    s = finish_round(s);
    EXPECT_STREQ(state_name(s), "LOOKING_FOR_SERVER");
    EXPECT_EQ(std::get<state::LookingForServer>(s).request.file_size, 1048576u);
}

TEST(ClientStateTest, OfferIgnoredOutsideLooking) {
    ClientState s = state::Startup{};
    s = accept_offer(s, sample_server());
    EXPECT_STREQ(state_name(s), "STARTUP");

    s = begin_search(s, sample_request());
    s = accept_offer(s, sample_server());

    DiscoveredServer other = sample_server();
    other.ip = "10.0.0.9";
    s = accept_offer(s, other);
    ASSERT_TRUE(std::holds_alternative<state::SpeedTest>(s));
    EXPECT_EQ(std::get<state::SpeedTest>(s).server.ip, "10.0.0.5");
}

TEST(ClientStateTest, SearchCannotInterruptSpeedTest) {
    ClientState s = begin_search(state::Startup{}, sample_request());
    s = accept_offer(s, sample_server());

    RoundRequest other = sample_request();
    other.file_size = 1;
    s = begin_search(s, other);
    ASSERT_TRUE(std::holds_alternative<state::SpeedTest>(s));
    EXPECT_EQ(std::get<state::SpeedTest>(s).request.file_size, 1048576u);
}

TEST(ClientStateTest, FinishOnlyLeavesSpeedTest) {
    ClientState s = begin_search(state::Startup{}, sample_request());
    s = finish_round(s);
    EXPECT_STREQ(state_name(s), "LOOKING_FOR_SERVER");
}
