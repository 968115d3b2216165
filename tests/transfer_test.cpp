#include "request_dispatcher.h"
#include "request_handlers.h"
#include "socket_util.h"
#include "task_pool.h"
#include "tcp_control.h"
#include "transfer_engine.h"
#include "udp_socket.h"
#include "wire_codec.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace netspeed;

namespace {

// Client side flag for transfers that are never interrupted
const std::atomic<bool> client_running{true};

TransferOptions fast_options() {
    TransferOptions options;
    options.udp_timeout_ms = 1000;
    options.tcp_timeout_ms = 2000;
    options.tcp_connect_timeout_ms = 2000;
    return options;
}

// Accepts one connection on listener and runs handler on it
template <typename Handler>
std::future<uint64_t> serve_one(TCPListener& listener, Handler handler) {
    return std::async(std::launch::async, [&listener, handler]() -> uint64_t {
        if (wait_readable(listener.fd(), 5000) != WaitResult::READY) {
            return 0;
        }
        sockaddr_in peer;
        TCPStream stream = listener.accept_connection(peer);
        if (!stream.is_connected()) {
            return 0;
        }
        return handler(std::move(stream), peer);
    });
}

template <typename Predicate>
bool eventually(Predicate done) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
        if (done()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return done();
}

// Dispatcher on ephemeral loopback ports, run on its own thread
class DispatcherFixture : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_unique<TaskPool>(4, 16);
        start_dispatcher(*pool_);
    }

    void start_dispatcher(TaskPool& pool) {
        dispatcher_ = std::make_unique<RequestDispatcher>(pool, handler_, running_);
        ASSERT_TRUE(dispatcher_->bind_udp(0));
        ASSERT_TRUE(dispatcher_->bind_tcp(0));
        thread_ = std::thread([this] { dispatcher_->run(50); });
    }

    void TearDown() override {
        running_.store(false);
        if (thread_.joinable()) thread_.join();
        if (pool_) pool_->shutdown();
        dispatcher_.reset();
    }

    HandlerOptions handler_;
    std::atomic<bool> running_{true};
    std::unique_ptr<TaskPool> pool_;
    std::unique_ptr<RequestDispatcher> dispatcher_;
    std::thread thread_;
};

} // namespace

TEST(PacingTest, DelayIsCappedAndScaled) {
    HandlerOptions options;
    EXPECT_EQ(pacing_delay(100ull * 1024 * 1024, options).count(), 1000);
    EXPECT_EQ(pacing_delay(1ull << 40, options).count(), 1000);
    EXPECT_EQ(pacing_delay(1048576, options).count(), 1000);
    EXPECT_EQ(pacing_delay(0, options).count(), 0);

    options.pacing_scale_bytes = 1000000;
    EXPECT_EQ(pacing_delay(500, options).count(), 500);
    EXPECT_EQ(pacing_delay(5000, options).count(), 1000);

    options.pacing_scale_bytes = 0;
    EXPECT_EQ(pacing_delay(1, options).count(), 1000);
}

TEST(TcpTransferTest, ReceivesExactlyRequestedBytes) {
    TCPListener listener;
    ASSERT_TRUE(listener.start_listening(0, 4));

    std::atomic<bool> running{true};
    HandlerOptions handler;
    auto served = serve_one(listener, [&](TCPStream stream, const sockaddr_in& peer) {
        return serve_tcp_connection(std::move(stream), peer, handler, running);
    });

    TransferRecord record = run_tcp_transfer("127.0.0.1", listener.get_listen_port(), 200000, 1,
                                             fast_options(), client_running);
    EXPECT_EQ(served.get(), 200000u);

    EXPECT_EQ(record.protocol, Protocol::TCP);
    EXPECT_EQ(record.transfer_num, 1u);
    EXPECT_EQ(record.outcome, TransferOutcome::COMPLETE);
    EXPECT_EQ(record.bytes_requested, 200000u);
    EXPECT_EQ(record.bytes_received, 200000u);
    EXPECT_GT(record.duration_sec, 0.0);
    EXPECT_DOUBLE_EQ(record.speed_bps(), 200000.0 * 8.0 / record.duration_sec);
}

TEST(TcpTransferTest, EarlyCloseIsPartial) {
    TCPListener listener;
    ASSERT_TRUE(listener.start_listening(0, 4));

    auto served = serve_one(listener, [](TCPStream stream, const sockaddr_in&) -> uint64_t {
        std::string line;
        if (!stream.read_line(line, 32, 2000)) return 0;
        std::vector<uint8_t> some(100, 'X');
        stream.send_all(some.data(), some.size());
        stream.disconnect();
        return some.size();
    });

    TransferRecord record = run_tcp_transfer("127.0.0.1", listener.get_listen_port(), 5000, 2,
                                             fast_options(), client_running);
    EXPECT_EQ(served.get(), 100u);
    EXPECT_EQ(record.outcome, TransferOutcome::PARTIAL);
    EXPECT_EQ(record.bytes_received, 100u);
    EXPECT_TRUE(record.has_timing());
}

TEST(TcpTransferTest, StalledServerTimesOut) {
    TCPListener listener;
    ASSERT_TRUE(listener.start_listening(0, 4));

    std::promise<void> finished;
    auto client_done = finished.get_future().share();
    auto served = serve_one(listener, [client_done](TCPStream stream, const sockaddr_in&) -> uint64_t {
        std::string line;
        stream.read_line(line, 32, 2000);
        // Hold the connection open without sending anything
        client_done.wait_for(std::chrono::seconds(5));
        return 0;
    });

    TransferOptions options = fast_options();
    options.tcp_timeout_ms = 200;
    TransferRecord record = run_tcp_transfer("127.0.0.1", listener.get_listen_port(), 5000, 1, options,
                                             client_running);
    finished.set_value();
    served.get();

    EXPECT_EQ(record.outcome, TransferOutcome::TIMEOUT);
    EXPECT_EQ(record.bytes_received, 0u);
}

TEST(TcpTransferTest, ConnectFailureIsFailed) {
    uint16_t closed_port;
    {
        TCPListener listener;
        ASSERT_TRUE(listener.start_listening(0, 1));
        closed_port = listener.get_listen_port();
    }

    TransferRecord record = run_tcp_transfer("127.0.0.1", closed_port, 1000, 1, fast_options(), client_running);
    EXPECT_EQ(record.outcome, TransferOutcome::FAILED);
    EXPECT_FALSE(record.has_timing());
}

TEST(TcpTransferTest, InterruptedBeforeAnyDataIsNoData) {
    TCPListener listener;
    ASSERT_TRUE(listener.start_listening(0, 4));

    std::promise<void> finished;
    auto client_done = finished.get_future().share();
    auto served = serve_one(listener, [client_done](TCPStream stream, const sockaddr_in&) -> uint64_t {
        std::string line;
        stream.read_line(line, 32, 2000);
        client_done.wait_for(std::chrono::seconds(10));
        return 0;
    });

    TransferOptions options = fast_options();
    options.tcp_timeout_ms = 5000;
    std::atomic<bool> running{true};
    std::thread stopper([&running] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        running.store(false);
    });

    auto start = std::chrono::steady_clock::now();
    TransferRecord record = run_tcp_transfer("127.0.0.1", listener.get_listen_port(), 5000, 1,
                                             options, running);
    auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();
    finished.set_value();
    served.get();

    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_EQ(record.outcome, TransferOutcome::NO_DATA);
    EXPECT_EQ(record.bytes_received, 0u);
    EXPECT_FALSE(record.has_timing());
}

TEST(TcpTransferTest, InterruptedAfterSomeDataIsPartial) {
    TCPListener listener;
    ASSERT_TRUE(listener.start_listening(0, 4));

    std::promise<void> finished;
    auto client_done = finished.get_future().share();
    auto served = serve_one(listener, [client_done](TCPStream stream, const sockaddr_in&) -> uint64_t {
        std::string line;
        if (!stream.read_line(line, 32, 2000)) return 0;
        std::vector<uint8_t> some(300, 'X');
        stream.send_all(some.data(), some.size());
        client_done.wait_for(std::chrono::seconds(10));
        return some.size();
    });

    TransferOptions options = fast_options();
    options.tcp_timeout_ms = 5000;
    std::atomic<bool> running{true};
    std::thread stopper([&running] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        running.store(false);
    });

    auto start = std::chrono::steady_clock::now();
    TransferRecord record = run_tcp_transfer("127.0.0.1", listener.get_listen_port(), 5000, 1,
                                             options, running);
    auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();
    finished.set_value();
    EXPECT_EQ(served.get(), 300u);

    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_EQ(record.outcome, TransferOutcome::PARTIAL);
    EXPECT_EQ(record.bytes_received, 300u);
    EXPECT_TRUE(record.has_timing());
}

TEST(TcpHandlerTest, SilentClientIsReleasedWhenRunningDrops) {
    TCPListener listener;
    ASSERT_TRUE(listener.start_listening(0, 4));

    std::atomic<bool> running{true};
    HandlerOptions handler;
    handler.tcp_timeout_ms = 5000;
    auto served = serve_one(listener, [&](TCPStream stream, const sockaddr_in& peer) {
        return serve_tcp_connection(std::move(stream), peer, handler, running);
    });

    TCPStream client;
    ASSERT_TRUE(client.connect_to_server("127.0.0.1", listener.get_listen_port(), 2000));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    running.store(false);

    ASSERT_EQ(served.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    EXPECT_EQ(served.get(), 0u);
}

TEST(TcpHandlerTest, InvalidRequestLineSendsNothing) {
    TCPListener listener;
    ASSERT_TRUE(listener.start_listening(0, 4));

    std::atomic<bool> running{true};
    HandlerOptions handler;
    auto served = serve_one(listener, [&](TCPStream stream, const sockaddr_in& peer) {
        return serve_tcp_connection(std::move(stream), peer, handler, running);
    });

    TCPStream client;
    ASSERT_TRUE(client.connect_to_server("127.0.0.1", listener.get_listen_port(), 2000));
    std::string garbage = "lots of bytes\n";
    ASSERT_TRUE(client.send_all(garbage.data(), garbage.size()));
    EXPECT_EQ(served.get(), 0u);
}

TEST_F(DispatcherFixture, UdpTransferOfSmallFileCompletes) {
    TransferRecord record = run_udp_transfer("127.0.0.1", dispatcher_->udp_port(), 16 * 1024, 1,
                                             fast_options(), client_running);
    EXPECT_EQ(record.protocol, Protocol::UDP);
    EXPECT_EQ(record.outcome, TransferOutcome::COMPLETE);
    EXPECT_EQ(record.segments_total, 16u);
    EXPECT_EQ(record.segments_received, 16u);
    EXPECT_EQ(record.segments_lost(), 0u);
    EXPECT_DOUBLE_EQ(record.loss_rate(), 0.0);
    EXPECT_EQ(dispatcher_->udp_requests(), 1u);
}

TEST_F(DispatcherFixture, UdpTransferStopsWhenRunningDrops) {
    // 8192 segments paced at 1 ms each would take over 8 s
    std::atomic<bool> running{true};
    std::thread stopper([&running] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        running.store(false);
    });

    auto start = std::chrono::steady_clock::now();
    TransferRecord record = run_udp_transfer("127.0.0.1", dispatcher_->udp_port(), 8 * 1048576, 1,
                                             fast_options(), running);
    auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_EQ(record.outcome, TransferOutcome::PARTIAL);
    EXPECT_EQ(record.segments_total, 8192u);
    EXPECT_GT(record.segments_received, 0u);
    EXPECT_LT(record.segments_received, record.segments_total);
}

TEST_F(DispatcherFixture, UdpTransferLossRateIsInRange) {
    TransferRecord record = run_udp_transfer("127.0.0.1", dispatcher_->udp_port(), 1048576, 1,
                                             fast_options(), client_running);
    ASSERT_NE(record.outcome, TransferOutcome::NO_DATA);
    ASSERT_NE(record.outcome, TransferOutcome::FAILED);
    EXPECT_EQ(record.segments_total, 1024u);
    EXPECT_LE(record.segments_received, record.segments_total);
    EXPECT_GE(record.loss_rate(), 0.0);
    EXPECT_LE(record.loss_rate(), 1.0);
    EXPECT_GT(record.duration_sec, 0.0);
}

TEST_F(DispatcherFixture, EmptyUdpFileCompletesImmediately) {
    auto start = std::chrono::steady_clock::now();
    TransferRecord record = run_udp_transfer("127.0.0.1", dispatcher_->udp_port(), 0, 1,
                                             fast_options(), client_running);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));

    EXPECT_EQ(record.outcome, TransferOutcome::COMPLETE);
    EXPECT_EQ(record.segments_total, 0u);
    EXPECT_EQ(record.segments_received, 0u);
    EXPECT_EQ(record.segments_lost(), 0u);
    EXPECT_DOUBLE_EQ(record.loss_rate(), 0.0);
}

TEST_F(DispatcherFixture, TcpTransferThroughDispatcher) {
    TransferRecord record = run_tcp_transfer("127.0.0.1", dispatcher_->tcp_port(), 200000, 1,
                                             fast_options(), client_running);
    EXPECT_EQ(record.outcome, TransferOutcome::COMPLETE);
    EXPECT_EQ(record.bytes_received, 200000u);
    EXPECT_GT(record.duration_sec, 0.0);
    EXPECT_EQ(dispatcher_->tcp_connections(), 1u);
}

TEST_F(DispatcherFixture, InvalidUdpRequestIsDiscarded) {
    UDPSocket sender;
    ASSERT_TRUE(sender.open());
    sockaddr_in dest;
    ASSERT_TRUE(make_address("127.0.0.1", dispatcher_->udp_port(), dest));

    auto request = wire::encode_udp_request(1024);
    request[0] = 0x00;
    ASSERT_EQ(sender.send_to(request.data(), request.size(), dest), 13);
    uint8_t short_datagram[8] = {0xAB, 0xCD, 0xDC, 0xBA, 0x03, 0, 0, 0};
    ASSERT_EQ(sender.send_to(short_datagram, sizeof(short_datagram), dest), 8);

    EXPECT_TRUE(eventually([this] { return dispatcher_->invalid_datagrams() == 2; }));
    EXPECT_EQ(dispatcher_->udp_requests(), 0u);
}

TEST_F(DispatcherFixture, ConcurrentMixedTransfers) {
    RoundRequest request;
    request.file_size = 64 * 1024;
    request.tcp_connections = 3;
    request.udp_connections = 2;
    DiscoveredServer server;
    server.ip = "127.0.0.1";
    server.udp_port = dispatcher_->udp_port();
    server.tcp_port = dispatcher_->tcp_port();

    auto records = run_round(server, request, fast_options(), client_running);
    ASSERT_EQ(records.size(), 5u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(records[i].protocol, Protocol::TCP);
        EXPECT_EQ(records[i].transfer_num, i + 1);
        EXPECT_EQ(records[i].bytes_received, 64u * 1024);
    }
    for (size_t i = 3; i < 5; ++i) {
        EXPECT_EQ(records[i].protocol, Protocol::UDP);
        EXPECT_EQ(records[i].transfer_num, i - 2);
        EXPECT_EQ(records[i].segments_total, 64u);
    }
}

TEST_F(DispatcherFixture, RoundStopsWhenRunningDrops) {
    RoundRequest request;
    request.file_size = 8 * 1048576;
    request.tcp_connections = 1;
    request.udp_connections = 2;
    DiscoveredServer server;
    server.ip = "127.0.0.1";
    server.udp_port = dispatcher_->udp_port();
    server.tcp_port = dispatcher_->tcp_port();

    std::atomic<bool> running{true};
    std::thread stopper([&running] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        running.store(false);
    });

    auto start = std::chrono::steady_clock::now();
    auto records = run_round(server, request, fast_options(), running);
    auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    EXPECT_LT(elapsed, std::chrono::seconds(3));
    ASSERT_EQ(records.size(), 3u);
    for (size_t i = 1; i < 3; ++i) {
        EXPECT_EQ(records[i].protocol, Protocol::UDP);
        EXPECT_EQ(records[i].outcome, TransferOutcome::PARTIAL);
    }
}

TEST(UdpTransferTest, DuplicateAndReorderedSegmentsCountOnce) {
    UDPSocket server;
    ASSERT_TRUE(server.open());
    ASSERT_TRUE(server.bind_socket(0, false));

    // Answers the request with segments 1, 0, 0, 1, two malformed ones, then 2
    auto served = std::async(std::launch::async, [&server]() -> bool {
        if (wait_readable(server.fd(), 5000) != WaitResult::READY) return false;
        uint8_t buffer[64];
        sockaddr_in client;
        ssize_t n = server.recv_from(buffer, sizeof(buffer), client);
        if (n != static_cast<ssize_t>(wire::UDP_REQUEST_SIZE)) return false;

        const uint8_t payload[wire::SEGMENT_SIZE] = {};
        const uint64_t order[][2] = {{3, 1}, {3, 0}, {3, 0}, {3, 1}, {3, 7}, {5, 2}, {3, 2}};
        for (const auto& seg : order) {
            auto datagram = wire::encode_udp_payload(seg[0], seg[1], payload, sizeof(payload));
            if (server.send_to(datagram.data(), datagram.size(), client)
                    != static_cast<ssize_t>(datagram.size())) {
                return false;
            }
        }
        return true;
    });

    TransferRecord record = run_udp_transfer("127.0.0.1", server.local_port(), 3 * 1024, 1,
                                             fast_options(), client_running);
    EXPECT_TRUE(served.get());

    EXPECT_EQ(record.outcome, TransferOutcome::COMPLETE);
    EXPECT_EQ(record.segments_total, 3u);
    EXPECT_EQ(record.segments_received, 3u);
    EXPECT_EQ(record.duplicate_segments, 2u);
    EXPECT_EQ(record.segments_lost(), 0u);
}

TEST(DispatcherBackpressureTest, RejectedConnectionIsClosed) {
    std::atomic<bool> running{true};
    HandlerOptions handler;
    TaskPool pool(1, 0);
    RequestDispatcher dispatcher(pool, handler, running);
    ASSERT_TRUE(dispatcher.bind_udp(0));
    ASSERT_TRUE(dispatcher.bind_tcp(0));
    std::thread loop([&dispatcher] { dispatcher.run(50); });

    TransferRecord record = run_tcp_transfer("127.0.0.1", dispatcher.tcp_port(), 100000, 1,
                                             fast_options(), client_running);
    EXPECT_TRUE(record.outcome == TransferOutcome::PARTIAL || record.outcome == TransferOutcome::FAILED);
    EXPECT_EQ(record.bytes_received, 0u);
    EXPECT_TRUE(eventually([&dispatcher] { return dispatcher.rejected_tasks() == 1; }));

    running.store(false);
    loop.join();
    pool.shutdown();
}

TEST(DispatcherBackpressureTest, LoopStopsWhenRunningDrops) {
    std::atomic<bool> running{true};
    HandlerOptions handler;
    TaskPool pool(1, 4);
    RequestDispatcher dispatcher(pool, handler, running);
    ASSERT_TRUE(dispatcher.bind_udp(0));
    ASSERT_TRUE(dispatcher.bind_tcp(0));

    auto done = std::async(std::launch::async, [&dispatcher] { dispatcher.run(50); });
    running.store(false);
    EXPECT_EQ(done.wait_for(std::chrono::seconds(2)), std::future_status::ready);
}
