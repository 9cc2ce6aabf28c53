#include "onyxnet/ws_relay.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "onyxnet/config.hpp"
#include "onyxnet/errors.hpp"
#include "onyxnet/ws_client.hpp"

namespace {

namespace asio = websocketpp::lib::asio;
using tcp = asio::ip::tcp;

constexpr std::chrono::seconds WAIT_LIMIT{5};

bool eventually(const std::function<bool()>& condition) {
    const auto deadline = std::chrono::steady_clock::now() + WAIT_LIMIT;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

// Frames delivered on the client thread, read from the test thread.
class Inbox {
public:
    void push(const std::string& frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            frames_.push_back(frame);
        }
        ready_.notify_all();
    }

    std::optional<std::string> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!ready_.wait_for(lock, WAIT_LIMIT, [this]() { return !frames_.empty(); })) {
            return std::nullopt;
        }
        std::string frame = frames_.front();
        frames_.pop_front();
        return frame;
    }

private:
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::string> frames_;
};

// Blocking newline-delimited JSON client.
class LineClient {
public:
    explicit LineClient(uint16_t port) : socket_(io_) {
        socket_.connect(tcp::endpoint(asio::ip::address_v4::loopback(), port));
    }

    void send_line(const std::string& frame) {
        asio::write(socket_, asio::buffer(frame + "\n"));
    }

    std::string read_line() {
        size_t length = asio::read_until(socket_, input_, '\n');
        auto begin = asio::buffers_begin(input_.data());
        std::string line(begin, begin + static_cast<std::ptrdiff_t>(length));
        input_.consume(length);
        return line;
    }

private:
    asio::io_service io_;
    tcp::socket socket_;
    asio::streambuf input_;
};

uint16_t unused_port() {
    asio::io_service io;
    tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    return acceptor.local_endpoint().port();
}

// Starts a relay on a free pair of ports. @p port receives the line port.
std::unique_ptr<OnyxNet::net::WsRelayServer> start_relay(uint16_t& port) {
    for (int attempt = 0; attempt < 20; ++attempt) {
        port = unused_port();
        if (port == UINT16_MAX) {
            continue;
        }
        auto relay = std::make_unique<OnyxNet::net::WsRelayServer>();
        try {
            relay->run("127.0.0.1", port);
            return relay;
        } catch (const OnyxNet::RuntimeError&) {
            // Port + 1 was taken; try another pair.
        }
    }
    return nullptr;
}

std::string ws_uri(uint16_t port) {
    OnyxNet::EndpointConfig endpoint;
    endpoint.host = "127.0.0.1";
    endpoint.port = port;
    return endpoint.uri();
}

} // namespace

TEST(RelayTest, LineClientsReceiveEveryFrameIncludingTheirOwn) {
    uint16_t port = 0;
    auto relay = start_relay(port);
    ASSERT_NE(relay, nullptr);

    LineClient alice(port);
    LineClient bob(port);
    ASSERT_TRUE(eventually([&]() { return relay->connection_count() == 2; }));

    alice.send_line(R"({"type":"handshake","sender_id":"a","pubkey":"k"})");

    EXPECT_EQ(bob.read_line(), "{\"type\":\"handshake\",\"sender_id\":\"a\",\"pubkey\":\"k\"}\n");
    EXPECT_EQ(alice.read_line(), "{\"type\":\"handshake\",\"sender_id\":\"a\",\"pubkey\":\"k\"}\n");
}

TEST(RelayTest, WebSocketAndLineClientsAreBridged) {
    uint16_t port = 0;
    auto relay = start_relay(port);
    ASSERT_NE(relay, nullptr);

    LineClient line(port);

    Inbox inbox;
    std::atomic<bool> opened{false};
    OnyxNet::net::WsClientWrapper ws;
    ws.set_on_open_callback([&opened]() { opened = true; });
    ws.set_on_text_callback([&inbox](const std::string& text) { inbox.push(text); });

    // The WebSocket listener sits one port above the line listener.
    ws.connect(ws_uri(port));
    ASSERT_TRUE(eventually([&]() { return opened.load(); }));
    ASSERT_TRUE(eventually([&]() { return relay->connection_count() == 2; }));

    // 1. Line to WebSocket: the newline is framing, not payload.
    line.send_line("from-line");
    auto received = inbox.pop();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, "from-line");
    EXPECT_EQ(line.read_line(), "from-line\n");

    // 2. WebSocket to line: one text frame becomes one line.
    ws.send_text("from-ws");
    EXPECT_EQ(line.read_line(), "from-ws\n");
    auto echoed = inbox.pop();
    ASSERT_TRUE(echoed.has_value());
    EXPECT_EQ(*echoed, "from-ws");

    ws.disconnect();
}

TEST(RelayTest, ListenFailureIsReportedToCaller) {
    asio::io_service io;
    tcp::acceptor occupied(io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    const uint16_t busy = occupied.local_endpoint().port();

    OnyxNet::net::WsRelayServer line_port_taken;
    EXPECT_THROW(line_port_taken.run("127.0.0.1", busy), OnyxNet::RuntimeError);
    EXPECT_EQ(line_port_taken.connection_count(), 0u);

    // Whichever of the two listeners fails, the caller hears about it.
    if (busy > 1) {
        OnyxNet::net::WsRelayServer ws_port_taken;
        EXPECT_THROW(ws_port_taken.run("127.0.0.1", static_cast<uint16_t>(busy - 1)), OnyxNet::RuntimeError);
    }

    OnyxNet::net::WsRelayServer no_room;
    EXPECT_THROW(no_room.run("127.0.0.1", UINT16_MAX), OnyxNet::InvalidArgument);
}

TEST(RelayTest, ClientDisconnectCompletesCloseHandshake) {
    uint16_t port = 0;
    auto relay = start_relay(port);
    ASSERT_NE(relay, nullptr);

    std::atomic<bool> opened{false};
    std::atomic<bool> closed{false};
    OnyxNet::net::WsClientWrapper ws;
    ws.set_on_open_callback([&opened]() { opened = true; });
    ws.set_on_disconnect_callback([&closed]() { closed = true; });

    ws.connect(ws_uri(port));
    ASSERT_TRUE(eventually([&]() { return opened.load(); }));
    ASSERT_TRUE(eventually([&]() { return relay->connection_count() == 1; }));

    ws.disconnect();

    // The close callback only fires once the relay has answered the close frame.
    EXPECT_TRUE(closed);
    EXPECT_FALSE(ws.is_open());
    EXPECT_TRUE(eventually([&]() { return relay->connection_count() == 0; }));
}

TEST(RelayTest, StopClosesEveryClient) {
    uint16_t port = 0;
    auto relay = start_relay(port);
    ASSERT_NE(relay, nullptr);

    LineClient line(port);

    std::atomic<bool> opened{false};
    std::atomic<bool> closed{false};
    OnyxNet::net::WsClientWrapper ws;
    ws.set_on_open_callback([&opened]() { opened = true; });
    ws.set_on_disconnect_callback([&closed]() { closed = true; });
    ws.connect(ws_uri(port));
    ASSERT_TRUE(eventually([&]() { return opened.load(); }));
    ASSERT_TRUE(eventually([&]() { return relay->connection_count() == 2; }));

    relay->stop();

    EXPECT_EQ(relay->connection_count(), 0u);
    EXPECT_TRUE(eventually([&]() { return closed.load(); }));
    EXPECT_THROW(line.read_line(), std::exception);
}
