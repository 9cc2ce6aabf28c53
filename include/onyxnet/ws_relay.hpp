#ifndef ONYXNET_WS_RELAY_HPP
#define ONYXNET_WS_RELAY_HPP

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace OnyxNet {
namespace net {

using WsServer = websocketpp::server<websocketpp::config::asio>;
using WsConnectionHdl = websocketpp::connection_hdl;
using WsServerMessagePtr = WsServer::message_ptr;

/**
 * @brief Untrusted broadcast relay.
 *
 * Serves two kinds of client on one event loop: newline-delimited JSON over plain
 * TCP ("line" clients) and WebSocket text frames. Every frame received from any
 * client is forwarded, unparsed, to every connected client of either kind,
 * including its sender. Line clients get the frame followed by '\n'; WebSocket
 * clients get it as one text frame without it. Nothing is stored; a frame for a
 * client that has gone away is dropped.
 */
class WsRelayServer {
public:
    // Longest line accepted from a line client, newline included.
    static constexpr size_t MAX_LINE_BYTES = 1024 * 1024;

    static constexpr std::chrono::milliseconds SHUTDOWN_TIMEOUT{2000};

    WsRelayServer();
    ~WsRelayServer();

    WsRelayServer(const WsRelayServer&) = delete;
    WsRelayServer& operator=(const WsRelayServer&) = delete;

    /**
     * @brief Opens both listeners, then serves them on a background thread.
     *
     * Line clients are accepted on @p port, WebSocket clients on @p port + 1.
     * Both listeners are bound before this returns.
     *
     * @throws RuntimeError if either listener cannot be opened. Nothing is left running.
     * @throws LogicError if the relay is already running.
     * @throws InvalidArgument if @p port leaves no room for the WebSocket port.
     */
    void run(const std::string& host, uint16_t port);

    // Closes every client, then joins the background thread.
    void stop();

    // Open clients of both kinds.
    size_t connection_count() const;

private:
    class LineConnection;

    void on_open(WsConnectionHdl hdl);
    void on_close(WsConnectionHdl hdl);
    void on_message(WsConnectionHdl hdl, WsServerMessagePtr msg);

    void open_line_listener(const std::string& host, uint16_t port);
    void accept_line_client();
    void on_line_closed(const std::shared_ptr<LineConnection>& connection, const std::string& reason);

    void broadcast(const std::string& frame);
    void shutdown_clients();

    std::string describe(WsConnectionHdl hdl);

    WsServer server_;
    std::unique_ptr<websocketpp::lib::asio::ip::tcp::acceptor> line_acceptor_;

    mutable std::mutex connections_mutex_;
    std::set<WsConnectionHdl, std::owner_less<WsConnectionHdl>> connections_;
    std::set<std::shared_ptr<LineConnection>> line_connections_;

    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> loop_running_{false};
};

} // namespace net
} // namespace OnyxNet

#endif // ONYXNET_WS_RELAY_HPP
