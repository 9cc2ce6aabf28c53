#ifndef ONYXNET_WS_CLIENT_HPP
#define ONYXNET_WS_CLIENT_HPP

#include "transport.hpp"
#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace OnyxNet {
namespace net {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;
using WsConnectionHdl = websocketpp::connection_hdl;
using WsClientMessagePtr = WsClient::message_ptr;

/**
 * @brief WebSocket connection to the relay.
 *
 * All callbacks, and every task handed to post(), run on the single client thread,
 * one after another. That thread is the session's serialized event queue.
 */
class WsClientWrapper : public Transport {
public:
    using OnOpenCallback = std::function<void()>;
    using OnTextCallback = std::function<void(const std::string&)>;
    using OnDisconnectCallback = std::function<void()>;
    using OnFailCallback = std::function<void()>;

    WsClientWrapper();
    ~WsClientWrapper() override;

    WsClientWrapper(const WsClientWrapper&) = delete;
    WsClientWrapper& operator=(const WsClientWrapper&) = delete;

    /**
     * @brief Starts connecting to @p uri on a background thread.
     * @throws RuntimeError if the URI is invalid.
     */
    void connect(const std::string& uri);

    /**
     * @brief Closes the connection and joins the client thread.
     *
     * The close handshake is given up to CLOSE_TIMEOUT to complete before the
     * loop is stopped outright. The disconnect callback fires if it completes.
     */
    void disconnect();

    static constexpr std::chrono::milliseconds CLOSE_TIMEOUT{2000};

    bool is_open() const override;
    void send_text(const std::string& text) override;

    /**
     * @brief Queues @p task to run on the client thread after any pending events.
     */
    void post(std::function<void()> task);

    void set_on_open_callback(OnOpenCallback callback);
    void set_on_text_callback(OnTextCallback callback);
    void set_on_disconnect_callback(OnDisconnectCallback callback);
    void set_on_fail_callback(OnFailCallback callback);

private:
    void on_open(WsConnectionHdl hdl);
    void on_close(WsConnectionHdl hdl);
    void on_fail(WsConnectionHdl hdl);
    void on_message(WsConnectionHdl hdl, WsClientMessagePtr msg);
    void run_client();

    WsClient client_;
    WsConnectionHdl connection_hdl_;
    std::unique_ptr<std::thread> client_thread_;
    std::atomic<bool> is_connected_{false};
    std::atomic<bool> loop_running_{false};

    OnOpenCallback on_open_callback_;
    OnTextCallback on_text_callback_;
    OnDisconnectCallback on_disconnect_callback_;
    OnFailCallback on_fail_callback_;
};

} // namespace net
} // namespace OnyxNet

#endif // ONYXNET_WS_CLIENT_HPP
