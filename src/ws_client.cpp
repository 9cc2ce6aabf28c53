#include "onyxnet/ws_client.hpp"

#include <iostream>
#include <thread>

#include "onyxnet/errors.hpp"

namespace OnyxNet {
    namespace net {

        WsClientWrapper::WsClientWrapper() {
            client_.init_asio();
            client_.set_open_handler(std::bind(&WsClientWrapper::on_open, this, std::placeholders::_1));
            client_.set_close_handler(std::bind(&WsClientWrapper::on_close, this, std::placeholders::_1));
            client_.set_fail_handler(std::bind(&WsClientWrapper::on_fail, this, std::placeholders::_1));
            client_.set_message_handler(
                std::bind(&WsClientWrapper::on_message, this, std::placeholders::_1, std::placeholders::_2));
            client_.clear_access_channels(websocketpp::log::alevel::all);
            client_.clear_error_channels(websocketpp::log::elevel::all);
        }

        WsClientWrapper::~WsClientWrapper() {
            disconnect();
        }

        void WsClientWrapper::connect(const std::string& uri) {
            if (client_thread_) {
                throw LogicError("Client is already running.");
            }

            websocketpp::lib::error_code ec;
            WsClient::connection_ptr con = client_.get_connection(uri, ec);
            if (ec) {
                throw RuntimeError("Could not create connection: " + ec.message());
            }

            client_.connect(con);

            // Keep the loop alive after the connection ends, so posted tasks still run
            // and can report the disconnect.
            client_.start_perpetual();
            loop_running_ = true;
            client_thread_ = std::make_unique<std::thread>(&WsClientWrapper::run_client, this);
        }

        void WsClientWrapper::disconnect() {
            // If the client thread doesn't exist, we have nothing to do.
            if (!client_thread_) {
                return;
            }

            // Without perpetual work the loop returns once the connection is gone.
            client_.stop_perpetual();

            bool closing = false;
            if (is_connected_) {
                websocketpp::lib::error_code ec;
                client_.close(connection_hdl_, websocketpp::close::status::going_away, "", ec);
                if (ec) {
                    std::cerr << "Close failed: " << ec.message() << std::endl;
                } else {
                    closing = true;
                }
            }

            if (closing) {
                const auto deadline = std::chrono::steady_clock::now() + CLOSE_TIMEOUT;
                while (loop_running_ && std::chrono::steady_clock::now() < deadline) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
            }
            if (!closing || loop_running_) {
                client_.stop();
            }

            if (client_thread_->joinable()) {
                client_thread_->join();
            }

            client_thread_.reset();
            is_connected_ = false;
        }

        bool WsClientWrapper::is_open() const {
            return is_connected_;
        }

        void WsClientWrapper::send_text(const std::string& text) {
            if (!is_connected_) {
                throw DisconnectedError("Not connected to relay.");
            }

            websocketpp::lib::error_code ec;
            client_.send(connection_hdl_, text, websocketpp::frame::opcode::text, ec);
            if (ec) {
                throw DisconnectedError("Error sending frame: " + ec.message());
            }
        }

        void WsClientWrapper::post(std::function<void()> task) {
            client_.get_io_service().post(std::move(task));
        }

        void WsClientWrapper::set_on_open_callback(OnOpenCallback callback) {
            on_open_callback_ = std::move(callback);
        }

        void WsClientWrapper::set_on_text_callback(OnTextCallback callback) {
            on_text_callback_ = std::move(callback);
        }

        void WsClientWrapper::set_on_disconnect_callback(OnDisconnectCallback callback) {
            on_disconnect_callback_ = std::move(callback);
        }

        void WsClientWrapper::set_on_fail_callback(OnFailCallback callback) {
            on_fail_callback_ = std::move(callback);
        }

        void WsClientWrapper::on_open(WsConnectionHdl hdl) {
            connection_hdl_ = hdl;
            is_connected_ = true;
            if (on_open_callback_) {
                on_open_callback_();
            }
        }

        void WsClientWrapper::on_close(WsConnectionHdl hdl) {
            is_connected_ = false;
            if (on_disconnect_callback_) {
                on_disconnect_callback_();
            }
        }

        void WsClientWrapper::on_fail(WsConnectionHdl hdl) {
            is_connected_ = false;
            websocketpp::lib::error_code ec;
            WsClient::connection_ptr con = client_.get_con_from_hdl(hdl, ec);
            if (con) {
                std::cerr << "Connection failed: " << con->get_ec().message() << std::endl;
            }
            if (on_fail_callback_) {
                on_fail_callback_();
            }
        }

        void WsClientWrapper::on_message(WsConnectionHdl hdl, WsClientMessagePtr msg) {
            // The relay forwards bytes untouched; accept binary frames carrying text too.
            if (on_text_callback_) {
                on_text_callback_(msg->get_payload());
            }
        }

        void WsClientWrapper::run_client() {
            try {
                client_.run();
            } catch (const std::exception& e) {
                std::cerr << "Client thread exception: " << e.what() << std::endl;
            }
            loop_running_ = false;
        }

    }  // namespace net
}  // namespace OnyxNet
