#include "onyxnet/ws_relay.hpp"

#include <deque>
#include <iostream>
#include <vector>

#include "onyxnet/errors.hpp"

namespace OnyxNet {
    namespace net {

        namespace asio = websocketpp::lib::asio;
        using tcp = asio::ip::tcp;

        namespace {

            void strip_line_ending(std::string& frame) {
                while (!frame.empty() && (frame.back() == '\n' || frame.back() == '\r')) {
                    frame.pop_back();
                }
            }

        } // namespace

        // One plain TCP client. Lives on the relay's loop thread only.
        class WsRelayServer::LineConnection : public std::enable_shared_from_this<LineConnection> {
        public:
            LineConnection(WsRelayServer& relay, tcp::socket socket)
                : relay_(relay), socket_(std::move(socket)), input_(MAX_LINE_BYTES) {
                asio::error_code ec;
                tcp::endpoint remote = socket_.remote_endpoint(ec);
                peer_ = ec ? "<unknown>" : remote.address().to_string() + ":" + std::to_string(remote.port());
            }

            void start() {
                read_next();
            }

            void deliver(const std::string& frame) {
                const bool idle = outbox_.empty();
                outbox_.push_back(frame + "\n");
                if (idle) {
                    write_next();
                }
            }

            void close() {
                asio::error_code ec;
                socket_.shutdown(tcp::socket::shutdown_both, ec);
                socket_.close(ec);
            }

            const std::string& peer() const { return peer_; }

        private:
            void read_next() {
                auto self = shared_from_this();
                asio::async_read_until(socket_, input_, '\n', [this, self](const asio::error_code& ec, size_t length) {
                    if (ec == asio::error::not_found) {
                        relay_.on_line_closed(self, "line longer than " + std::to_string(MAX_LINE_BYTES) + " bytes");
                        return;
                    }
                    if (ec) {
                        relay_.on_line_closed(self, ec == asio::error::eof ? std::string() : ec.message());
                        return;
                    }

                    auto begin = asio::buffers_begin(input_.data());
                    std::string frame(begin, begin + static_cast<std::ptrdiff_t>(length));
                    input_.consume(length);

                    strip_line_ending(frame);
                    if (!frame.empty()) {
                        relay_.broadcast(frame);
                    }
                    read_next();
                });
            }

            void write_next() {
                auto self = shared_from_this();
                asio::async_write(socket_, asio::buffer(outbox_.front()),
                                  [this, self](const asio::error_code& ec, size_t) {
                                      if (ec) {
                                          // The pending read reports the closure.
                                          outbox_.clear();
                                          close();
                                          return;
                                      }
                                      outbox_.pop_front();
                                      if (!outbox_.empty()) {
                                          write_next();
                                      }
                                  });
            }

            WsRelayServer& relay_;
            tcp::socket socket_;
            asio::streambuf input_;
            std::deque<std::string> outbox_;
            std::string peer_;
        };

        WsRelayServer::WsRelayServer() {
            server_.init_asio();
            server_.set_reuse_addr(true);
            server_.set_open_handler(std::bind(&WsRelayServer::on_open, this, std::placeholders::_1));
            server_.set_close_handler(std::bind(&WsRelayServer::on_close, this, std::placeholders::_1));
            server_.set_message_handler(
                std::bind(&WsRelayServer::on_message, this, std::placeholders::_1, std::placeholders::_2));
            server_.clear_access_channels(websocketpp::log::alevel::all);
            server_.clear_error_channels(websocketpp::log::elevel::all);
        }

        WsRelayServer::~WsRelayServer() {
            stop();
        }

        void WsRelayServer::run(const std::string& host, uint16_t port) {
            if (server_thread_) {
                throw LogicError("Relay is already running.");
            }
            if (port == UINT16_MAX) {
                throw InvalidArgument("Relay port leaves no room for the WebSocket port.");
            }

            // 1. Plain TCP line listener.
            open_line_listener(host, port);

            // 2. WebSocket listener on the next port up.
            const std::string ws_port = std::to_string(port + 1);
            websocketpp::lib::error_code ec;
            server_.listen(host, ws_port, ec);
            if (!ec) {
                server_.start_accept(ec);
            }
            if (ec) {
                asio::error_code ignored;
                line_acceptor_->close(ignored);
                line_acceptor_.reset();
                if (server_.is_listening()) {
                    websocketpp::lib::error_code stop_ec;
                    server_.stop_listening(stop_ec);
                }
                throw RuntimeError("Cannot serve WebSocket on " + host + ":" + ws_port + ": " + ec.message());
            }

            // 3. Both are bound; serve them.
            accept_line_client();
            loop_running_ = true;
            server_thread_ = std::make_unique<std::thread>([this]() {
                try {
                    server_.run();
                } catch (const std::exception& e) {
                    std::cerr << "Relay thread exception: " << e.what() << std::endl;
                }
                loop_running_ = false;
            });
        }

        void WsRelayServer::stop() {
            if (!server_thread_) {
                return;
            }

            // Close everything from the loop thread, then let the loop run out of work.
            server_.get_io_service().post([this]() { shutdown_clients(); });

            const auto deadline = std::chrono::steady_clock::now() + SHUTDOWN_TIMEOUT;
            while (loop_running_ && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (loop_running_) {
                server_.stop();
            }

            if (server_thread_->joinable()) {
                server_thread_->join();
            }
            server_thread_.reset();

            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.clear();
            line_connections_.clear();
            line_acceptor_.reset();
        }

        void WsRelayServer::shutdown_clients() {
            websocketpp::lib::error_code ec;
            if (server_.is_listening()) {
                server_.stop_listening(ec);
            }
            if (line_acceptor_) {
                asio::error_code close_ec;
                line_acceptor_->close(close_ec);
            }

            std::set<WsConnectionHdl, std::owner_less<WsConnectionHdl>> ws_clients;
            std::set<std::shared_ptr<LineConnection>> line_clients;
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                ws_clients = connections_;
                line_clients = line_connections_;
            }
            for (const auto& hdl : ws_clients) {
                server_.close(hdl, websocketpp::close::status::going_away, "Relay shutdown", ec);
            }
            for (const auto& connection : line_clients) {
                connection->close();
            }
        }

        size_t WsRelayServer::connection_count() const {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            return connections_.size() + line_connections_.size();
        }

        void WsRelayServer::open_line_listener(const std::string& host, uint16_t port) {
            const std::string where = host + ":" + std::to_string(port);

            asio::error_code ec;
            tcp::resolver resolver(server_.get_io_service());
            auto results = resolver.resolve(host, std::to_string(port), ec);
            if (ec || results.empty()) {
                throw RuntimeError("Cannot resolve " + where + ": " + (ec ? ec.message() : "no address"));
            }
            const tcp::endpoint endpoint = results.begin()->endpoint();

            auto acceptor = std::make_unique<tcp::acceptor>(server_.get_io_service());
            acceptor->open(endpoint.protocol(), ec);
            if (!ec) {
                acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
            }
            if (!ec) {
                acceptor->bind(endpoint, ec);
            }
            if (!ec) {
                acceptor->listen(asio::socket_base::max_listen_connections, ec);
            }
            if (ec) {
                throw RuntimeError("Cannot serve TCP on " + where + ": " + ec.message());
            }
            line_acceptor_ = std::move(acceptor);
        }

        void WsRelayServer::accept_line_client() {
            line_acceptor_->async_accept([this](const asio::error_code& ec, tcp::socket socket) {
                if (ec == asio::error::operation_aborted || !line_acceptor_->is_open()) {
                    return;
                }
                if (ec) {
                    std::cerr << "Accept failed: " << ec.message() << std::endl;
                } else {
                    auto connection = std::make_shared<LineConnection>(*this, std::move(socket));
                    {
                        std::lock_guard<std::mutex> lock(connections_mutex_);
                        line_connections_.insert(connection);
                    }
                    std::cout << "[+] New TCP connection from " << connection->peer() << std::endl;
                    connection->start();
                }
                accept_line_client();
            });
        }

        void WsRelayServer::on_line_closed(const std::shared_ptr<LineConnection>& connection,
                                           const std::string& reason) {
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                if (line_connections_.erase(connection) == 0) {
                    return;
                }
            }
            connection->close();
            std::cout << "[-] TCP connection closed from " << connection->peer();
            if (!reason.empty()) {
                std::cout << " (" << reason << ")";
            }
            std::cout << std::endl;
        }

        std::string WsRelayServer::describe(WsConnectionHdl hdl) {
            websocketpp::lib::error_code ec;
            WsServer::connection_ptr con = server_.get_con_from_hdl(hdl, ec);
            if (!con) {
                return "<gone>";
            }
            return con->get_remote_endpoint();
        }

        void WsRelayServer::on_open(WsConnectionHdl hdl) {
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                connections_.insert(hdl);
            }
            std::cout << "[+] New WebSocket connection from " << describe(hdl) << std::endl;
        }

        void WsRelayServer::on_close(WsConnectionHdl hdl) {
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                connections_.erase(hdl);
            }
            std::cout << "[-] WebSocket connection closed from " << describe(hdl) << std::endl;
        }

        void WsRelayServer::on_message(WsConnectionHdl hdl, WsServerMessagePtr msg) {
            std::string frame = msg->get_payload();
            strip_line_ending(frame);
            if (!frame.empty()) {
                broadcast(frame);
            }
        }

        void WsRelayServer::broadcast(const std::string& frame) {
            std::vector<WsConnectionHdl> ws_targets;
            std::vector<std::shared_ptr<LineConnection>> line_targets;
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                ws_targets.assign(connections_.begin(), connections_.end());
                line_targets.assign(line_connections_.begin(), line_connections_.end());
            }

            // Sender included: clients rely on seeing their own frames come back.
            for (const auto& target : ws_targets) {
                websocketpp::lib::error_code ec;
                server_.send(target, frame, websocketpp::frame::opcode::text, ec);
                if (ec) {
                    std::cerr << "Error relaying to " << describe(target) << ": " << ec.message() << std::endl;
                }
            }
            for (const auto& target : line_targets) {
                target->deliver(frame);
            }
        }

    }  // namespace net
}  // namespace OnyxNet
