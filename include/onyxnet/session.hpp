#ifndef ONYXNET_SESSION_HPP
#define ONYXNET_SESSION_HPP

#include "envelope.hpp"
#include "frames.hpp"
#include "handshake.hpp"
#include "identity.hpp"
#include "peer_directory.hpp"
#include "transport.hpp"

#include <string>

namespace OnyxNet {

    enum class ConnectionState {
        CONNECTING,
        CONNECTED,
        DISCONNECTED,
        FAILED
    };

    enum class NoticeLevel {
        INFO,
        MUTED,    // expected conditions, e.g. overhearing a message addressed to others
        WARNING,  // one inbound message could not be read
        ERROR     // one operation failed; the session continues
    };

    const char* to_string(ConnectionState state);

    // First 8 characters of a peer id, as shown to the operator.
    std::string short_id(const std::string& id);

    /**
     * @brief Hooks implemented by whatever renders the chat.
     */
    class SessionHost {
    public:
        virtual ~SessionHost() = default;

        virtual void on_system_notice(const std::string& text, NoticeLevel level) = 0;
        virtual void on_peer_message(const std::string& sender_id, const std::string& plaintext) = 0;
        virtual void on_connection_state_change(ConnectionState state) = 0;
    };

    /**
     * @brief Sequences handshakes and envelopes against the transport.
     *
     * Not thread-safe. The owner must deliver every event (open, frame, submit,
     * close) one at a time, in transport order; WsClientWrapper does this by running
     * them all on its single I/O thread. No exception escapes these entry points:
     * failures are turned into host notices.
     */
    class SessionController {
    public:
        SessionController(const Identity& identity, Transport& transport, SessionHost& host);

        SessionController(const SessionController&) = delete;
        SessionController& operator=(const SessionController&) = delete;

        // Before connecting.
        void on_connecting();

        // Connection is open: announce ourselves unsolicited.
        void on_open();

        void on_close();
        void on_fail();

        // One text frame as delivered by the relay.
        void on_frame(const std::string& text);

        /**
         * @brief Encrypts @p plaintext for every known peer and sends it.
         * @return true if a frame was handed to the transport.
         */
        bool submit(const std::string& plaintext);

        const PeerDirectory& directory() const { return directory_; }
        const Identity& identity() const { return identity_; }
        ConnectionState state() const { return state_; }

    private:
        void handle(const HandshakeFrame& frame);
        void handle(const ChatFrame& frame);
        void handle(const UnknownFrame& frame);

        bool send(const std::string& text, const char* what);
        void set_state(ConnectionState state);

        const Identity& identity_;
        Transport& transport_;
        SessionHost& host_;

        PeerDirectory directory_;
        HandshakeProtocol handshake_;
        EnvelopeEngine envelopes_;

        ConnectionState state_ = ConnectionState::DISCONNECTED;
    };

} // namespace OnyxNet

#endif // ONYXNET_SESSION_HPP
