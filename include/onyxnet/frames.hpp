#ifndef ONYXNET_FRAMES_HPP
#define ONYXNET_FRAMES_HPP

#include "envelope.hpp"

#include <string>
#include <variant>

namespace OnyxNet {

    namespace FrameTypes {
        constexpr char HANDSHAKE[] = "handshake";
        constexpr char MESSAGE[] = "msg";
    }

    // {"type":"handshake","sender_id":...,"pubkey":<PEM>}
    struct HandshakeFrame {
        std::string sender_id;
        std::string public_key_pem;

        std::string serialize() const;
    };

    // {"type":"msg","sender_id":...,"payload":{"iv","tag","ciphertext","keys":{id:b64}}}
    struct ChatFrame {
        std::string sender_id;
        Envelope envelope;

        std::string serialize() const;
    };

    // Anything that is not a well-formed handshake or msg frame.
    struct UnknownFrame {
        std::string type;    // the "type" value if one could be read, else empty
        std::string reason;  // why the frame was rejected, for the log
    };

    using Frame = std::variant<HandshakeFrame, ChatFrame, UnknownFrame>;

    /**
     * @brief Parses one text frame received from the relay.
     *
     * Never throws for bad input: malformed JSON, a missing or ill-typed field,
     * invalid base64 and unrecognized types all come back as UnknownFrame.
     */
    Frame parse_frame(const std::string& text);

} // namespace OnyxNet

#endif // ONYXNET_FRAMES_HPP
