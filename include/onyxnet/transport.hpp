#ifndef ONYXNET_TRANSPORT_HPP
#define ONYXNET_TRANSPORT_HPP

#include <string>

namespace OnyxNet {

    /**
     * @brief A persistent text-frame connection to the relay.
     */
    class Transport {
    public:
        virtual ~Transport() = default;

        virtual bool is_open() const = 0;

        /**
         * @brief Sends one text frame. Fire-and-forget; no acknowledgement is awaited.
         * @throws DisconnectedError if the connection is not open.
         */
        virtual void send_text(const std::string& text) = 0;
    };

} // namespace OnyxNet

#endif // ONYXNET_TRANSPORT_HPP
