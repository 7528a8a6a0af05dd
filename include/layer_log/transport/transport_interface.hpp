#ifndef LAYER_LOG_TRANSPORT_INTERFACE_HPP
#define LAYER_LOG_TRANSPORT_INTERFACE_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace layerlog {

    /// Thrown by a transport that got the first delivered() lines of a batch
    /// out before failing. Only the remaining lines count as lost.
    class PartialWriteError : public std::runtime_error {
    public:
        PartialWriteError(const std::string &what, size_t delivered)
            : std::runtime_error(what), m_delivered(delivered) {}

        size_t delivered() const { return m_delivered; }

    private:
        size_t m_delivered;
    };

    /// Destination writer. Receives an ordered batch of formatted lines and
    /// either persists all of it or throws. Callers never retry.
    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual void write(const std::vector<std::string> &batch) = 0;

        /// Release the underlying resource. Must tolerate repeated calls.
        virtual void close() {}
    };

} // namespace layerlog

#endif // LAYER_LOG_TRANSPORT_INTERFACE_HPP
