#ifndef LAYER_LOG_CALLBACK_TRANSPORT_HPP
#define LAYER_LOG_CALLBACK_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <functional>

namespace layerlog {

    /// Hands every batch to a user function. Exceptions thrown by the
    /// function are reported as write failures by the owning sink.
    class CallbackTransport : public ITransport {
    public:
        using BatchCallback = std::function<void(const std::vector<std::string>&)>;

        explicit CallbackTransport(BatchCallback cb) : m_callback(std::move(cb)) {}

        void write(const std::vector<std::string> &batch) override {
            if (m_callback) {
                m_callback(batch);
            }
        }

    private:
        BatchCallback m_callback;
    };

    class NullTransport : public ITransport {
    public:
        void write(const std::vector<std::string>&) override {}
    };

} // namespace layerlog

#endif // LAYER_LOG_CALLBACK_TRANSPORT_HPP
