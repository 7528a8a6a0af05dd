#ifndef LAYER_LOG_STDOUT_TRANSPORT_HPP
#define LAYER_LOG_STDOUT_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <iostream>
#include <mutex>
#include <string>
#include <stdexcept>

namespace layerlog {
    /// @note All StdoutTransport instances share a single mutex so that
    ///       batches from different sinks never interleave on stdout.
    class StdoutTransport : public ITransport {
    public:
        void write(const std::vector<std::string> &batch) override {
            std::string payload = joinLines(batch);
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cout << payload << std::flush;
            if (!std::cout) {
                std::cout.clear();
                throw std::runtime_error("stdout write failed");
            }
        }

        static std::string joinLines(const std::vector<std::string> &batch) {
            size_t total = 0;
            for (size_t i = 0; i < batch.size(); ++i) total += batch[i].size() + 1;
            std::string payload;
            payload.reserve(total);
            for (size_t i = 0; i < batch.size(); ++i) {
                payload += batch[i];
                payload += '\n';
            }
            return payload;
        }

    private:
        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

    /// Same as StdoutTransport but with its own mutex for stderr.
    class StderrTransport : public ITransport {
    public:
        void write(const std::vector<std::string> &batch) override {
            std::string payload = StdoutTransport::joinLines(batch);
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cerr << payload << std::flush;
        }

    private:
        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };
} // namespace layerlog

#endif // LAYER_LOG_STDOUT_TRANSPORT_HPP
