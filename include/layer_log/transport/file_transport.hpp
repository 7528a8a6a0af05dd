#ifndef LAYER_LOG_FILE_TRANSPORT_HPP
#define LAYER_LOG_FILE_TRANSPORT_HPP

#include "transport_interface.hpp"
#include "stdout_transport.hpp"
#include <fstream>
#include <stdexcept>
#include <string>

namespace layerlog {
    /// Appends each batch to a file with a single write.
    ///
    /// The file is opened in the constructor and held until close(). An
    /// open failure is not thrown from the constructor; the first write()
    /// throws instead so the owning sink counts it like any other I/O error.
    class FileTransport : public ITransport {
    public:
        explicit FileTransport(const std::string &filename)
            : m_filename(filename)
            , m_closed(false) {
            m_file.open(filename.c_str(), std::ios::out | std::ios::app | std::ios::binary);
        }

        ~FileTransport() {
            close();
        }

        void write(const std::vector<std::string> &batch) override {
            if (m_closed) {
                throw std::runtime_error("file transport closed: " + m_filename);
            }
            if (!m_file.is_open()) {
                throw std::runtime_error("cannot open log file: " + m_filename);
            }
            std::string payload = StdoutTransport::joinLines(batch);
            m_file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
            m_file.flush();
            if (!m_file) {
                m_file.clear();
                throw std::runtime_error("write failed: " + m_filename);
            }
        }

        void close() override {
            if (m_closed) return;
            m_closed = true;
            if (m_file.is_open()) {
                m_file.close();
            }
        }

        const std::string &filename() const { return m_filename; }

    private:
        std::string m_filename;
        std::ofstream m_file;
        bool m_closed;
    };
} // namespace layerlog

#endif // LAYER_LOG_FILE_TRANSPORT_HPP
