#ifndef LAYER_LOG_ROLLING_FILE_TRANSPORT_HPP
#define LAYER_LOG_ROLLING_FILE_TRANSPORT_HPP

#include "transport_interface.hpp"
#include "stdout_transport.hpp"
#include "../core/log_common.hpp"
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>

namespace layerlog {

    struct RollingOptions {
        std::string path_;
        std::uint64_t maxBytes_;  ///< Rotate before a batch would push the file past this
        unsigned int maxFiles_;   ///< Rolled files kept as path.1 .. path.N (at least 1)

        explicit RollingOptions(const std::string &path)
            : path_(path)
            , maxBytes_(1024 * 1024)
            , maxFiles_(5) {}

        RollingOptions& setMaxBytes(std::uint64_t bytes) { maxBytes_ = bytes; return *this; }
        RollingOptions& setMaxFiles(unsigned int n) { maxFiles_ = (n > 0 ? n : 1); return *this; }
    };

    /// File transport with size-based rotation.
    ///
    /// Before a batch is written, if the current file is non-empty and the
    /// batch would take it past maxBytes, the file is rolled: path.N is
    /// removed, path.i becomes path.(i+1), path becomes path.1. A batch is
    /// never split across files, so one larger than maxBytes still lands in
    /// a single file.
    ///
    /// A failed rename is reported and writing continues in the current file.
    class RollingFileTransport : public ITransport {
    public:
        explicit RollingFileTransport(RollingOptions opts)
            : m_opts(std::move(opts))
            , m_size(0)
            , m_closed(false) {
            if (m_opts.maxFiles_ == 0) m_opts.maxFiles_ = 1;
            open();
        }

        ~RollingFileTransport() {
            close();
        }

        RollingFileTransport(const RollingFileTransport&) = delete;
        RollingFileTransport& operator=(const RollingFileTransport&) = delete;

        void write(const std::vector<std::string> &batch) override {
            if (m_closed) {
                throw std::runtime_error("rolling file transport closed: " + m_opts.path_);
            }
            std::string payload = StdoutTransport::joinLines(batch);
            if (m_opts.maxBytes_ > 0 && m_size > 0 && m_size + payload.size() > m_opts.maxBytes_) {
                rotate();
            }
            if (!m_file.is_open()) {
                throw std::runtime_error("cannot open log file: " + m_opts.path_);
            }
            m_file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
            m_file.flush();
            if (!m_file) {
                m_file.clear();
                throw std::runtime_error("write failed: " + m_opts.path_);
            }
            m_size += payload.size();
        }

        void close() override {
            if (m_closed) return;
            m_closed = true;
            if (m_file.is_open()) {
                m_file.close();
            }
        }

        const std::string &path() const { return m_opts.path_; }
        std::uint64_t currentSize() const { return m_size; }

        /// Name of the @p index-th rolled file; 1 is the newest.
        std::string rolledName(unsigned int index) const {
            return m_opts.path_ + "." + std::to_string(index);
        }

    private:
        void open() {
            m_file.open(m_opts.path_.c_str(), std::ios::out | std::ios::app | std::ios::binary);
            m_size = m_file.is_open() ? fileSize(m_opts.path_) : 0;
        }

        void rotate() {
            m_file.close();

            std::remove(rolledName(m_opts.maxFiles_).c_str());
            for (unsigned int i = m_opts.maxFiles_; i > 1; --i) {
                std::rename(rolledName(i - 1).c_str(), rolledName(i).c_str());
            }
            if (std::rename(m_opts.path_.c_str(), rolledName(1).c_str()) != 0) {
                detail::reportInternalError("RollingFileTransport",
                    "failed to rename " + m_opts.path_ + " to " + rolledName(1));
            }
            open();
        }

        static std::uint64_t fileSize(const std::string &path) {
            struct stat st;
            if (::stat(path.c_str(), &st) != 0) return 0;
            return static_cast<std::uint64_t>(st.st_size);
        }

        RollingOptions m_opts;
        std::ofstream m_file;
        std::uint64_t m_size;
        bool m_closed;
    };

} // namespace layerlog

#endif // LAYER_LOG_ROLLING_FILE_TRANSPORT_HPP
