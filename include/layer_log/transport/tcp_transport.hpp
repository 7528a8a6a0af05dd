#ifndef LAYER_LOG_TCP_TRANSPORT_HPP
#define LAYER_LOG_TCP_TRANSPORT_HPP

#ifndef _WIN32

#include "transport_interface.hpp"
#include "stdout_transport.hpp"
#include <string>
#include <cstring>
#include <climits>
#include <stdexcept>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netdb.h>
#include <unistd.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/time.h>

#ifdef MSG_NOSIGNAL
#define LAYER_LOG_MSG_NOSIGNAL MSG_NOSIGNAL
#else
#define LAYER_LOG_MSG_NOSIGNAL 0
#endif

namespace layerlog {

    struct TcpOptions {
        std::string host;
        int port;
        int connectTimeoutMs;
        int sendTimeoutMs;

        TcpOptions(const std::string &host_, int port_)
            : host(host_)
            , port(port_)
            , connectTimeoutMs(3000)
            , sendTimeoutMs(5000) {}

        TcpOptions& setConnectTimeoutMs(int ms) { connectTimeoutMs = ms; return *this; }
        TcpOptions& setSendTimeoutMs(int ms) { sendTimeoutMs = ms; return *this; }
    };

    /// Newline-delimited batches over a persistent TCP connection.
    ///
    /// Connects lazily on the first write. Any send failure closes the
    /// socket and throws; the next write reconnects. A failure after part of
    /// the batch went out throws PartialWriteError with the number of lines
    /// sent in full. A line cut mid-way is not among them and is resent
    /// whole on replay, so the receiver may see its leading fragment twice.
    ///
    /// @note Name resolution (getaddrinfo) is not bounded by connectTimeoutMs.
    class TcpTransport : public ITransport {
    public:
        explicit TcpTransport(TcpOptions opts)
            : m_opts(std::move(opts))
            , m_fd(-1)
            , m_closed(false) {}

        ~TcpTransport() {
            close();
        }

        TcpTransport(const TcpTransport&) = delete;
        TcpTransport& operator=(const TcpTransport&) = delete;

        void write(const std::vector<std::string> &batch) override {
            if (m_closed) {
                throw std::runtime_error("tcp transport closed");
            }
            if (m_fd < 0) {
                connectSocket();
            }
            std::string payload = StdoutTransport::joinLines(batch);
            const char *ptr = payload.data();
            size_t remaining = payload.size();
            while (remaining > 0) {
                ssize_t sent;
                do {
                    sent = ::send(m_fd, ptr, remaining, LAYER_LOG_MSG_NOSIGNAL);
                } while (sent < 0 && errno == EINTR);
                if (sent <= 0) {
                    int err = errno;
                    closeSocket();
                    std::string msg = std::string("tcp send failed: ") + std::strerror(err);
                    size_t bytesOut = payload.size() - remaining;
                    if (bytesOut == 0) {
                        throw std::runtime_error(msg);
                    }
                    throw PartialWriteError(msg, completeLines(batch, bytesOut));
                }
                ptr += sent;
                remaining -= static_cast<size_t>(sent);
            }
        }

        void close() override {
            if (m_closed) return;
            m_closed = true;
            closeSocket();
        }

        bool connected() const { return m_fd >= 0; }

        /// Lines of @p batch wholly contained in the first @p bytes of its
        /// joined payload.
        static size_t completeLines(const std::vector<std::string> &batch, size_t bytes) {
            size_t lines = 0;
            size_t end = 0;
            for (size_t i = 0; i < batch.size(); ++i) {
                end += batch[i].size() + 1;
                if (end > bytes) break;
                ++lines;
            }
            return lines;
        }

    private:
        void connectSocket() {
            struct addrinfo hints, *res = nullptr;
            std::memset(&hints, 0, sizeof(hints));
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            std::string portStr = std::to_string(m_opts.port);
            int gaiResult = getaddrinfo(m_opts.host.c_str(), portStr.c_str(), &hints, &res);
            if (gaiResult != 0 || !res) {
                throw std::runtime_error("cannot resolve " + m_opts.host + ": " + gai_strerror(gaiResult));
            }

            struct AddrInfoGuard {
                struct addrinfo* p;
                explicit AddrInfoGuard(struct addrinfo* a) : p(a) {}
                ~AddrInfoGuard() { if (p) freeaddrinfo(p); }
                AddrInfoGuard(const AddrInfoGuard&) = delete;
                AddrInfoGuard& operator=(const AddrInfoGuard&) = delete;
            } addrGuard(res);

            for (struct addrinfo* rp = res; rp; rp = rp->ai_next) {
                int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
                if (fd < 0) continue;
                if (connectWithTimeout(fd, rp)) {
#ifdef SO_NOSIGPIPE
                    int one = 1;
                    setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
                    struct timeval tv;
                    tv.tv_sec = m_opts.sendTimeoutMs / 1000;
                    tv.tv_usec = (m_opts.sendTimeoutMs % 1000) * 1000;
                    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
                    m_fd = fd;
                    return;
                }
                ::close(fd);
            }
            throw std::runtime_error("cannot connect to " + m_opts.host + ":" + portStr);
        }

        bool connectWithTimeout(int fd, struct addrinfo* rp) {
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
                return false;
            }
            if (::connect(fd, rp->ai_addr, rp->ai_addrlen) < 0) {
                if (errno != EINPROGRESS) return false;

                struct pollfd pfd;
                pfd.fd = fd;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                int sel;
                do {
                    sel = ::poll(&pfd, 1, m_opts.connectTimeoutMs);
                } while (sel < 0 && errno == EINTR);
                if (sel <= 0) return false;

                int soError = 0;
                socklen_t len = sizeof(soError);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
                    return false;
                }
            }
            return fcntl(fd, F_SETFL, flags) == 0;
        }

        void closeSocket() {
            if (m_fd >= 0) {
                ::close(m_fd);
                m_fd = -1;
            }
        }

        TcpOptions m_opts;
        int m_fd;
        bool m_closed;
    };

} // namespace layerlog

#endif // _WIN32

#endif // LAYER_LOG_TCP_TRANSPORT_HPP
