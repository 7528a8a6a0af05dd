#ifndef LAYER_LOG_SINK_FACTORY_HPP
#define LAYER_LOG_SINK_FACTORY_HPP

#include "sink.hpp"
#include "../formatter/plain_text_formatter.hpp"
#include "../transport/stdout_transport.hpp"
#include "../transport/file_transport.hpp"
#include "../transport/rolling_file_transport.hpp"
#include "../transport/tcp_transport.hpp"
#include <memory>
#include <string>

namespace layerlog {

    /// Console sink with console-class buffering (see SinkOptions::console()).
    inline SinkPtr makeConsoleSink(SinkOptions opts = SinkOptions::console(),
                                   std::unique_ptr<IFormatter> formatter = nullptr) {
        return std::make_shared<Sink>(std::move(opts), std::move(formatter),
                                      detail::make_unique<StdoutTransport>());
    }

    inline SinkPtr makeFileSink(const std::string& path,
                                SinkOptions opts = SinkOptions::file(),
                                std::unique_ptr<IFormatter> formatter = nullptr,
                                std::shared_ptr<IBackupStore> backup = nullptr) {
        return std::make_shared<Sink>(std::move(opts), std::move(formatter),
                                      detail::make_unique<FileTransport>(path), std::move(backup));
    }

    /// File sink that rolls the file by size (see RollingFileTransport).
    inline SinkPtr makeRollingFileSink(const RollingOptions& rolling,
                                       SinkOptions opts = SinkOptions::file(),
                                       std::unique_ptr<IFormatter> formatter = nullptr,
                                       std::shared_ptr<IBackupStore> backup = nullptr) {
        return std::make_shared<Sink>(std::move(opts), std::move(formatter),
                                      detail::make_unique<RollingFileTransport>(rolling), std::move(backup));
    }

#ifndef _WIN32
    inline SinkPtr makeTcpSink(const TcpOptions& tcp,
                               SinkOptions opts = SinkOptions().setName("tcp"),
                               std::unique_ptr<IFormatter> formatter = nullptr,
                               std::shared_ptr<IBackupStore> backup = nullptr) {
        return std::make_shared<Sink>(std::move(opts), std::move(formatter),
                                      detail::make_unique<TcpTransport>(tcp), std::move(backup));
    }
#endif

} // namespace layerlog

#endif // LAYER_LOG_SINK_FACTORY_HPP
