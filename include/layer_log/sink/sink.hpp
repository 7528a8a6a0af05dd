#ifndef LAYER_LOG_SINK_HPP
#define LAYER_LOG_SINK_HPP

#include "../core/log_common.hpp"
#include "../core/log_record.hpp"
#include "../formatter/formatter_interface.hpp"
#include "../formatter/plain_text_formatter.hpp"
#include "../transport/transport_interface.hpp"
#include "../backup/backup_store.hpp"
#include <mutex>
#include <atomic>
#include <vector>
#include <memory>
#include <string>
#include <chrono>
#include <stdexcept>
#include <cstddef>

namespace layerlog {

    /// Buffering and threshold settings for a Sink.
    ///
    /// @code
    ///   SinkOptions opts = SinkOptions::file();
    ///   opts.setName("audit").setMinLevel(LogLevel::WARNING).setMaxBufferSize(200);
    /// @endcode
    struct SinkOptions {
        std::string name_;                       ///< Used in diagnostics and backups
        LogLevel minLevel_;                      ///< Records below this are filtered
        size_t maxBufferSize_;                   ///< Flush when the buffer holds this many records
        std::chrono::milliseconds maxBufferAge_; ///< Flush when the last flush is this old

        SinkOptions()
            : name_("sink")
            , minLevel_(LogLevel::NOTSET)
            , maxBufferSize_(1000)
            , maxBufferAge_(1000) {}

        /// 5,000 records or 0.5 s.
        static SinkOptions console() {
            SinkOptions opts;
            opts.name_ = "console";
            opts.maxBufferSize_ = 5000;
            opts.maxBufferAge_ = std::chrono::milliseconds(500);
            return opts;
        }

        /// 50,000 records or 5 s.
        static SinkOptions file() {
            SinkOptions opts;
            opts.name_ = "file";
            opts.maxBufferSize_ = 50000;
            opts.maxBufferAge_ = std::chrono::milliseconds(5000);
            return opts;
        }

        SinkOptions& setName(const std::string& n) { name_ = n; return *this; }
        SinkOptions& setMinLevel(LogLevel l) { minLevel_ = l; return *this; }
        /// @note A value of 0 is clamped to 1.
        SinkOptions& setMaxBufferSize(size_t n) { maxBufferSize_ = (n > 0 ? n : 1); return *this; }
        SinkOptions& setMaxBufferAge(std::chrono::milliseconds age) { maxBufferAge_ = age; return *this; }
    };

    struct SinkStats {
        size_t accepted;     ///< Records appended to the buffer
        size_t filtered;     ///< Records below minLevel
        size_t rejected;     ///< Records offered after close()
        size_t flushes;      ///< Successful transport writes
        size_t written;      ///< Records in successful writes
        size_t writeErrors;  ///< Failed transport writes
        size_t formatErrors; ///< Records the formatter threw on
        size_t lost;         ///< Records in failed writes plus format failures
        size_t buffered;     ///< Records waiting for the next flush

        SinkStats()
            : accepted(0), filtered(0), rejected(0), flushes(0), written(0)
            , writeErrors(0), formatErrors(0), lost(0), buffered(0) {}
    };

    /// Buffered, batching consumer of records for one destination.
    ///
    /// accept() appends under the sink's own mutex and flushes when the
    /// buffer reaches maxBufferSize or the last flush is older than
    /// maxBufferAge. A flush formats the whole buffer and issues a single
    /// ITransport::write().
    ///
    /// Batches are written in the order they were cut from the buffer:
    /// taking the batch and writing it both happen under m_writeMutex, so
    /// records from one producer reach the transport in FIFO order.
    ///
    /// A throwing formatter or transport never escapes: the failure is
    /// counted, reported through reportInternalError(), and the failed batch
    /// is handed to the backup store if one is set.
    ///
    /// The sink owns its transport. close() performs the final flush and
    /// releases the transport exactly once.
    class Sink {
    public:
        Sink(SinkOptions opts,
             std::unique_ptr<IFormatter> formatter,
             std::unique_ptr<ITransport> transport,
             std::shared_ptr<IBackupStore> backup = nullptr)
            : m_opts(std::move(opts))
            , m_formatter(std::move(formatter))
            , m_transport(std::move(transport))
            , m_backup(std::move(backup))
            , m_lastFlush(std::chrono::steady_clock::now())
            , m_closed(false)
        {
            if (!m_transport) {
                throw std::invalid_argument("Sink '" + m_opts.name_ + "' requires a transport");
            }
            if (m_opts.maxBufferSize_ == 0) {
                m_opts.maxBufferSize_ = 1;
            }
            if (!m_formatter) {
                m_formatter = detail::make_unique<PlainTextFormatter>();
            }
            m_buffer.reserve(m_opts.maxBufferSize_ < 1024 ? m_opts.maxBufferSize_ : 1024);
        }

        ~Sink() {
            close();
        }

        Sink(const Sink&) = delete;
        Sink& operator=(const Sink&) = delete;

        /// Buffer a record. Returns false if it was filtered by level or the
        /// sink is closed. Flushes inline when a trigger fires.
        bool accept(const RecordPtr& record) {
            bool flushDue = false;
            bool buffered = append(record, flushDue);
            if (flushDue) {
                flushBuffer();
            }
            return buffered;
        }

        /// Buffer a record without flushing. @p flushDue is set when a
        /// trigger fired; the caller then owes a flush(). Lets a caller order
        /// appends to several sinks under its own lock and do the I/O after.
        bool append(const RecordPtr& record, bool& flushDue) {
            flushDue = false;
            if (!record) return false;
            if (record->level() < m_opts.minLevel_) {
                m_filtered.fetch_add(1, std::memory_order_relaxed);
                return false;
            }

            std::lock_guard<std::mutex> lock(m_bufferMutex);
            if (m_closed.load(std::memory_order_relaxed)) {
                m_rejected.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            m_buffer.push_back(record);
            m_accepted.fetch_add(1, std::memory_order_relaxed);
            flushDue = m_buffer.size() >= m_opts.maxBufferSize_
                || std::chrono::steady_clock::now() - m_lastFlush >= m_opts.maxBufferAge_;
            return true;
        }

        /// Write everything buffered so far, even if no trigger fired.
        void flush() {
            flushBuffer();
        }

        /// Timer check: flush if the buffer is non-empty and the last flush
        /// happened at least maxBufferAge before @p now.
        /// @return true if a flush ran.
        bool flushIfStale(std::chrono::steady_clock::time_point now) {
            {
                std::lock_guard<std::mutex> lock(m_bufferMutex);
                if (m_buffer.empty()) return false;
                if (now - m_lastFlush < m_opts.maxBufferAge_) return false;
            }
            flushBuffer();
            return true;
        }

        bool flushIfStale() {
            return flushIfStale(std::chrono::steady_clock::now());
        }

        /// Final flush, then release the transport. Later calls do nothing.
        void close() {
            {
                std::lock_guard<std::mutex> lock(m_bufferMutex);
                if (m_closed.load(std::memory_order_relaxed)) return;
                m_closed.store(true, std::memory_order_release);
            }
            flushBuffer();

            std::lock_guard<std::mutex> wlock(m_writeMutex);
            try {
                m_transport->close();
            } catch (const std::exception& e) {
                detail::reportInternalError("Sink:" + m_opts.name_, std::string("close failed: ") + e.what());
            } catch (...) {
                detail::reportInternalError("Sink:" + m_opts.name_, "close failed: unknown exception");
            }
        }

        bool isClosed() const { return m_closed.load(std::memory_order_acquire); }

        const std::string& name() const { return m_opts.name_; }
        LogLevel minLevel() const { return m_opts.minLevel_; }
        const SinkOptions& options() const { return m_opts; }

        size_t bufferedCount() const {
            std::lock_guard<std::mutex> lock(m_bufferMutex);
            return m_buffer.size();
        }

        SinkStats stats() const {
            SinkStats s;
            s.accepted = m_accepted.load(std::memory_order_relaxed);
            s.filtered = m_filtered.load(std::memory_order_relaxed);
            s.rejected = m_rejected.load(std::memory_order_relaxed);
            s.flushes = m_flushes.load(std::memory_order_relaxed);
            s.written = m_written.load(std::memory_order_relaxed);
            s.writeErrors = m_writeErrors.load(std::memory_order_relaxed);
            s.formatErrors = m_formatErrors.load(std::memory_order_relaxed);
            s.lost = m_lost.load(std::memory_order_relaxed);
            s.buffered = bufferedCount();
            return s;
        }

    private:
        void flushBuffer() {
            std::lock_guard<std::mutex> wlock(m_writeMutex);
            std::vector<RecordPtr> batch;
            {
                std::lock_guard<std::mutex> lock(m_bufferMutex);
                batch.swap(m_buffer);
                m_lastFlush = std::chrono::steady_clock::now();
            }
            if (!batch.empty()) {
                writeBatch(batch);
            }
        }

        /// Caller holds m_writeMutex.
        void writeBatch(const std::vector<RecordPtr>& batch) {
            std::vector<std::string> lines;
            lines.reserve(batch.size());
            for (size_t i = 0; i < batch.size(); ++i) {
                try {
                    lines.push_back(m_formatter->format(*batch[i]));
                } catch (const std::exception& e) {
                    m_formatErrors.fetch_add(1, std::memory_order_relaxed);
                    m_lost.fetch_add(1, std::memory_order_relaxed);
                    detail::reportInternalError("Sink:" + m_opts.name_, std::string("format failed: ") + e.what());
                } catch (...) {
                    m_formatErrors.fetch_add(1, std::memory_order_relaxed);
                    m_lost.fetch_add(1, std::memory_order_relaxed);
                    detail::reportInternalError("Sink:" + m_opts.name_, "format failed: unknown exception");
                }
            }
            if (lines.empty()) return;

            std::string failure;
            size_t delivered = 0;
            try {
                m_transport->write(lines);
                m_flushes.fetch_add(1, std::memory_order_relaxed);
                m_written.fetch_add(lines.size(), std::memory_order_relaxed);
                return;
            } catch (const PartialWriteError& e) {
                failure = e.what();
                delivered = e.delivered() < lines.size() ? e.delivered() : lines.size();
            } catch (const std::exception& e) {
                failure = e.what();
            } catch (...) {
                failure = "unknown exception";
            }

            if (delivered > 0) {
                m_written.fetch_add(delivered, std::memory_order_relaxed);
                lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(delivered));
            }
            m_writeErrors.fetch_add(1, std::memory_order_relaxed);
            m_lost.fetch_add(lines.size(), std::memory_order_relaxed);
            detail::reportInternalError("Sink:" + m_opts.name_,
                "write failed, " + std::to_string(lines.size()) + " records dropped: " + failure);
            backupLines(lines);
        }

        void backupLines(const std::vector<std::string>& lines) {
            if (!m_backup) return;
            try {
                m_backup->backup(m_opts.name_, lines);
            } catch (const std::exception& e) {
                detail::reportInternalError("Sink:" + m_opts.name_, std::string("backup failed: ") + e.what());
            } catch (...) {
                detail::reportInternalError("Sink:" + m_opts.name_, "backup failed: unknown exception");
            }
        }

        SinkOptions m_opts;
        std::unique_ptr<IFormatter> m_formatter;
        std::unique_ptr<ITransport> m_transport;
        std::shared_ptr<IBackupStore> m_backup;

        mutable std::mutex m_bufferMutex;
        std::mutex m_writeMutex;
        std::vector<RecordPtr> m_buffer;
        std::chrono::steady_clock::time_point m_lastFlush;
        std::atomic<bool> m_closed;

        std::atomic<size_t> m_accepted{0};
        std::atomic<size_t> m_filtered{0};
        std::atomic<size_t> m_rejected{0};
        std::atomic<size_t> m_flushes{0};
        std::atomic<size_t> m_written{0};
        std::atomic<size_t> m_writeErrors{0};
        std::atomic<size_t> m_formatErrors{0};
        std::atomic<size_t> m_lost{0};
    };

    using SinkPtr = std::shared_ptr<Sink>;

} // namespace layerlog

#endif // LAYER_LOG_SINK_HPP
