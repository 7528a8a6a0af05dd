#ifndef LAYER_LOG_FLUSH_TIMER_HPP
#define LAYER_LOG_FLUSH_TIMER_HPP

#include "../core/log_common.hpp"
#include "../router/layer_router.hpp"
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>

namespace layerlog {

    /// Background thread driving the age trigger of idle sinks.
    ///
    /// accept() only checks maxBufferAge when a record arrives; a sink that
    /// receives nothing would otherwise hold its buffer forever. Every
    /// interval the timer calls flushIfStale() on each sink of the router's
    /// current snapshot.
    class FlushTimer {
    public:
        FlushTimer(const LayerRouter& router, std::chrono::milliseconds interval)
            : m_router(router)
            , m_interval(interval.count() > 0 ? interval : std::chrono::milliseconds(100))
            , m_running(false) {}

        ~FlushTimer() {
            stop();
        }

        FlushTimer(const FlushTimer&) = delete;
        FlushTimer& operator=(const FlushTimer&) = delete;

        void start() {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_running.load(std::memory_order_acquire)) return;
            if (m_thread.joinable()) m_thread.join();
            m_running.store(true, std::memory_order_release);
            m_thread = std::thread(&FlushTimer::run, this);
        }

        /// Joins the thread. Safe to call more than once.
        void stop() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_running.store(false, std::memory_order_release);
            }
            m_cv.notify_all();
            if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
                m_thread.join();
            }
        }

        bool running() const { return m_running.load(std::memory_order_acquire); }

        std::chrono::milliseconds interval() const { return m_interval; }

        /// One pass over the sinks. Returns how many flushed.
        size_t tick(std::chrono::steady_clock::time_point now) {
            size_t flushed = 0;
            SinkList sinks = m_router.allSinks();
            for (size_t i = 0; i < sinks.size(); ++i) {
                if (sinks[i]->isClosed()) continue;
                try {
                    if (sinks[i]->flushIfStale(now)) ++flushed;
                } catch (const std::exception& e) {
                    detail::reportInternalError("FlushTimer", std::string("flush failed: ") + e.what());
                } catch (...) {
                    detail::reportInternalError("FlushTimer", "flush failed: unknown exception");
                }
            }
            return flushed;
        }

    private:
        void run() {
            while (m_running.load(std::memory_order_acquire)) {
                {
                    std::unique_lock<std::mutex> lock(m_mutex);
                    m_cv.wait_for(lock, m_interval,
                        [this] { return !m_running.load(std::memory_order_acquire); });
                }
                if (!m_running.load(std::memory_order_acquire)) break;
                tick(std::chrono::steady_clock::now());
            }
        }

        const LayerRouter& m_router;
        std::chrono::milliseconds m_interval;
        std::atomic<bool> m_running;
        std::mutex m_mutex;
        std::condition_variable m_cv;
        std::thread m_thread;
    };

} // namespace layerlog

#endif // LAYER_LOG_FLUSH_TIMER_HPP
