#ifndef LAYER_LOG_ASYNC_DISPATCHER_HPP
#define LAYER_LOG_ASYNC_DISPATCHER_HPP

#include "concurrency_policy.hpp"
#include "record_queue.hpp"
#include "../core/log_common.hpp"
#include "../core/log_record.hpp"
#include "../router/layer_router.hpp"
#include "../backup/backup_store.hpp"
#include "../formatter/json_detail.hpp"
#include <algorithm>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <vector>
#include <memory>
#include <chrono>
#include <string>

namespace layerlog {

    enum class DispatcherState {
        Created,
        Running,
        Draining,
        Stopped
    };

    inline const char *getDispatcherStateString(DispatcherState state) {
        switch (state) {
            case DispatcherState::Created: return "created";
            case DispatcherState::Running: return "running";
            case DispatcherState::Draining: return "draining";
            case DispatcherState::Stopped: return "stopped";
            default: return "unknown";
        }
    }

    /// Where enqueue() put a record.
    enum class EnqueueResult {
        Primary,
        Overflow,
        Dropped
    };

    /// Called on the delivering thread once a record has reached its sinks.
    using DeliveryCallback = std::function<void(const LogRecord &)>;

    struct DispatcherOptions {
        size_t primaryCapacity_;               ///< 0 = unbounded
        size_t overflowCapacity_;              ///< Burst absorber, bounded
        ConcurrencyPolicy concurrency_;        ///< Workers and in-flight slots
        std::chrono::milliseconds drainGrace_; ///< Used by the destructor and close()
        std::shared_ptr<IBackupStore> backup_; ///< Receives records abandoned at the drain deadline
        DeliveryCallback onDelivered_;         ///< Throwing counts as a worker error

        DispatcherOptions()
            : primaryCapacity_(0)
            , overflowCapacity_(100000)
            , concurrency_(fixedConcurrency())
            , drainGrace_(5000) {}

        DispatcherOptions& setPrimaryCapacity(size_t n) { primaryCapacity_ = n; return *this; }
        DispatcherOptions& setOverflowCapacity(size_t n) { overflowCapacity_ = n; return *this; }
        DispatcherOptions& setConcurrency(ConcurrencyPolicy p) { concurrency_ = std::move(p); return *this; }
        DispatcherOptions& setDrainGrace(std::chrono::milliseconds g) { drainGrace_ = g; return *this; }
        DispatcherOptions& setBackupStore(std::shared_ptr<IBackupStore> b) { backup_ = std::move(b); return *this; }
        DispatcherOptions& setOnDelivered(DeliveryCallback cb) { onDelivered_ = std::move(cb); return *this; }
    };

    struct DispatcherStats {
        DispatcherState state;
        size_t primarySize;
        size_t overflowSize;
        size_t inFlight;
        size_t enqueuedPrimary;
        size_t enqueuedOverflow;
        size_t processed;
        size_t dropped;
        size_t workerErrors;
        size_t workers;
        size_t slots;

        DispatcherStats()
            : state(DispatcherState::Created), primarySize(0), overflowSize(0), inFlight(0)
            , enqueuedPrimary(0), enqueuedOverflow(0), processed(0), dropped(0)
            , workerErrors(0), workers(0), slots(0) {}
    };

    /// Queue-backed delivery: producers enqueue, worker threads route
    /// records through the LayerRouter into sinks.
    ///
    /// enqueue() never blocks. It tries the primary queue, then the bounded
    /// overflow queue, and otherwise counts the record as dropped. Workers
    /// always take from the primary queue first, so a record that spilled to
    /// overflow may be delivered after later records.
    ///
    /// Taking a record off a queue and appending it to its sinks' buffers is
    /// one step under m_orderMutex, so any number of workers keep queue order
    /// per sink. Formatting and I/O happen outside that lock.
    ///
    /// Every record enqueued is, at any moment, in one queue, in flight in a
    /// worker, handed to the sinks, or counted in dropped.
    ///
    /// Records may be enqueued before start(). If the dispatcher is drained
    /// without ever being started, the draining thread delivers them itself.
    ///
    /// @note The router must outlive the dispatcher.
    class AsyncDispatcher {
    public:
        AsyncDispatcher(const LayerRouter &router, DispatcherOptions opts = DispatcherOptions())
            : m_router(router)
            , m_opts(std::move(opts))
            , m_plan(planFor(m_opts))
            , m_primary(m_opts.primaryCapacity_)
            , m_overflow(m_opts.overflowCapacity_)
            , m_slots(m_plan.slots)
            , m_state(DispatcherState::Created)
            , m_stopWorkers(false)
        {}

        ~AsyncDispatcher() {
            drain(m_opts.drainGrace_);
        }

        AsyncDispatcher(const AsyncDispatcher&) = delete;
        AsyncDispatcher& operator=(const AsyncDispatcher&) = delete;

        /// Created -> Running. Spawns the worker pool once.
        void start() {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            if (m_state.load() != DispatcherState::Created) return;
            m_workers.reserve(m_plan.workers);
            for (size_t i = 0; i < m_plan.workers; ++i) {
                m_workers.push_back(std::thread(&AsyncDispatcher::workerLoop, this));
            }
            m_state.store(DispatcherState::Running);
        }

        EnqueueResult enqueue(const RecordPtr &record) {
            if (!record) return EnqueueResult::Dropped;
            ProducerGuard guard(m_producers);
            if (m_state.load() == DispatcherState::Stopped) {
                m_dropped.fetch_add(1);
                return EnqueueResult::Dropped;
            }
            if (m_primary.tryPush(record)) {
                m_enqueuedPrimary.fetch_add(1, std::memory_order_relaxed);
                m_wakeCv.notify_one();
                return EnqueueResult::Primary;
            }
            if (m_overflow.tryPush(record)) {
                m_enqueuedOverflow.fetch_add(1, std::memory_order_relaxed);
                m_wakeCv.notify_one();
                return EnqueueResult::Overflow;
            }
            m_dropped.fetch_add(1);
            return EnqueueResult::Dropped;
        }

        /// Enqueue each record in order. Returns how many were not dropped.
        size_t enqueueBatch(const std::vector<RecordPtr> &records) {
            size_t accepted = 0;
            for (size_t i = 0; i < records.size(); ++i) {
                if (enqueue(records[i]) != EnqueueResult::Dropped) ++accepted;
            }
            return accepted;
        }

        /// Deliver queued work until both queues are empty or @p grace
        /// elapses, then drop what is left, close every sink of the router
        /// and stop. Returns the number of records abandoned at the deadline.
        /// Later calls return 0.
        ///
        /// @note A sink write already in progress at the deadline is allowed
        ///       to finish; workers are joined, never detached.
        size_t drain(std::chrono::milliseconds grace) {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            DispatcherState current = m_state.load();
            if (current == DispatcherState::Stopped) return 0;

            const std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + grace;
            bool hadWorkers = (current == DispatcherState::Running);
            m_state.store(DispatcherState::Draining);

            if (hadWorkers) {
                waitForIdle(deadline);
                {
                    std::lock_guard<std::mutex> wlock(m_wakeMutex);
                    m_stopWorkers.store(true);
                }
                m_wakeCv.notify_all();
                for (size_t i = 0; i < m_workers.size(); ++i) {
                    if (m_workers[i].joinable()) m_workers[i].join();
                }
                m_workers.clear();
            } else {
                processInline(deadline);
            }

            m_state.store(DispatcherState::Stopped);
            while (m_producers.load() != 0) {
                std::this_thread::yield();
            }
            size_t abandoned = abandonRemaining();

            SinkList sinks = m_router.allSinks();
            for (size_t i = 0; i < sinks.size(); ++i) {
                sinks[i]->close();
            }
            return abandoned;
        }

        DispatcherState state() const { return m_state.load(); }

        size_t droppedCount() const { return m_dropped.load(); }

        DispatcherStats stats() const {
            DispatcherStats s;
            s.state = m_state.load();
            s.primarySize = m_primary.size();
            s.overflowSize = m_overflow.size();
            s.inFlight = m_inFlight.load();
            s.enqueuedPrimary = m_enqueuedPrimary.load(std::memory_order_relaxed);
            s.enqueuedOverflow = m_enqueuedOverflow.load(std::memory_order_relaxed);
            s.processed = m_processed.load();
            s.dropped = m_dropped.load();
            s.workerErrors = m_workerErrors.load(std::memory_order_relaxed);
            s.workers = m_plan.workers;
            s.slots = m_plan.slots;
            return s;
        }

        const ConcurrencyPlan &plan() const { return m_plan; }
        const DispatcherOptions &options() const { return m_opts; }

    private:
        struct ProducerGuard {
            std::atomic<size_t> &count;
            explicit ProducerGuard(std::atomic<size_t> &c) : count(c) { count.fetch_add(1); }
            ~ProducerGuard() { count.fetch_sub(1); }
            ProducerGuard(const ProducerGuard&) = delete;
            ProducerGuard& operator=(const ProducerGuard&) = delete;
        };

        static ConcurrencyPlan planFor(const DispatcherOptions &opts) {
            ConcurrencyPlan plan;
            if (opts.concurrency_) {
                try {
                    plan = opts.concurrency_(SystemResources::probe());
                } catch (const std::exception &e) {
                    detail::reportInternalError("AsyncDispatcher",
                        std::string("concurrency policy failed, using defaults: ") + e.what());
                    plan = ConcurrencyPlan();
                } catch (...) {
                    detail::reportInternalError("AsyncDispatcher",
                        "concurrency policy failed, using defaults: unknown exception");
                    plan = ConcurrencyPlan();
                }
            }
            if (plan.workers == 0) plan.workers = 1;
            if (plan.slots == 0) plan.slots = 1;
            return plan;
        }

        bool queuesEmpty() const {
            return m_primary.empty() && m_overflow.empty();
        }

        /// Exits once stop is requested, leaving queued records for
        /// abandonRemaining().
        void workerLoop() {
            while (!m_stopWorkers.load()) {
                if (deliverNext()) continue;
                std::unique_lock<std::mutex> lock(m_wakeMutex);
                m_wakeCv.wait_for(lock, std::chrono::milliseconds(50),
                    [this] { return m_stopWorkers.load() || !queuesEmpty(); });
            }
        }

        /// Takes the next record, primary before overflow, and appends it to
        /// every resolved sink while holding m_orderMutex. Flushes the
        /// append triggered run after the lock is released.
        /// @return false when both queues were empty.
        bool deliverNext() {
            detail::SlotGuard slot(m_slots);
            RecordPtr record;
            SinkList due;
            {
                std::lock_guard<std::mutex> order(m_orderMutex);
                // In flight from before the pop so the queues never look
                // idle while a record is moving.
                m_inFlight.fetch_add(1);
                if (!m_primary.tryPop(record) && !m_overflow.tryPop(record)) {
                    m_inFlight.fetch_sub(1);
                    return false;
                }
                try {
                    route(record, due);
                } catch (const std::exception &e) {
                    workerFailed(e.what());
                } catch (...) {
                    workerFailed("unknown exception");
                }
            }

            try {
                for (size_t i = 0; i < due.size(); ++i) {
                    due[i]->flush();
                }
                if (m_opts.onDelivered_) {
                    m_opts.onDelivered_(*record);
                }
            } catch (const std::exception &e) {
                workerFailed(e.what());
            } catch (...) {
                workerFailed("unknown exception");
            }
            m_processed.fetch_add(1);
            m_inFlight.fetch_sub(1);
            m_idleCv.notify_all();
            return true;
        }

        /// Caller holds m_orderMutex.
        void route(const RecordPtr &record, SinkList &due) {
            SinkListPtr sinks = m_router.resolve(record->layer());
            for (size_t i = 0; i < sinks->size(); ++i) {
                bool flushDue = false;
                (*sinks)[i]->append(record, flushDue);
                if (flushDue) due.push_back((*sinks)[i]);
            }
        }

        void workerFailed(const char *what) {
            m_workerErrors.fetch_add(1, std::memory_order_relaxed);
            detail::reportInternalError("AsyncDispatcher", std::string("record delivery failed: ") + what);
        }

        void waitForIdle(std::chrono::steady_clock::time_point deadline) {
            std::unique_lock<std::mutex> lock(m_wakeMutex);
            while (!(queuesEmpty() && m_inFlight.load() == 0)) {
                if (std::chrono::steady_clock::now() >= deadline) return;
                m_idleCv.wait_until(lock, std::min(deadline,
                    std::chrono::steady_clock::now() + std::chrono::milliseconds(10)));
            }
        }

        void processInline(std::chrono::steady_clock::time_point deadline) {
            while (std::chrono::steady_clock::now() < deadline && deliverNext()) {
            }
        }

        size_t abandonRemaining() {
            std::vector<RecordPtr> left = m_primary.takeAll();
            std::vector<RecordPtr> spill = m_overflow.takeAll();
            left.insert(left.end(), spill.begin(), spill.end());
            if (left.empty()) return 0;

            m_dropped.fetch_add(left.size());
            detail::reportInternalError("AsyncDispatcher",
                "drain deadline reached, " + std::to_string(left.size()) + " records dropped");

            if (m_opts.backup_) {
                std::vector<std::string> lines;
                lines.reserve(left.size());
                for (size_t i = 0; i < left.size(); ++i) {
                    lines.push_back(detail::recordToJson(*left[i]).dump(
                        -1, ' ', false, nlohmann::ordered_json::error_handler_t::replace));
                }
                try {
                    m_opts.backup_->backup("dispatcher", lines);
                } catch (const std::exception &e) {
                    detail::reportInternalError("AsyncDispatcher", std::string("backup failed: ") + e.what());
                } catch (...) {
                    detail::reportInternalError("AsyncDispatcher", "backup failed: unknown exception");
                }
            }
            return left.size();
        }

        const LayerRouter &m_router;
        DispatcherOptions m_opts;
        ConcurrencyPlan m_plan;

        detail::RecordQueue m_primary;
        detail::RecordQueue m_overflow;
        detail::Semaphore m_slots;

        std::mutex m_lifecycleMutex;
        std::atomic<DispatcherState> m_state;
        std::vector<std::thread> m_workers;

        std::mutex m_orderMutex;
        std::mutex m_wakeMutex;
        std::condition_variable m_wakeCv;
        std::condition_variable m_idleCv;
        std::atomic<bool> m_stopWorkers;

        std::atomic<size_t> m_producers{0};
        std::atomic<size_t> m_inFlight{0};
        std::atomic<size_t> m_enqueuedPrimary{0};
        std::atomic<size_t> m_enqueuedOverflow{0};
        std::atomic<size_t> m_processed{0};
        std::atomic<size_t> m_dropped{0};
        std::atomic<size_t> m_workerErrors{0};
    };

} // namespace layerlog

#endif // LAYER_LOG_ASYNC_DISPATCHER_HPP
