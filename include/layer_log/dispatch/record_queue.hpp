#ifndef LAYER_LOG_RECORD_QUEUE_HPP
#define LAYER_LOG_RECORD_QUEUE_HPP

#include "../core/log_record.hpp"
#include <mutex>
#include <condition_variable>
#include <deque>
#include <vector>

namespace layerlog {
namespace detail {

    /// Mutex-guarded FIFO of records. Capacity 0 means unbounded.
    /// Never blocks a producer: tryPush fails when full.
    class RecordQueue {
    public:
        explicit RecordQueue(size_t capacity) : m_capacity(capacity) {}

        bool tryPush(const RecordPtr& record) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_capacity != 0 && m_queue.size() >= m_capacity) {
                return false;
            }
            m_queue.push_back(record);
            return true;
        }

        bool tryPop(RecordPtr& out) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_queue.empty()) return false;
            out = std::move(m_queue.front());
            m_queue.pop_front();
            return true;
        }

        /// Remove everything, returning it in queue order.
        std::vector<RecordPtr> takeAll() {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<RecordPtr> out(m_queue.begin(), m_queue.end());
            m_queue.clear();
            return out;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

        bool empty() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.empty();
        }

        size_t capacity() const { return m_capacity; }

    private:
        mutable std::mutex m_mutex;
        std::deque<RecordPtr> m_queue;
        size_t m_capacity;
    };

    /// Counting semaphore for C++11 (mutex + condition_variable).
    class Semaphore {
    public:
        explicit Semaphore(size_t count) : m_count(count > 0 ? count : 1) {}

        void acquire() {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_count > 0; });
            --m_count;
        }

        void release() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_count;
            }
            m_cv.notify_one();
        }

        size_t available() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_count;
        }

    private:
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        size_t m_count;
    };

    class SlotGuard {
    public:
        explicit SlotGuard(Semaphore& sem) : m_sem(sem) { m_sem.acquire(); }
        ~SlotGuard() { m_sem.release(); }
        SlotGuard(const SlotGuard&) = delete;
        SlotGuard& operator=(const SlotGuard&) = delete;
    private:
        Semaphore& m_sem;
    };

} // namespace detail
} // namespace layerlog

#endif // LAYER_LOG_RECORD_QUEUE_HPP
