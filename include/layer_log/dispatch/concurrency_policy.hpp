#ifndef LAYER_LOG_CONCURRENCY_POLICY_HPP
#define LAYER_LOG_CONCURRENCY_POLICY_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <thread>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace layerlog {

    /// Machine facts a concurrency policy may look at. Probed once, when the
    /// dispatcher is constructed.
    struct SystemResources {
        uint64_t availableMemoryBytes; ///< 0 when unknown
        unsigned hardwareThreads;      ///< 0 when unknown

        SystemResources() : availableMemoryBytes(0), hardwareThreads(0) {}
        SystemResources(uint64_t memory, unsigned threads)
            : availableMemoryBytes(memory), hardwareThreads(threads) {}

        static SystemResources probe() {
            SystemResources res;
            res.hardwareThreads = std::thread::hardware_concurrency();
#if !defined(_WIN32) && defined(_SC_AVPHYS_PAGES) && defined(_SC_PAGESIZE)
            long pages = sysconf(_SC_AVPHYS_PAGES);
            long pageSize = sysconf(_SC_PAGESIZE);
            if (pages > 0 && pageSize > 0) {
                res.availableMemoryBytes = static_cast<uint64_t>(pages) * static_cast<uint64_t>(pageSize);
            }
#endif
            return res;
        }
    };

    /// How many worker threads drain the queues and how many records may be
    /// in flight (inside a sink's accept) at once.
    struct ConcurrencyPlan {
        size_t workers;
        size_t slots;

        ConcurrencyPlan() : workers(2), slots(100) {}
        ConcurrencyPlan(size_t w, size_t s) : workers(w), slots(s) {}
    };

    using ConcurrencyPolicy = std::function<ConcurrencyPlan(const SystemResources&)>;

    /// Ignores the machine. The dispatcher default is fixedConcurrency(2, 100).
    inline ConcurrencyPolicy fixedConcurrency(size_t workers = 2, size_t slots = 100) {
        return [workers, slots](const SystemResources&) {
            return ConcurrencyPlan(workers > 0 ? workers : 1, slots > 0 ? slots : 1);
        };
    }

    /// Slots scale with available memory: above 8 GiB 500, above 4 GiB 250,
    /// above 2 GiB 100, otherwise 50. Unknown memory gives 100.
    /// Workers are the hardware thread count capped at 4.
    inline ConcurrencyPolicy memoryScaledConcurrency() {
        return [](const SystemResources& res) {
            const uint64_t gib = 1024ULL * 1024ULL * 1024ULL;
            size_t slots;
            if (res.availableMemoryBytes == 0) {
                slots = 100;
            } else if (res.availableMemoryBytes > 8 * gib) {
                slots = 500;
            } else if (res.availableMemoryBytes > 4 * gib) {
                slots = 250;
            } else if (res.availableMemoryBytes > 2 * gib) {
                slots = 100;
            } else {
                slots = 50;
            }
            size_t workers = res.hardwareThreads == 0 ? 2 : res.hardwareThreads;
            if (workers > 4) workers = 4;
            return ConcurrencyPlan(workers, slots);
        };
    }

} // namespace layerlog

#endif // LAYER_LOG_CONCURRENCY_POLICY_HPP
