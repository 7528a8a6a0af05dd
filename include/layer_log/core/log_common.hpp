#ifndef LAYER_LOG_COMMON_HPP
#define LAYER_LOG_COMMON_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <memory>
#include <functional>
#include <mutex>
#include <cstdio>
#include <ctime>

namespace layerlog {

    /// Receives failures raised inside the delivery path (sink writes,
    /// worker exceptions, backup errors). Must not log through a LayerLog
    /// logger, or a failing sink would feed itself.
    using InternalErrorHandler = std::function<void(const std::string &component, const std::string &message)>;

namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    inline std::mutex &internalErrorMutex() {
        static std::mutex s_mutex;
        return s_mutex;
    }

    inline InternalErrorHandler &internalErrorHandlerStorage() {
        static InternalErrorHandler s_handler;
        return s_handler;
    }

    inline void reportInternalError(const std::string &component, const std::string &message) {
        InternalErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(internalErrorMutex());
            handler = internalErrorHandlerStorage();
        }
        if (handler) {
            try {
                handler(component, message);
                return;
            } catch (...) {
                // fall through to stderr
            }
        }
        std::fprintf(stderr, "[LayerLog][%s] %s\n", component.c_str(), message.c_str());
    }

    inline std::tm localTime(std::time_t t) {
        std::tm result;
#ifdef _WIN32
        localtime_s(&result, &t);
#else
        localtime_r(&t, &result);
#endif
        return result;
    }
} // namespace detail

    /// Replace the internal error handler. Pass an empty function to
    /// restore the default stderr output.
    inline void setInternalErrorHandler(InternalErrorHandler handler) {
        std::lock_guard<std::mutex> lock(detail::internalErrorMutex());
        detail::internalErrorHandlerStorage() = std::move(handler);
    }

    inline std::string formatTimestamp(const std::chrono::system_clock::time_point &time) {
        auto nowTime = std::chrono::system_clock::to_time_t(time);
        auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) % 1000;
        std::tm tm = detail::localTime(nowTime);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << nowMs.count();
        return oss.str();
    }
} // namespace layerlog

#endif // LAYER_LOG_COMMON_HPP
