#ifndef LAYER_LOG_LOGGER_REGISTRY_HPP
#define LAYER_LOG_LOGGER_REGISTRY_HPP

#include "logger_interface.hpp"
#include "../core/log_common.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace layerlog {

    using LoggerPtr = std::shared_ptr<ILogger>;
    using LoggerFactory = std::function<LoggerPtr(const std::string &name)>;

    /// Named loggers with get-or-create semantics.
    ///
    /// Owned by the application, not a process global: construct one at the
    /// composition root and pass it where needed. Destroying the registry
    /// closes every logger it still holds.
    ///
    /// Thread safety: all methods lock. The factory runs under the lock so a
    /// name is created at most once; it must not call back into the registry.
    class LoggerRegistry {
    public:
        LoggerRegistry() = default;

        ~LoggerRegistry() {
            closeAll();
        }

        LoggerRegistry(const LoggerRegistry&) = delete;
        LoggerRegistry& operator=(const LoggerRegistry&) = delete;

        /// The logger registered under @p name, created by @p factory if absent.
        /// @throws std::invalid_argument if the factory returns null.
        LoggerPtr getOrCreate(const std::string &name, const LoggerFactory &factory) {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::map<std::string, LoggerPtr>::iterator it = m_loggers.find(name);
            if (it != m_loggers.end()) {
                return it->second;
            }
            LoggerPtr created = factory(name);
            if (!created) {
                throw std::invalid_argument("logger factory returned null for '" + name + "'");
            }
            m_loggers[name] = created;
            return created;
        }

        /// Register an existing logger. Returns false if the name is taken.
        bool add(const std::string &name, LoggerPtr logger) {
            if (!logger) return false;
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_loggers.insert(std::make_pair(name, std::move(logger))).second;
        }

        /// Null when not registered.
        LoggerPtr get(const std::string &name) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::map<std::string, LoggerPtr>::const_iterator it = m_loggers.find(name);
            return it == m_loggers.end() ? LoggerPtr() : it->second;
        }

        bool contains(const std::string &name) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_loggers.count(name) != 0;
        }

        /// Unregister and close. Returns false if the name was unknown.
        bool remove(const std::string &name) {
            LoggerPtr removed;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                std::map<std::string, LoggerPtr>::iterator it = m_loggers.find(name);
                if (it == m_loggers.end()) return false;
                removed = it->second;
                m_loggers.erase(it);
            }
            closeLogger(name, removed);
            return true;
        }

        std::vector<std::string> names() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<std::string> result;
            result.reserve(m_loggers.size());
            for (std::map<std::string, LoggerPtr>::const_iterator it = m_loggers.begin(); it != m_loggers.end(); ++it) {
                result.push_back(it->first);
            }
            return result;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_loggers.size();
        }

        /// Close and forget every logger. Loggers are closed outside the lock.
        void closeAll() {
            std::map<std::string, LoggerPtr> loggers;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                loggers.swap(m_loggers);
            }
            for (std::map<std::string, LoggerPtr>::iterator it = loggers.begin(); it != loggers.end(); ++it) {
                closeLogger(it->first, it->second);
            }
        }

    private:
        /// A throwing close() is reported so the remaining loggers still close.
        static void closeLogger(const std::string &name, const LoggerPtr &logger) {
            try {
                logger->close();
            } catch (const std::exception &e) {
                detail::reportInternalError("LoggerRegistry", "closing '" + name + "' failed: " + e.what());
            } catch (...) {
                detail::reportInternalError("LoggerRegistry", "closing '" + name + "' failed: unknown exception");
            }
        }

        mutable std::mutex m_mutex;
        std::map<std::string, LoggerPtr> m_loggers;
    };

} // namespace layerlog

#endif // LAYER_LOG_LOGGER_REGISTRY_HPP
