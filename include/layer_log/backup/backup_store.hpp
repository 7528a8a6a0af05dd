#ifndef LAYER_LOG_BACKUP_STORE_HPP
#define LAYER_LOG_BACKUP_STORE_HPP

#include "../core/log_common.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <fstream>
#include <cstdio>
#include <stdexcept>

namespace layerlog {

    /// A batch that could not be delivered, tagged with where it came from
    /// (a sink name, or "dispatcher" for records dropped at shutdown).
    struct BackupBatch {
        std::string source;
        std::vector<std::string> lines;

        BackupBatch() {}
        BackupBatch(std::string source_, std::vector<std::string> lines_)
            : source(std::move(source_)), lines(std::move(lines_)) {}
    };

    /// Persists undeliverable batches for later replay. Only reached on the
    /// failure path; implementations may throw, callers report and move on.
    class IBackupStore {
    public:
        virtual ~IBackupStore() = default;
        virtual void backup(const std::string &source, const std::vector<std::string> &batch) = 0;
        virtual std::vector<BackupBatch> restore() = 0;
    };

    class MemoryBackupStore : public IBackupStore {
    public:
        void backup(const std::string &source, const std::vector<std::string> &batch) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_batches.push_back(BackupBatch(source, batch));
        }

        std::vector<BackupBatch> restore() override {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_batches;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_batches.size();
        }

    private:
        mutable std::mutex m_mutex;
        std::vector<BackupBatch> m_batches;
    };

    /// Appends one JSON object per batch: {"source": "...", "lines": [...]}.
    class FileBackupStore : public IBackupStore {
    public:
        explicit FileBackupStore(const std::string &path) : m_path(path) {}

        void backup(const std::string &source, const std::vector<std::string> &batch) override {
            nlohmann::ordered_json j;
            j["source"] = source;
            j["lines"] = batch;
            std::string line = j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);

            std::lock_guard<std::mutex> lock(m_mutex);
            std::ofstream out(m_path.c_str(), std::ios::out | std::ios::app | std::ios::binary);
            if (!out.is_open()) {
                throw std::runtime_error("cannot open backup file: " + m_path);
            }
            out << line << '\n';
            out.flush();
            if (!out) {
                throw std::runtime_error("backup write failed: " + m_path);
            }
        }

        /// Corrupt lines (for example a torn final write) are skipped.
        std::vector<BackupBatch> restore() override {
            std::vector<BackupBatch> result;
            std::lock_guard<std::mutex> lock(m_mutex);
            std::ifstream in(m_path.c_str());
            if (!in.is_open()) {
                return result;
            }
            std::string line;
            while (std::getline(in, line)) {
                if (line.empty()) continue;
                nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
                if (j.is_discarded() || !j.is_object()) continue;
                BackupBatch batch;
                batch.source = j.value("source", std::string());
                if (j.contains("lines") && j["lines"].is_array()) {
                    for (const auto &item : j["lines"]) {
                        if (item.is_string()) {
                            batch.lines.push_back(item.get<std::string>());
                        }
                    }
                }
                result.push_back(std::move(batch));
            }
            return result;
        }

        void clear() {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::remove(m_path.c_str());
        }

        const std::string &path() const { return m_path; }

    private:
        std::string m_path;
        std::mutex m_mutex;
    };

} // namespace layerlog

#endif // LAYER_LOG_BACKUP_STORE_HPP
