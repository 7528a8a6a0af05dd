#include "test_utils.hpp"
#include <fstream>
#include <sstream>
#include <thread>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <sys/stat.h>

std::string TestUtils::readLogFile(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void TestUtils::waitForFileContent(const std::string &filename, int maxAttempts) {
    for (int i = 0; i < maxAttempts; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (fileExists(filename) && getFileSize(filename) > 0) {
            return;
        }
    }
    throw std::runtime_error("Timeout waiting for file content: " + filename);
}

void TestUtils::cleanupLogFiles() {
    std::vector<std::string> filesToRemove = {
        "layer_test_log.txt", "layer_test_log2.txt", "env_test_log.txt",
        "backup_test.jsonl", "dispatcher_backup.jsonl", "config_test_log.txt",
        "rolling_test_log.txt", "rolling_test_log.txt.1", "rolling_test_log.txt.2", "rolling_test_log.txt.3"
    };

    for (const auto &filename : filesToRemove) {
        removeFile(filename);
    }
}

bool TestUtils::waitFor(const std::function<bool()> &pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

bool TestUtils::fileExists(const std::string &filename) {
    struct stat buffer;
    return (stat(filename.c_str(), &buffer) == 0);
}

std::uintmax_t TestUtils::getFileSize(const std::string &filename) {
    struct stat buffer;
    if (stat(filename.c_str(), &buffer) != 0) {
        return 0;
    }
    return buffer.st_size;
}

void TestUtils::removeFile(const std::string &filename) {
    std::remove(filename.c_str());
}

// ---------------------------------------------------------------------------
// TransportLog
// ---------------------------------------------------------------------------

std::vector<std::vector<std::string>> TransportLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return batches;
}

std::vector<std::string> TransportLog::allLines() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> out;
    for (const auto &b : batches) {
        out.insert(out.end(), b.begin(), b.end());
    }
    return out;
}

size_t TransportLog::batchCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return batches.size();
}

size_t TransportLog::lineCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    size_t n = 0;
    for (const auto &b : batches) n += b.size();
    return n;
}

int TransportLog::closes() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closeCount;
}

// ---------------------------------------------------------------------------
// Transports
// ---------------------------------------------------------------------------

void MemoryTransport::write(const std::vector<std::string> &batch) {
    std::lock_guard<std::mutex> lock(m_log->mutex);
    m_log->batches.push_back(batch);
}

void MemoryTransport::close() {
    std::lock_guard<std::mutex> lock(m_log->mutex);
    ++m_log->closeCount;
}

void FailingTransport::write(const std::vector<std::string> &batch) {
    if (m_remaining.load() > 0) {
        m_remaining.fetch_sub(1);
        throw std::runtime_error("disk full");
    }
    std::lock_guard<std::mutex> lock(m_log->mutex);
    m_log->batches.push_back(batch);
}

void FailingTransport::close() {
    std::lock_guard<std::mutex> lock(m_log->mutex);
    ++m_log->closeCount;
}

void Gate::open() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = true;
    }
    m_cv.notify_all();
}

void Gate::waitOpen() {
    std::unique_lock<std::mutex> lock(m_mutex);
    ++m_waiters;
    m_cv.notify_all();
    m_cv.wait(lock, [this] { return m_open; });
    --m_waiters;
}

bool Gate::waitForWaiter(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] { return m_waiters > 0; });
}

void GateTransport::write(const std::vector<std::string> &batch) {
    m_gate->waitOpen();
    std::lock_guard<std::mutex> lock(m_log->mutex);
    m_log->batches.push_back(batch);
}

std::string PoisonFormatter::format(const layerlog::LogRecord &record) const {
    if (record.message() == "poison") {
        throw std::runtime_error("cannot format poison");
    }
    return record.message();
}

// ---------------------------------------------------------------------------
// ErrorCapture
// ---------------------------------------------------------------------------

ErrorCapture::ErrorCapture() {
    layerlog::setInternalErrorHandler([this](const std::string &component, const std::string &message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_components.push_back(component);
        m_messages.push_back(message);
    });
}

ErrorCapture::~ErrorCapture() {
    layerlog::setInternalErrorHandler(layerlog::InternalErrorHandler());
}

std::vector<std::string> ErrorCapture::components() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_components;
}

std::vector<std::string> ErrorCapture::messages() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_messages;
}

size_t ErrorCapture::count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_messages.size();
}

layerlog::SinkPtr makeMemorySink(const std::string &name,
                                 const std::shared_ptr<TransportLog> &log,
                                 size_t maxBufferSize,
                                 std::chrono::milliseconds maxBufferAge,
                                 layerlog::LogLevel minLevel) {
    layerlog::SinkOptions opts;
    opts.setName(name).setMaxBufferSize(maxBufferSize).setMaxBufferAge(maxBufferAge).setMinLevel(minLevel);
    return std::make_shared<layerlog::Sink>(opts,
        layerlog::detail::make_unique<layerlog::MessageOnlyFormatter>(),
        layerlog::detail::make_unique<MemoryTransport>(log));
}
