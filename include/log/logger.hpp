#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "mpmc_queue.hpp"
#include "log/record.hpp"
#include "log/loglevel.hpp"


namespace pasture {

namespace log {

/// Asynchronous logger.
///
/// Callers format a line into a fixed-size Record and push it onto a
/// lock-free queue; a background thread drains the queue into a memory
/// buffer and writes it to every output. Use the log_* macros from
/// log/log.hpp rather than calling log() directly.
template <std::size_t QCap>
class LoggerImpl
{
    using Global_Que_t = MPMCQueue<Record>;
    static constexpr std::size_t Desired_buffer_size = Record::Size * 256;
    static constexpr std::size_t Desired_flush_threshold = Desired_buffer_size * 8 / 10;
    using Buffer = fmt::basic_memory_buffer<char, Desired_buffer_size>;
    static constexpr std::int64_t Desired_sleep_microsec = 1000;

public:
    static LoggerImpl& instance() {
        static LoggerImpl logger;
        return logger;
    }

    LogLevel getLogLevel() const { return m_logLevel.load(std::memory_order_relaxed); }

    LoggerImpl& setLogLevel(LogLevel level) {
        m_logLevel.store(level, std::memory_order_relaxed);
        return *this;
    }

    LoggerImpl& setLogFile(FILE* pf) {
        std::lock_guard<std::mutex> lk{m_output_mutex};
        closeLogFilesLocked();
        m_outputs.push_back(pf);
        return *this;
    }

    LoggerImpl& setLogFile(const char* filename, bool trunc = false) {
        return setLogFile(openLogFile(filename, trunc));
    }

    LoggerImpl& addLogFile(FILE* pf) {
        std::lock_guard<std::mutex> lk{m_output_mutex};
        m_outputs.push_back(pf);
        return *this;
    }

    LoggerImpl& addLogFile(const char* filename, bool trunc = false) {
        return addLogFile(openLogFile(filename, trunc));
    }

    bool checkLogLevel(LogLevel level) const { return level >= getLogLevel(); }

    template <typename... Args>
    void log(LogLevel level, Args&&... args) {
        static auto emplace_functor = MakeRecord();
        if (!checkLogLevel(level)) {
            return;
        }
        global_q.emplace_with(emplace_functor, std::forward<Args>(args)...);
    }

    /// Drain the queue and write everything out now.
    void flush() { poll(true); }

    ~LoggerImpl() {
        stopBackgroundThread();
        poll(true);
        std::lock_guard<std::mutex> lk{m_output_mutex};
        closeLogFilesLocked();
    }

private:
    LoggerImpl()
        : global_q(QCap)
    {
        m_outputs.push_back(stdout);
        startBackgroundThread(Desired_sleep_microsec);
    }

    LoggerImpl(const LoggerImpl&) = delete;
    LoggerImpl& operator=(const LoggerImpl&) = delete;

    static FILE* openLogFile(const char* filename, bool trunc) {
        FILE* newfp = std::fopen(filename, trunc ? "w" : "a");
        if (newfp == nullptr) {
            throw std::runtime_error(
                fmt::format("Unable to open log file: {}, {}", filename, std::strerror(errno)));
        }
        return newfp;
    }

    // the standard streams are borrowed, everything else was opened by us
    void closeLogFilesLocked() {
        writeFileLocked();
        for (auto fp : m_outputs) {
            if (fp != stdout && fp != stderr)
                std::fclose(fp);
        }
        m_outputs.clear();
    }

    void writeFileLocked() {
        if (m_buf.size() == 0) return;
        for (auto fp : m_outputs) {
            std::fwrite(m_buf.data(), 1, m_buf.size(), fp);
            std::fflush(fp);
        }
        m_buf.clear();
    }

    void poll(bool flushFile) {
        std::lock_guard<std::mutex> lk{m_output_mutex};
        auto consume_functor = [this](Record* p) {
            std::copy_n(p->data, p->size, std::back_inserter(m_buf));
        };

        auto cnt = global_q.try_consume_all(consume_functor);
        if (cnt == 0 && !flushFile) return;

        if (flushFile || m_buf.size() >= Desired_flush_threshold)
            writeFileLocked();
    }

    void startBackgroundThread(std::int64_t interval) {
        bgt_running.store(true);
        m_bgt = std::thread(
            [interval, this]() {
                while (bgt_running.load()) {
                    std::this_thread::sleep_for(std::chrono::microseconds(interval));
                    poll(true);
                }
            }
        );
    }

    void stopBackgroundThread() {
        if (!bgt_running.exchange(false)) return;
        if (m_bgt.joinable())
            m_bgt.join();
    }

    std::atomic<LogLevel> m_logLevel{INFO};
    std::vector<FILE*> m_outputs;
    std::mutex m_output_mutex;

    Buffer m_buf;

    std::thread m_bgt;
    std::atomic<bool> bgt_running{false};

    Global_Que_t global_q;
};

using Logger = LoggerImpl<4096>;

inline Logger& logger() { return Logger::instance(); }

} // namespace log

} // namespace pasture
