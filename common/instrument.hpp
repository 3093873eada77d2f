#pragma once

// ============================================================
// instrument.hpp -- Process-wide diagnostic counters
//   Disabled by default; enabled with --instrument. When off,
//   every note_*() is a single relaxed load.
// ============================================================

#include "platform.hpp"
#include "logger.hpp"
#include <atomic>
#include <string>

class Instrumentation {
public:
    struct Snapshot {
        u64 buffers{0};
        u64 buffer_bytes{0};
        u64 datagrams_sent{0};
        u64 bytes_sent{0};
        u64 datagrams_received{0};
        u64 bytes_received{0};
        u64 sessions_started{0};
        u64 sessions_completed{0};
        u64 sessions_aborted{0};
    };

    static Instrumentation& get() {
        static Instrumentation instance;
        return instance;
    }

    void enable(bool on) { enabled_.store(on, std::memory_order_relaxed); }
    bool enabled() const { return enabled_.load(std::memory_order_relaxed); }

    // An outbound wire buffer was allocated
    void note_buffer(size_t bytes) {
        if (!enabled()) return;
        buffers_.fetch_add(1, std::memory_order_relaxed);
        buffer_bytes_.fetch_add(bytes, std::memory_order_relaxed);
        LOG_DEBUG("Allocating " + std::to_string(bytes) + " bytes");
    }

    void note_sent(size_t bytes) {
        if (!enabled()) return;
        datagrams_sent_.fetch_add(1, std::memory_order_relaxed);
        bytes_sent_.fetch_add(bytes, std::memory_order_relaxed);
    }

    void note_received(size_t bytes) {
        if (!enabled()) return;
        datagrams_received_.fetch_add(1, std::memory_order_relaxed);
        bytes_received_.fetch_add(bytes, std::memory_order_relaxed);
    }

    void note_session_started() {
        if (!enabled()) return;
        sessions_started_.fetch_add(1, std::memory_order_relaxed);
    }

    void note_session_finished(bool completed) {
        if (!enabled()) return;
        if (completed) {
            sessions_completed_.fetch_add(1, std::memory_order_relaxed);
        } else {
            sessions_aborted_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    Snapshot snapshot() const {
        Snapshot s;
        s.buffers            = buffers_.load(std::memory_order_relaxed);
        s.buffer_bytes       = buffer_bytes_.load(std::memory_order_relaxed);
        s.datagrams_sent     = datagrams_sent_.load(std::memory_order_relaxed);
        s.bytes_sent         = bytes_sent_.load(std::memory_order_relaxed);
        s.datagrams_received = datagrams_received_.load(std::memory_order_relaxed);
        s.bytes_received     = bytes_received_.load(std::memory_order_relaxed);
        s.sessions_started   = sessions_started_.load(std::memory_order_relaxed);
        s.sessions_completed = sessions_completed_.load(std::memory_order_relaxed);
        s.sessions_aborted   = sessions_aborted_.load(std::memory_order_relaxed);
        return s;
    }

    std::string summary() const {
        Snapshot s = snapshot();
        return "buffers=" + std::to_string(s.buffers) +
               " (" + std::to_string(s.buffer_bytes) + " B)" +
               " sent=" + std::to_string(s.datagrams_sent) +
               " (" + std::to_string(s.bytes_sent) + " B)" +
               " received=" + std::to_string(s.datagrams_received) +
               " (" + std::to_string(s.bytes_received) + " B)" +
               " sessions=" + std::to_string(s.sessions_started) +
               " completed=" + std::to_string(s.sessions_completed) +
               " aborted=" + std::to_string(s.sessions_aborted);
    }

    void reset() {
        buffers_ = 0; buffer_bytes_ = 0;
        datagrams_sent_ = 0; bytes_sent_ = 0;
        datagrams_received_ = 0; bytes_received_ = 0;
        sessions_started_ = 0; sessions_completed_ = 0; sessions_aborted_ = 0;
    }

    Instrumentation(const Instrumentation&) = delete;
    Instrumentation& operator=(const Instrumentation&) = delete;

private:
    Instrumentation() = default;

    std::atomic<bool> enabled_{false};
    std::atomic<u64>  buffers_{0};
    std::atomic<u64>  buffer_bytes_{0};
    std::atomic<u64>  datagrams_sent_{0};
    std::atomic<u64>  bytes_sent_{0};
    std::atomic<u64>  datagrams_received_{0};
    std::atomic<u64>  bytes_received_{0};
    std::atomic<u64>  sessions_started_{0};
    std::atomic<u64>  sessions_completed_{0};
    std::atomic<u64>  sessions_aborted_{0};
};
