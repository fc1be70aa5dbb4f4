// Sluice Metrics - Header
// Lock-free gateway counters, read as a snapshot by /health

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace sluice::control {

/// Counters at a point in time
struct MetricsSnapshot {
    // Session lifecycle
    uint64_t sessions_opened = 0;
    uint64_t sessions_closed = 0;
    uint64_t sessions_rejected = 0;  // Connect failed (unknown name, unreachable, limit)

    // Stream plane
    uint64_t frames_received = 0;   // From backends
    uint64_t frames_delivered = 0;  // To clients
    uint64_t frames_dropped = 0;    // Evicted by drop-oldest
    uint64_t heartbeats_sent = 0;
    uint64_t client_disconnects = 0;

    // Request plane
    uint64_t calls_forwarded = 0;
    uint64_t calls_failed = 0;
    uint64_t total_call_latency_us = 0;
    uint64_t max_call_latency_us = 0;

    [[nodiscard]] uint64_t active_sessions() const noexcept {
        return sessions_opened >= sessions_closed ? sessions_opened - sessions_closed : 0;
    }

    [[nodiscard]] double avg_call_latency_us() const noexcept {
        if (calls_forwarded == 0) return 0.0;
        return static_cast<double>(total_call_latency_us) / static_cast<double>(calls_forwarded);
    }
};

/// Shared gateway counters (lock-free, relaxed ordering)
class GatewayMetrics {
public:
    GatewayMetrics() = default;
    ~GatewayMetrics() = default;

    // Non-copyable, non-movable (std::atomic is not movable)
    GatewayMetrics(const GatewayMetrics&) = delete;
    GatewayMetrics& operator=(const GatewayMetrics&) = delete;
    GatewayMetrics(GatewayMetrics&&) = delete;
    GatewayMetrics& operator=(GatewayMetrics&&) = delete;

    void record_session_opened() noexcept {
        sessions_opened_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_session_closed() noexcept {
        sessions_closed_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_session_rejected() noexcept {
        sessions_rejected_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_frame_received() noexcept {
        frames_received_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_frame_delivered() noexcept {
        frames_delivered_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_frame_dropped() noexcept {
        frames_dropped_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_heartbeat() noexcept {
        heartbeats_sent_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_client_disconnect() noexcept {
        client_disconnects_.fetch_add(1, std::memory_order_relaxed);
    }

    /// Record a forwarded call and its latency
    void record_call(std::chrono::microseconds latency, bool failed) noexcept {
        calls_forwarded_.fetch_add(1, std::memory_order_relaxed);
        if (failed) {
            calls_failed_.fetch_add(1, std::memory_order_relaxed);
        }

        uint64_t latency_us = static_cast<uint64_t>(latency.count());
        total_call_latency_us_.fetch_add(latency_us, std::memory_order_relaxed);

        uint64_t current_max = max_call_latency_us_.load(std::memory_order_relaxed);
        while (latency_us > current_max) {
            if (max_call_latency_us_.compare_exchange_weak(current_max, latency_us,
                std::memory_order_relaxed, std::memory_order_relaxed)) {
                break;
            }
        }
    }

    [[nodiscard]] MetricsSnapshot snapshot() const noexcept {
        MetricsSnapshot snap;
        snap.sessions_opened = sessions_opened_.load(std::memory_order_relaxed);
        snap.sessions_closed = sessions_closed_.load(std::memory_order_relaxed);
        snap.sessions_rejected = sessions_rejected_.load(std::memory_order_relaxed);
        snap.frames_received = frames_received_.load(std::memory_order_relaxed);
        snap.frames_delivered = frames_delivered_.load(std::memory_order_relaxed);
        snap.frames_dropped = frames_dropped_.load(std::memory_order_relaxed);
        snap.heartbeats_sent = heartbeats_sent_.load(std::memory_order_relaxed);
        snap.client_disconnects = client_disconnects_.load(std::memory_order_relaxed);
        snap.calls_forwarded = calls_forwarded_.load(std::memory_order_relaxed);
        snap.calls_failed = calls_failed_.load(std::memory_order_relaxed);
        snap.total_call_latency_us = total_call_latency_us_.load(std::memory_order_relaxed);
        snap.max_call_latency_us = max_call_latency_us_.load(std::memory_order_relaxed);
        return snap;
    }

private:
    std::atomic<uint64_t> sessions_opened_{0};
    std::atomic<uint64_t> sessions_closed_{0};
    std::atomic<uint64_t> sessions_rejected_{0};

    std::atomic<uint64_t> frames_received_{0};
    std::atomic<uint64_t> frames_delivered_{0};
    std::atomic<uint64_t> frames_dropped_{0};
    std::atomic<uint64_t> heartbeats_sent_{0};
    std::atomic<uint64_t> client_disconnects_{0};

    std::atomic<uint64_t> calls_forwarded_{0};
    std::atomic<uint64_t> calls_failed_{0};
    std::atomic<uint64_t> total_call_latency_us_{0};
    std::atomic<uint64_t> max_call_latency_us_{0};
};

inline void to_json(nlohmann::json& j, const MetricsSnapshot& s) {
    j = nlohmann::json{
        {"sessions", {
            {"active", s.active_sessions()},
            {"opened", s.sessions_opened},
            {"closed", s.sessions_closed},
            {"rejected", s.sessions_rejected}
        }},
        {"frames", {
            {"received", s.frames_received},
            {"delivered", s.frames_delivered},
            {"dropped", s.frames_dropped},
            {"heartbeats", s.heartbeats_sent}
        }},
        {"client_disconnects", s.client_disconnects},
        {"calls", {
            {"forwarded", s.calls_forwarded},
            {"failed", s.calls_failed},
            {"avg_latency_us", s.avg_call_latency_us()},
            {"max_latency_us", s.max_call_latency_us}
        }}
    };
}

}  // namespace sluice::control
