#ifndef NETWORK_QUALITY_MONITOR_H
#define NETWORK_QUALITY_MONITOR_H

#include "upload_types.h"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/**
 * NETWORK QUALITY MONITOR
 *
 * Measures bandwidth/latency, classifies the connection into a quality tier
 * and derives the adaptive upload parameters (chunk size, concurrency,
 * retry delay, timeout) from it.
 *
 * One instance per upload engine, shared by every scheduler of that engine.
 * All state is guarded by a single mutex.
 */
class NetworkQualityMonitor {
public:
    // Best-effort connection hint (e.g. an OS or configured estimate).
    // Returns false when no hint is available. Runs on a thread owned by the
    // monitor; the destructor waits for a call still in progress.
    using HintProvider = std::function<bool(NetworkSample& out)>;

    struct Config {
        int probe_timeout_ms = 2000;
        double default_bandwidth_mbps = 5.0;
        double default_latency_ms = 100.0;
        uint64_t single_upload_threshold = MIN_PART_SIZE;
        int success_window = 5;
    };

    explicit NetworkQualityMonitor(const Config& config, HintProvider hint = nullptr);
    ~NetworkQualityMonitor();

    /**
     * Probe the connection. Never fails: falls back to the configured default
     * when the hint provider is missing, fails, throws or exceeds probe_timeout_ms.
     * A hint call that overran its timeout is not restarted until it returns.
     */
    NetworkSample measure();

    static QualityTier classify(double bandwidth_mbps, double latency_ms);

    /**
     * Chunk size for a part. part_number 0 asks for the base (non-probe) size.
     * Returns file_size when the file is below the single-upload threshold.
     */
    uint64_t adaptive_chunk_size(uint64_t file_size, uint32_t part_number = 0) const;

    // true when one direct upload should be used instead of a multipart session
    bool is_single_upload(uint64_t file_size) const;

    // Layout for a new multipart job (probe parts + adaptive base size)
    ChunkLayout plan_layout(uint64_t file_size) const;

    int adaptive_concurrency(uint64_t file_size, uint32_t total_chunks, bool low_resource_mode) const;
    int64_t adaptive_retry_delay_ms(int64_t base_delay_ms, int attempt) const;
    int64_t adaptive_timeout_ms(int64_t base_timeout_ms, uint32_t part_number) const;

    // Throughput of a finished attempt; re-derives the tier on a >30% deviation
    void record_sample(double speed_mbps);

    // Chunk-growth signal: +25% per success window, capped at 2x
    void on_sustained_success(int consecutive_successes);

    void set_quality(QualityTier tier);
    QualityTier quality() const;
    double growth_multiplier() const;
    NetworkSample last_measurement() const;
    std::vector<double> samples() const;

private:
    struct HintCall;

    Config m_config;
    HintProvider m_hint_provider;

    std::mutex m_hint_mutex;
    std::thread m_hint_thread;
    std::shared_ptr<HintCall> m_hint_call;

    mutable std::mutex m_mutex;
    QualityTier m_quality = QualityTier::GOOD;
    NetworkSample m_last{};
    std::deque<double> m_samples;
    std::deque<NetworkSample> m_probe_history;
    double m_growth_multiplier = 1.0;

    void apply_measurement_locked(const NetworkSample& sample);
    static double chunk_multiplier(QualityTier tier);
    static double concurrency_multiplier(QualityTier tier);
    static double retry_multiplier(QualityTier tier);
    static double timeout_multiplier(QualityTier tier);
    static bool is_degraded(QualityTier tier);
};

#endif // NETWORK_QUALITY_MONITOR_H
