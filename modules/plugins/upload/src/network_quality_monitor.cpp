#include "network_quality_monitor.h"
#include "logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <sstream>

struct NetworkQualityMonitor::HintCall {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool ok = false;
    NetworkSample sample;

    bool finished() {
        std::lock_guard<std::mutex> lock(mutex);
        return done;
    }
};

namespace {

std::string describe(const NetworkSample& s) {
    std::ostringstream oss;
    oss.precision(1);
    oss << std::fixed << s.bandwidth_mbps << " Mbps, " << s.latency_ms << " ms";
    return oss.str();
}

} // namespace

NetworkQualityMonitor::NetworkQualityMonitor(const Config& config, HintProvider hint)
    : m_config(config), m_hint_provider(std::move(hint)) {
    m_last.bandwidth_mbps = m_config.default_bandwidth_mbps;
    m_last.latency_ms = m_config.default_latency_ms;
}

NetworkQualityMonitor::~NetworkQualityMonitor() {
    std::lock_guard<std::mutex> lock(m_hint_mutex);
    if (m_hint_thread.joinable()) {
        if (!m_hint_call->finished()) {
            LOG_DEBUG("NET: Waiting for connection hint to return");
        }
        m_hint_thread.join();
    }
}

// ============================================================================
// MEASUREMENT
// ============================================================================

NetworkSample NetworkQualityMonitor::measure() {
    NetworkSample result{m_config.default_bandwidth_mbps, m_config.default_latency_ms};

    std::shared_ptr<HintCall> call;
    if (m_hint_provider) {
        std::lock_guard<std::mutex> hint_lock(m_hint_mutex);
        if (m_hint_call && !m_hint_call->finished()) {
            LOG_WARN("NET: Previous connection hint still running, using defaults");
        } else {
            if (m_hint_thread.joinable()) {
                m_hint_thread.join();
            }
            // The provider runs on its own thread so a hung hint source cannot
            // hold the caller longer than probe_timeout_ms.
            call = std::make_shared<HintCall>();
            m_hint_call = call;
            HintProvider provider = m_hint_provider;
            m_hint_thread = std::thread([call, provider]() {
                NetworkSample sample;
                bool ok = false;
                try {
                    ok = provider(sample);
                } catch (const std::exception& e) {
                    LOG_WARN("NET: Connection hint failed: " + std::string(e.what()));
                    ok = false;
                }
                {
                    std::lock_guard<std::mutex> lock(call->mutex);
                    call->done = true;
                    call->ok = ok;
                    call->sample = sample;
                }
                call->cv.notify_all();
            });
        }
    }

    if (call) {
        std::unique_lock<std::mutex> lock(call->mutex);
        bool finished = call->cv.wait_for(lock, std::chrono::milliseconds(m_config.probe_timeout_ms),
                                          [&call] { return call->done; });
        if (!finished) {
            LOG_WARN("NET: Connection hint timed out after " +
                     std::to_string(m_config.probe_timeout_ms) + " ms, using defaults");
        } else if (call->ok && call->sample.bandwidth_mbps > 0.0 && call->sample.latency_ms >= 0.0) {
            result = call->sample;
        } else {
            LOG_DEBUG("NET: No connection hint available, using defaults");
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    apply_measurement_locked(result);
    LOG_INFO("NET: Measured " + describe(result) + " -> " + quality_tier_name(m_quality));
    return result;
}

void NetworkQualityMonitor::apply_measurement_locked(const NetworkSample& sample) {
    m_last = sample;
    m_quality = classify(sample.bandwidth_mbps, sample.latency_ms);
    m_probe_history.push_back(sample);
    if (m_probe_history.size() > SAMPLE_WINDOW) {
        m_probe_history.pop_front();
    }
    if (is_degraded(m_quality)) {
        m_growth_multiplier = 1.0;
    }
}

QualityTier NetworkQualityMonitor::classify(double bandwidth_mbps, double latency_ms) {
    if (bandwidth_mbps >= 50.0 && latency_ms < 50.0) return QualityTier::EXCELLENT;
    if (bandwidth_mbps >= 25.0 && latency_ms < 100.0) return QualityTier::GOOD;
    if (bandwidth_mbps >= 10.0 && latency_ms < 200.0) return QualityTier::FAIR;
    if (bandwidth_mbps >= 1.0 && latency_ms < 500.0) return QualityTier::POOR;
    return QualityTier::UNSTABLE;
}

// ============================================================================
// ADAPTIVE PARAMETERS
// ============================================================================

uint64_t NetworkQualityMonitor::adaptive_chunk_size(uint64_t file_size, uint32_t part_number) const {
    if (file_size < m_config.single_upload_threshold) {
        return file_size;
    }

    if (part_number >= 1 && part_number <= PROBE_PARTS) {
        return PROBE_PART_SIZE;
    }

    uint64_t base;
    if (file_size < 100 * MIB) {
        base = 5 * MIB;
    } else if (file_size < GIB) {
        base = 8 * MIB;
    } else if (file_size < 10 * GIB) {
        base = 15 * MIB;
    } else {
        base = 25 * MIB;
    }

    double multiplier;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        multiplier = chunk_multiplier(m_quality) * m_growth_multiplier;
    }

    const auto scaled = static_cast<uint64_t>(std::llround(static_cast<double>(base) * multiplier));
    return std::max(MIN_PART_SIZE, std::min(MAX_PART_SIZE, scaled));
}

bool NetworkQualityMonitor::is_single_upload(uint64_t file_size) const {
    return adaptive_chunk_size(file_size, 0) >= file_size;
}

ChunkLayout NetworkQualityMonitor::plan_layout(uint64_t file_size) const {
    ChunkLayout layout;
    if (is_single_upload(file_size)) {
        return layout;
    }
    layout.probe_size = adaptive_chunk_size(file_size, 1);
    layout.base_size = adaptive_chunk_size(file_size, 0);
    layout.probe_parts = PROBE_PARTS;
    return layout;
}

int NetworkQualityMonitor::adaptive_concurrency(uint64_t file_size, uint32_t total_chunks,
                                                bool low_resource_mode) const {
    const int n = static_cast<int>(total_chunks);
    auto ceil_frac = [n](double f) { return static_cast<int>(std::ceil(n * f)); };

    int base;
    if (low_resource_mode) {
        base = std::min(3, std::max(1, ceil_frac(0.05)));
    } else if (file_size < 100 * MIB) {
        base = std::min(4, std::max(2, n));
    } else if (file_size < GIB) {
        base = std::min(6, std::max(3, ceil_frac(0.1)));
    } else if (file_size < 10 * GIB) {
        base = std::min(8, std::max(4, ceil_frac(0.08)));
    } else {
        base = std::min(12, std::max(6, ceil_frac(0.04)));
    }

    double multiplier;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        multiplier = concurrency_multiplier(m_quality);
    }

    const int adaptive = static_cast<int>(std::lround(base * multiplier));
    const int max_concurrency = low_resource_mode ? MAX_CONCURRENCY_LOW_RESOURCE : MAX_CONCURRENCY;
    return std::max(1, std::min(max_concurrency, adaptive));
}

int64_t NetworkQualityMonitor::adaptive_retry_delay_ms(int64_t base_delay_ms, int attempt) const {
    QualityTier tier;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        tier = m_quality;
    }

    // Slow networks also get a linear penalty: +50% per retry
    double progressive = 1.0;
    if (is_degraded(tier)) {
        progressive = 1.0 + attempt * 0.5;
    }

    const double cap = is_degraded(tier) ? 60000.0 : 30000.0;
    const double delay = static_cast<double>(base_delay_ms) * std::pow(2.0, attempt) *
                         retry_multiplier(tier) * progressive;
    return static_cast<int64_t>(std::min(delay, cap));
}

int64_t NetworkQualityMonitor::adaptive_timeout_ms(int64_t base_timeout_ms, uint32_t part_number) const {
    double multiplier;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        multiplier = timeout_multiplier(m_quality);
    }
    // First parts are probing the network
    if (part_number <= PROBE_PARTS) {
        multiplier *= 1.5;
    }
    const double timeout = static_cast<double>(base_timeout_ms) * multiplier;
    return static_cast<int64_t>(std::min(timeout, static_cast<double>(MAX_TIMEOUT_MS)));
}

// ============================================================================
// FEEDBACK
// ============================================================================

void NetworkQualityMonitor::record_sample(double speed_mbps) {
    if (!(speed_mbps > 0.0)) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_samples.push_back(speed_mbps);
    if (m_samples.size() > SAMPLE_WINDOW) {
        m_samples.pop_front();
    }

    double sum = 0.0;
    for (double s : m_samples) sum += s;
    const double avg = sum / static_cast<double>(m_samples.size());
    if (avg <= 0.0) return;

    const double variation = std::fabs(speed_mbps - avg) / avg;
    if (variation > 0.3) {
        QualityTier previous = m_quality;
        m_last.bandwidth_mbps = avg;
        m_quality = classify(avg, m_last.latency_ms);
        if (is_degraded(m_quality)) {
            m_growth_multiplier = 1.0;
        }
        if (previous != m_quality) {
            LOG_INFO("NET: Quality changed " + std::string(quality_tier_name(previous)) + " -> " +
                     quality_tier_name(m_quality) + " (avg " + std::to_string(avg) + " Mbps)");
        }
    }
}

void NetworkQualityMonitor::on_sustained_success(int consecutive_successes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (is_degraded(m_quality)) {
        m_growth_multiplier = 1.0;
        return;
    }
    const int window = std::max(1, m_config.success_window);
    if (consecutive_successes < window) return;

    const int increments = consecutive_successes / window;
    const double next = std::min(1.0 + increments * 0.25, 2.0);
    if (next != m_growth_multiplier) {
        m_growth_multiplier = next;
        LOG_DEBUG("NET: Chunk growth multiplier " + std::to_string(next) + " after " +
                  std::to_string(consecutive_successes) + " consecutive successes");
    }
}

void NetworkQualityMonitor::set_quality(QualityTier tier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_quality = tier;
    if (is_degraded(tier)) {
        m_growth_multiplier = 1.0;
    }
}

QualityTier NetworkQualityMonitor::quality() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_quality;
}

double NetworkQualityMonitor::growth_multiplier() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_growth_multiplier;
}

NetworkSample NetworkQualityMonitor::last_measurement() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last;
}

std::vector<double> NetworkQualityMonitor::samples() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<double>(m_samples.begin(), m_samples.end());
}

// ============================================================================
// TIER MULTIPLIERS
// ============================================================================

double NetworkQualityMonitor::chunk_multiplier(QualityTier tier) {
    switch (tier) {
        case QualityTier::EXCELLENT: return 1.8;
        case QualityTier::GOOD: return 1.4;
        case QualityTier::FAIR: return 1.0;
        case QualityTier::POOR: return 0.8;
        case QualityTier::UNSTABLE: return 0.7;
    }
    return 1.0;
}

double NetworkQualityMonitor::concurrency_multiplier(QualityTier tier) {
    switch (tier) {
        case QualityTier::EXCELLENT: return 1.5;
        case QualityTier::GOOD: return 1.2;
        case QualityTier::FAIR: return 1.0;
        case QualityTier::POOR: return 0.8;
        case QualityTier::UNSTABLE: return 0.5;
    }
    return 1.0;
}

double NetworkQualityMonitor::retry_multiplier(QualityTier tier) {
    switch (tier) {
        case QualityTier::EXCELLENT: return 0.5;
        case QualityTier::GOOD: return 0.8;
        case QualityTier::FAIR: return 1.0;
        case QualityTier::POOR: return 1.5;
        case QualityTier::UNSTABLE: return 3.0;
    }
    return 1.0;
}

double NetworkQualityMonitor::timeout_multiplier(QualityTier tier) {
    switch (tier) {
        case QualityTier::EXCELLENT: return 0.8;
        case QualityTier::GOOD: return 1.0;
        case QualityTier::FAIR: return 1.2;
        case QualityTier::POOR: return 2.0;
        case QualityTier::UNSTABLE: return 3.0;
    }
    return 1.0;
}

bool NetworkQualityMonitor::is_degraded(QualityTier tier) {
    return tier == QualityTier::POOR || tier == QualityTier::UNSTABLE;
}
