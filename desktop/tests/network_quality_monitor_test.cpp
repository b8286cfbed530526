#include "network_quality_monitor.h"
#include "logger.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool test_classification() {
    TEST_ASSERT(NetworkQualityMonitor::classify(100, 20) == QualityTier::EXCELLENT, "100 Mbps / 20 ms");
    TEST_ASSERT(NetworkQualityMonitor::classify(50, 49) == QualityTier::EXCELLENT, "boundary 50 / 49");
    TEST_ASSERT(NetworkQualityMonitor::classify(50, 50) == QualityTier::GOOD, "50 ms is not excellent");
    TEST_ASSERT(NetworkQualityMonitor::classify(25, 99) == QualityTier::GOOD, "25 / 99");
    TEST_ASSERT(NetworkQualityMonitor::classify(10, 199) == QualityTier::FAIR, "10 / 199");
    TEST_ASSERT(NetworkQualityMonitor::classify(5, 100) == QualityTier::POOR, "default probe is poor");
    TEST_ASSERT(NetworkQualityMonitor::classify(0.5, 100) == QualityTier::UNSTABLE, "under 1 Mbps");
    TEST_ASSERT(NetworkQualityMonitor::classify(100, 600) == QualityTier::UNSTABLE, "high latency");
    return true;
}

static bool test_measure_fallbacks() {
    NetworkQualityMonitor::Config cfg;
    cfg.probe_timeout_ms = 50;

    NetworkQualityMonitor no_hint(cfg);
    NetworkSample s = no_hint.measure();
    TEST_ASSERT(s.bandwidth_mbps == 5.0 && s.latency_ms == 100.0, "defaults without a hint");
    TEST_ASSERT(no_hint.quality() == QualityTier::POOR, "defaults classify as poor");

    NetworkQualityMonitor hinted(cfg, [](NetworkSample& out) {
        out.bandwidth_mbps = 80.0;
        out.latency_ms = 10.0;
        return true;
    });
    s = hinted.measure();
    TEST_ASSERT(s.bandwidth_mbps == 80.0, "hint is used");
    TEST_ASSERT(hinted.quality() == QualityTier::EXCELLENT, "hint classifies");

    NetworkQualityMonitor throwing(cfg, [](NetworkSample&) -> bool {
        throw std::runtime_error("no interface");
    });
    s = throwing.measure();
    TEST_ASSERT(s.bandwidth_mbps == 5.0, "throwing hint falls back");

    NetworkQualityMonitor slow(cfg, [](NetworkSample& out) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        out.bandwidth_mbps = 80.0;
        out.latency_ms = 10.0;
        return true;
    });
    const auto started = std::chrono::steady_clock::now();
    s = slow.measure();
    const auto took = std::chrono::steady_clock::now() - started;
    TEST_ASSERT(s.bandwidth_mbps == 5.0, "slow hint falls back");
    TEST_ASSERT(took < std::chrono::milliseconds(250), "measure is bounded by the probe timeout");
    return true;
}

// State the slow provider writes after the caller has given up on it
struct HintRecord {
    std::atomic<int> calls{0};
    std::atomic<bool> returned{false};
};

static bool test_slow_hint_joined_on_destruction() {
    NetworkQualityMonitor::Config cfg;
    cfg.probe_timeout_ms = 20;
    HintRecord record;
    {
        NetworkQualityMonitor monitor(cfg, [&record](NetworkSample& out) {
            ++record.calls;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            out.bandwidth_mbps = 80.0;
            out.latency_ms = 10.0;
            record.returned = true;
            return true;
        });
        NetworkSample s = monitor.measure();
        TEST_ASSERT(s.bandwidth_mbps == 5.0, "timed out hint falls back");
        s = monitor.measure();
        TEST_ASSERT(s.bandwidth_mbps == 5.0, "defaults while the first hint is still running");
        TEST_ASSERT(record.calls.load() == 1, "running hint is not started again");
        TEST_ASSERT(!record.returned.load(), "hint still in progress");
    }
    TEST_ASSERT(record.returned.load(), "destruction waits for the hint to return");
    TEST_ASSERT(record.calls.load() == 1, "one hint call in total");
    return true;
}

static bool test_chunk_sizes() {
    NetworkQualityMonitor::Config cfg;
    NetworkQualityMonitor m(cfg);

    TEST_ASSERT(m.adaptive_chunk_size(3 * MIB) == 3 * MIB, "small file is one chunk");
    TEST_ASSERT(m.is_single_upload(3 * MIB), "small file single upload");
    TEST_ASSERT(!m.is_single_upload(12 * MIB), "12 MiB is multipart at the default threshold");

    const QualityTier tiers[] = {QualityTier::EXCELLENT, QualityTier::GOOD, QualityTier::FAIR,
                                 QualityTier::POOR, QualityTier::UNSTABLE};
    const uint64_t sizes[] = {20 * MIB, 500 * MIB, 5 * GIB, 40 * GIB};
    for (QualityTier tier : tiers) {
        m.set_quality(tier);
        for (uint64_t size : sizes) {
            for (uint32_t part = 1; part <= 3; ++part) {
                TEST_ASSERT(m.adaptive_chunk_size(size, part) == 5 * MIB, "probe parts are 5 MiB");
            }
            const uint64_t base = m.adaptive_chunk_size(size, 4);
            TEST_ASSERT(base >= MIN_PART_SIZE && base <= MAX_PART_SIZE, "base within part limits");
        }
    }

    m.set_quality(QualityTier::FAIR);
    TEST_ASSERT(m.adaptive_chunk_size(500 * MIB, 4) == 8 * MIB, "fair 500 MiB -> 8 MiB");
    TEST_ASSERT(m.adaptive_chunk_size(5 * GIB, 4) == 15 * MIB, "fair 5 GiB -> 15 MiB");
    m.set_quality(QualityTier::EXCELLENT);
    TEST_ASSERT(m.adaptive_chunk_size(40 * GIB, 4) == 45 * MIB, "excellent 40 GiB -> 45 MiB");
    m.set_quality(QualityTier::UNSTABLE);
    TEST_ASSERT(m.adaptive_chunk_size(20 * MIB, 4) == 5 * MIB, "clamped to the 5 MiB minimum");
    return true;
}

static bool test_threshold_raised() {
    NetworkQualityMonitor::Config cfg;
    cfg.single_upload_threshold = 16 * MIB;
    NetworkQualityMonitor m(cfg);
    TEST_ASSERT(m.is_single_upload(12 * MIB), "12 MiB single with a 16 MiB threshold");
    TEST_ASSERT(!m.plan_layout(12 * MIB).is_planned(), "no layout for single uploads");
    return true;
}

static bool test_good_network_200mib() {
    NetworkQualityMonitor::Config cfg;
    NetworkQualityMonitor m(cfg);
    m.set_quality(QualityTier::GOOD);

    const uint64_t size = 200 * MIB;
    ChunkLayout layout = m.plan_layout(size);
    TEST_ASSERT(layout.is_planned(), "200 MiB is multipart");
    TEST_ASSERT(layout.probe_size == 5 * MIB, "probe size");
    TEST_ASSERT(layout.base_size >= 8 * MIB && layout.base_size < 16 * MIB, "8 MiB-class base chunks");

    const uint32_t parts = layout.total_parts(size);
    TEST_ASSERT(parts >= 15 && parts <= 30, "about 25 parts, got " + std::to_string(parts));

    const int c = m.adaptive_concurrency(size, parts, false);
    TEST_ASSERT(c >= 1 && c <= 12, "concurrency within [1,12]");
    TEST_ASSERT(c == 4, "good: round(min(6, max(3, ceil(n*0.1))) * 1.2) = 4, got " + std::to_string(c));
    return true;
}

static bool test_concurrency_brackets() {
    NetworkQualityMonitor::Config cfg;
    NetworkQualityMonitor m(cfg);
    m.set_quality(QualityTier::FAIR);

    TEST_ASSERT(m.adaptive_concurrency(50 * MIB, 10, false) == 4, "<100 MiB caps at 4");
    TEST_ASSERT(m.adaptive_concurrency(50 * MIB, 1, false) == 2, "<100 MiB floor 2");
    TEST_ASSERT(m.adaptive_concurrency(5 * GIB, 400, false) == 8, "<10 GiB caps at 8");
    TEST_ASSERT(m.adaptive_concurrency(40 * GIB, 1000, false) == 12, ">=10 GiB caps at 12");
    TEST_ASSERT(m.adaptive_concurrency(40 * GIB, 1000, true) == 3, "low resource caps at 3");

    m.set_quality(QualityTier::EXCELLENT);
    TEST_ASSERT(m.adaptive_concurrency(40 * GIB, 1000, false) == 12, "clamped to 12");
    TEST_ASSERT(m.adaptive_concurrency(40 * GIB, 1000, true) == 4, "low resource clamped to 4");

    m.set_quality(QualityTier::UNSTABLE);
    TEST_ASSERT(m.adaptive_concurrency(40 * MIB, 1, true) == 1, "never below 1");
    return true;
}

static bool test_retry_and_timeout() {
    NetworkQualityMonitor::Config cfg;
    NetworkQualityMonitor m(cfg);

    m.set_quality(QualityTier::FAIR);
    TEST_ASSERT(m.adaptive_retry_delay_ms(1000, 0) == 1000, "fair attempt 0");
    TEST_ASSERT(m.adaptive_retry_delay_ms(1000, 2) == 4000, "fair attempt 2");
    TEST_ASSERT(m.adaptive_retry_delay_ms(1000, 10) == 30000, "capped at 30 s");

    m.set_quality(QualityTier::UNSTABLE);
    TEST_ASSERT(m.adaptive_retry_delay_ms(1000, 1) == 9000, "unstable: 1000*2*3*1.5");
    TEST_ASSERT(m.adaptive_retry_delay_ms(1000, 5) == 60000, "degraded cap 60 s");

    m.set_quality(QualityTier::GOOD);
    TEST_ASSERT(m.adaptive_timeout_ms(60000, 1) == 90000, "probe parts get 1.5x");
    TEST_ASSERT(m.adaptive_timeout_ms(60000, 4) == 60000, "good later parts");
    m.set_quality(QualityTier::UNSTABLE);
    TEST_ASSERT(m.adaptive_timeout_ms(60000, 1) == 180000, "capped at 180 s");
    return true;
}

static bool test_samples_and_growth() {
    NetworkQualityMonitor::Config cfg;
    NetworkQualityMonitor m(cfg);
    m.set_quality(QualityTier::FAIR);

    for (int i = 0; i < 12; ++i) {
        m.record_sample(12.0);
    }
    TEST_ASSERT(m.samples().size() == SAMPLE_WINDOW, "ring keeps 10 samples");
    TEST_ASSERT(m.quality() == QualityTier::FAIR, "steady samples keep the tier");

    // One collapse pulls the average down by more than 30 % relative to it
    m.record_sample(0.5);
    TEST_ASSERT(m.quality() == QualityTier::FAIR, "average 10.85 Mbps is still fair");
    for (int i = 0; i < 9; ++i) {
        m.record_sample(0.5);
    }
    TEST_ASSERT(m.quality() == QualityTier::UNSTABLE || m.quality() == QualityTier::POOR,
                "sustained slowdown degrades the tier");

    m.set_quality(QualityTier::GOOD);
    m.on_sustained_success(5);
    TEST_ASSERT(m.growth_multiplier() == 1.25, "+25% after 5 successes");
    m.on_sustained_success(40);
    TEST_ASSERT(m.growth_multiplier() == 2.0, "capped at 2x");
    m.set_quality(QualityTier::POOR);
    TEST_ASSERT(m.growth_multiplier() == 1.0, "reset on a poor network");
    m.on_sustained_success(10);
    TEST_ASSERT(m.growth_multiplier() == 1.0, "no growth while poor");
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    std::cout << "--- NetworkQualityMonitor tests ---" << std::endl;

    if (test_classification()) std::cout << "PASS: classification" << std::endl;
    if (test_measure_fallbacks()) std::cout << "PASS: measure fallbacks" << std::endl;
    if (test_slow_hint_joined_on_destruction()) std::cout << "PASS: slow hint joined on destruction" << std::endl;
    if (test_chunk_sizes()) std::cout << "PASS: chunk sizes" << std::endl;
    if (test_threshold_raised()) std::cout << "PASS: raised single-upload threshold" << std::endl;
    if (test_good_network_200mib()) std::cout << "PASS: 200 MiB on a good network" << std::endl;
    if (test_concurrency_brackets()) std::cout << "PASS: concurrency brackets" << std::endl;
    if (test_retry_and_timeout()) std::cout << "PASS: retry delay and timeout" << std::endl;
    if (test_samples_and_growth()) std::cout << "PASS: samples and chunk growth" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
