#ifndef PROGRESS_AGGREGATOR_H
#define PROGRESS_AGGREGATOR_H

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

/**
 * Byte-level progress of one job, fed by discrete part events.
 *
 * In-flight bytes of a part count toward progress; when an attempt is
 * aborted its bytes are withdrawn, but the reported percentage never goes
 * down. Owned by the scheduler, called from worker threads.
 */
class ProgressAggregator {
public:
    using Listener = std::function<void(double percent)>;

    explicit ProgressAggregator(uint64_t total_bytes, Listener listener = nullptr);

    // Bytes of parts finished in an earlier run
    void seed_completed(uint64_t bytes);

    void on_bytes(uint32_t part_number, uint64_t delta);
    void on_part_complete(uint32_t part_number, uint64_t part_length);
    void on_part_aborted(uint32_t part_number);
    void finish();

    double percent() const;
    uint64_t bytes_done() const;
    uint64_t total_bytes() const { return m_total; }

private:
    double publish_locked();
    void deliver(double pct);

    uint64_t m_total;
    Listener m_listener;

    mutable std::mutex m_mutex;
    uint64_t m_completed_bytes = 0;
    std::map<uint32_t, uint64_t> m_in_flight;
    double m_reported = 0.0;

    std::mutex m_listener_mutex;
    double m_delivered = -1.0;
};

#endif // PROGRESS_AGGREGATOR_H
