#include "progress_aggregator.h"

#include <algorithm>

ProgressAggregator::ProgressAggregator(uint64_t total_bytes, Listener listener)
    : m_total(total_bytes), m_listener(std::move(listener)) {}

void ProgressAggregator::seed_completed(uint64_t bytes) {
    double pct;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_completed_bytes = std::min(m_total, m_completed_bytes + bytes);
        pct = publish_locked();
    }
    deliver(pct);
}

void ProgressAggregator::on_bytes(uint32_t part_number, uint64_t delta) {
    if (delta == 0) return;
    double pct;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_in_flight[part_number] += delta;
        pct = publish_locked();
    }
    deliver(pct);
}

void ProgressAggregator::on_part_complete(uint32_t part_number, uint64_t part_length) {
    double pct;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_in_flight.erase(part_number);
        m_completed_bytes = std::min(m_total, m_completed_bytes + part_length);
        pct = publish_locked();
    }
    deliver(pct);
}

void ProgressAggregator::on_part_aborted(uint32_t part_number) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_in_flight.erase(part_number);
}

void ProgressAggregator::finish() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_in_flight.clear();
        m_completed_bytes = m_total;
        m_reported = 100.0;
    }
    deliver(100.0);
}

double ProgressAggregator::percent() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reported;
}

uint64_t ProgressAggregator::bytes_done() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    uint64_t done = m_completed_bytes;
    for (const auto& entry : m_in_flight) {
        done += entry.second;
    }
    return std::min(done, m_total);
}

double ProgressAggregator::publish_locked() {
    if (m_total == 0) {
        return m_reported;
    }
    uint64_t done = m_completed_bytes;
    for (const auto& entry : m_in_flight) {
        done += entry.second;
    }
    done = std::min(done, m_total);

    // 100 is reserved for finish(): the object is not assembled yet
    double pct = static_cast<double>(done) * 100.0 / static_cast<double>(m_total);
    pct = std::min(pct, 99.9);
    m_reported = std::max(m_reported, pct);
    return m_reported;
}

void ProgressAggregator::deliver(double pct) {
    if (!m_listener) return;
    // Listeners run outside m_mutex; this keeps their view monotonic too
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    if (pct <= m_delivered) return;
    m_delivered = pct;
    m_listener(pct);
}
