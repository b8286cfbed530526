#include "concurrency_governor.h"
#include "network_quality_monitor.h"
#include "logger.h"

#include <algorithm>
#include <cmath>
#include <string>

ConcurrencyGovernor::ConcurrencyGovernor(NetworkQualityMonitor& monitor, const Config& config)
    : m_monitor(monitor), m_config(config) {
    if (m_config.success_window < 1) {
        m_config.success_window = 1;
    }
}

void ConcurrencyGovernor::register_job(const std::string& job_id, int target) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_job_targets[job_id] = std::max(1, target);
    apply_target_locked();
}

void ConcurrencyGovernor::unregister_job(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_job_targets.erase(job_id) == 0 || m_job_targets.empty()) {
        return;
    }
    apply_target_locked();
}

void ConcurrencyGovernor::apply_target_locked() {
    int target = 1;
    for (const auto& kv : m_job_targets) {
        target = std::max(target, kv.second);
    }
    m_target = target;
    if (m_current > m_target || m_healthy) {
        m_current = m_target;
    }
    LOG_DEBUG("GOV: Target concurrency " + std::to_string(m_target) + " (" +
              std::to_string(m_job_targets.size()) + " jobs), current " + std::to_string(m_current) +
              (m_healthy ? "" : ", degraded"));
}

void ConcurrencyGovernor::on_success() {
    int streak = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_consecutive_server_errors = 0;
        streak = ++m_consecutive_successes;

        if (streak % m_config.success_window == 0) {
            if (m_current < m_target) {
                ++m_current;
            }
            if (m_current >= m_target && !m_healthy) {
                m_healthy = true;
                LOG_INFO("GOV: Server healthy again, concurrency restored to " +
                         std::to_string(m_current));
            } else if (!m_healthy) {
                LOG_INFO("GOV: Recovering, concurrency " + std::to_string(m_current) +
                         "/" + std::to_string(m_target));
            }
        }
    }

    // Outside our lock: the monitor has its own
    if (streak % m_config.success_window == 0) {
        m_monitor.on_sustained_success(streak);
    }
}

void ConcurrencyGovernor::on_server_error() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_consecutive_successes = 0;
    ++m_consecutive_server_errors;

    const int min_concurrency = floor();
    if (m_consecutive_server_errors >= error_threshold() && m_current > min_concurrency) {
        const int previous = m_current;
        const int reduced = static_cast<int>(std::floor(m_current * reduction_factor()));
        m_current = std::max(min_concurrency, reduced);
        m_healthy = false;
        m_consecutive_server_errors = 0;
        LOG_WARN("GOV: Circuit breaker tripped, concurrency " + std::to_string(previous) +
                 " -> " + std::to_string(m_current));
    }
}

void ConcurrencyGovernor::on_failure() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_consecutive_successes = 0;
}

int ConcurrencyGovernor::current_concurrency() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
}

int ConcurrencyGovernor::target_concurrency() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_target;
}

bool ConcurrencyGovernor::is_healthy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_healthy;
}

size_t ConcurrencyGovernor::active_jobs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_job_targets.size();
}

int ConcurrencyGovernor::consecutive_successes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_consecutive_successes;
}

int ConcurrencyGovernor::consecutive_server_errors() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_consecutive_server_errors;
}
