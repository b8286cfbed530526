#include "retry_policy.h"
#include "network_quality_monitor.h"

RetryPolicy::RetryPolicy(const NetworkQualityMonitor& monitor, const Config& config)
    : m_monitor(monitor), m_config(config) {
    if (m_config.max_retries < 0) {
        m_config.max_retries = 0;
    }
    if (m_config.base_delay_ms < 0) {
        m_config.base_delay_ms = 0;
    }
}

bool RetryPolicy::should_retry(UploadErrorKind kind, int attempt) const {
    if (!is_retryable(kind)) {
        return false;
    }
    return attempt < m_config.max_retries;
}

int64_t RetryPolicy::delay_ms(UploadErrorKind kind, int attempt) const {
    int64_t delay = m_monitor.adaptive_retry_delay_ms(m_config.base_delay_ms, attempt);
    if (kind == UploadErrorKind::SERVER_ERROR) {
        delay *= m_config.low_resource_mode ? 5 : 3;
    }
    return delay;
}
