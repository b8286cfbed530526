#ifndef RETRY_POLICY_H
#define RETRY_POLICY_H

#include "upload_types.h"
#include <cstdint>

class NetworkQualityMonitor;

/**
 * Single retry/backoff policy for part uploads.
 * Delays follow the monitor's current tier; server-class failures wait
 * longer so an overloaded coordinator gets room to recover.
 */
class RetryPolicy {
public:
    struct Config {
        int max_retries = DEFAULT_MAX_RETRIES;
        int64_t base_delay_ms = DEFAULT_BASE_RETRY_DELAY_MS;
        bool low_resource_mode = false;
    };

    RetryPolicy(const NetworkQualityMonitor& monitor, const Config& config);

    // attempt is 0-based: attempt 0 failed -> should_retry(kind, 0)
    bool should_retry(UploadErrorKind kind, int attempt) const;

    int64_t delay_ms(UploadErrorKind kind, int attempt) const;

    int max_retries() const { return m_config.max_retries; }
    int max_attempts() const { return m_config.max_retries + 1; }

private:
    const NetworkQualityMonitor& m_monitor;
    Config m_config;
};

#endif // RETRY_POLICY_H
