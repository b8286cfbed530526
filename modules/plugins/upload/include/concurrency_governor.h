#ifndef CONCURRENCY_GOVERNOR_H
#define CONCURRENCY_GOVERNOR_H

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

class NetworkQualityMonitor;

/**
 * CONCURRENCY GOVERNOR / CIRCUIT BREAKER
 *
 * Owns the number of part uploads allowed in flight.
 *
 *   healthy  --(threshold consecutive server errors, current > floor)-->  degraded
 *   degraded --(+1 per success window until current == target)-------->  healthy
 *
 * Every full success window also emits the chunk-growth signal to the
 * monitor. Shared by all schedulers of one engine, guarded by one mutex.
 * Each running job registers its own target; the effective target is the
 * largest registered one, so starting or finishing a job never lowers the
 * limit of another job or clears a tripped breaker.
 */
class ConcurrencyGovernor {
public:
    struct Config {
        bool low_resource_mode = false;
        int success_window = 5;
    };

    ConcurrencyGovernor(NetworkQualityMonitor& monitor, const Config& config);

    /**
     * Register (or update) the target of a running job.
     * Lowers current when the effective target drops below it; raises it
     * only while healthy. Health is never reset here.
     */
    void register_job(const std::string& job_id, int target);

    // Drop a finished job's target. The last effective target is kept when no job is left.
    void unregister_job(const std::string& job_id);

    void on_success();
    void on_server_error();
    // Any other failure: only breaks the success streak
    void on_failure();

    int current_concurrency() const;
    int target_concurrency() const;
    size_t active_jobs() const;
    bool is_healthy() const;
    int consecutive_successes() const;
    int consecutive_server_errors() const;

    int floor() const { return m_config.low_resource_mode ? 1 : 2; }
    int error_threshold() const { return m_config.low_resource_mode ? 2 : 5; }
    double reduction_factor() const { return m_config.low_resource_mode ? 0.3 : 0.5; }

private:
    void apply_target_locked();

    NetworkQualityMonitor& m_monitor;
    Config m_config;

    mutable std::mutex m_mutex;
    int m_target = 1;
    int m_current = 1;
    int m_consecutive_successes = 0;
    int m_consecutive_server_errors = 0;
    bool m_healthy = true;
    std::map<std::string, int> m_job_targets;
};

#endif // CONCURRENCY_GOVERNOR_H
