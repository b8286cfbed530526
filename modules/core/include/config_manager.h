#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>

using json = nlohmann::json;

class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& text);
    void reset();

    // Overwrite (or create) a single value, e.g. {"upload", "max_retries"} -> 1
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);

    // Upload pipeline
    bool isLowResourceMode() const;
    double getSingleUploadThresholdMb() const;
    int getMaxRetries() const;
    int getBaseRetryDelayMs() const;
    int getBaseTimeoutMs() const;
    std::string getSnapshotPath() const;
    int getSnapshotTtlHours() const;

    // Network probing
    int getProbeTimeoutMs() const;
    double getDefaultBandwidthMbps() const;
    double getDefaultLatencyMs() const;
    bool hasConnectionHint() const;
    double getHintBandwidthMbps() const;
    double getHintLatencyMs() const;

    // Circuit breaker
    int getSuccessWindow() const;

    // Logging
    std::string getLogLevel() const;
    bool isAsyncLogging() const;

    // Local directory coordinator (CLI)
    std::string getCoordinatorRoot() const;
    int getTransferTtlHours() const;

private:
    ConfigManager() = default;

    json section(const char* name) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
};
