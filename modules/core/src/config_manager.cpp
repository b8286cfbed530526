#include "config_manager.h"
#include "logger.h"
#include <fstream>

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            LOG_ERROR("CFG: Failed to open config file: " + config_path);
            return false;
        }
        json parsed;
        config_file >> parsed;
        if (!parsed.is_object()) {
            LOG_ERROR("CFG: Config root must be an object: " + config_path);
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_config = std::move(parsed);
        }
        LOG_INFO("CFG: Configuration loaded successfully from: " + config_path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("CFG: Config loading failed: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("CFG: Config parsing failed: " + std::string(e.what()));
        return false;
    }
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = json::object();
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& child = (*node)[path[i]];
        if (child.is_null()) {
            child = json::object();
        }
        if (!child.is_object()) {
            LOG_WARN("CFG: Cannot descend into non-object key: " + path[i]);
            return false;
        }
        node = &child;
    }
    (*node)[path.back()] = value;
    return true;
}

json ConfigManager::section(const char* name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_config.find(name);
    if (it == m_config.end() || !it->is_object()) {
        return json::object();
    }
    return *it;
}

bool ConfigManager::isLowResourceMode() const {
    return section("upload").value("low_resource_mode", false);
}

double ConfigManager::getSingleUploadThresholdMb() const {
    return section("upload").value("single_upload_threshold_mb", 5.0);
}

int ConfigManager::getMaxRetries() const {
    return section("upload").value("max_retries", 3);
}

int ConfigManager::getBaseRetryDelayMs() const {
    return section("upload").value("base_retry_delay_ms", 1000);
}

int ConfigManager::getBaseTimeoutMs() const {
    return section("upload").value("base_timeout_ms", 60000);
}

std::string ConfigManager::getSnapshotPath() const {
    return section("upload").value("snapshot_path", std::string("chunklift_session.json"));
}

int ConfigManager::getSnapshotTtlHours() const {
    return section("upload").value("snapshot_ttl_hours", 168);
}

int ConfigManager::getProbeTimeoutMs() const {
    return section("network").value("probe_timeout_ms", 2000);
}

double ConfigManager::getDefaultBandwidthMbps() const {
    return section("network").value("default_bandwidth_mbps", 5.0);
}

double ConfigManager::getDefaultLatencyMs() const {
    return section("network").value("default_latency_ms", 100.0);
}

bool ConfigManager::hasConnectionHint() const {
    json net = section("network");
    return net.contains("hint_bandwidth_mbps") && net.contains("hint_latency_ms");
}

double ConfigManager::getHintBandwidthMbps() const {
    return section("network").value("hint_bandwidth_mbps", getDefaultBandwidthMbps());
}

double ConfigManager::getHintLatencyMs() const {
    return section("network").value("hint_latency_ms", getDefaultLatencyMs());
}

int ConfigManager::getSuccessWindow() const {
    return section("circuit_breaker").value("success_window", 5);
}

std::string ConfigManager::getLogLevel() const {
    return section("logging").value("level", std::string("info"));
}

bool ConfigManager::isAsyncLogging() const {
    return section("logging").value("async", false);
}

std::string ConfigManager::getCoordinatorRoot() const {
    return section("coordinator").value("root", std::string("chunklift_store"));
}

int ConfigManager::getTransferTtlHours() const {
    return section("coordinator").value("transfer_ttl_hours", 168);
}
