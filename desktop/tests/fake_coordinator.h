#ifndef FAKE_COORDINATOR_H
#define FAKE_COORDINATOR_H

#include "transfer_coordinator.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

/**
 * Scripted in-memory coordinator for tests: injects failures and latency
 * per part and records every call.
 */
class FakeCoordinator : public TransferCoordinator {
public:
    struct Failure {
        CoordinatorOutcome outcome;
        int status;
    };

    // Queue `times` failures for a part (0 = every part without its own script)
    void script_part(uint32_t part_number, CoordinatorOutcome outcome, int status, int times) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (int i = 0; i < times; ++i) {
            m_script[part_number].push_back(Failure{outcome, status});
        }
    }

    void set_latency(std::chrono::milliseconds latency) { m_latency_ms = static_cast<int>(latency.count()); }

    // Parts beyond the limit block until aborted (-1 = unlimited)
    void set_accept_limit(int limit) { m_accept_limit = limit; }

    // Invoked at the start of every upload_part call
    void set_call_hook(std::function<void(uint32_t)> hook) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_call_hook = std::move(hook);
    }

    void set_validation(bool valid, const std::string& reason) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_validation.valid = valid;
        m_validation.reason = reason;
    }

    CoordinatorResult create_upload(const std::string& file_id, const std::string& filename,
                                     uint64_t /*size*/, RemoteUpload& out) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_create_calls;
        out.upload_id = "upload-" + std::to_string(m_create_calls);
        out.remote_key = file_id + "/" + filename;
        return CoordinatorResult{};
    }

    CoordinatorResult upload_part(const std::string& /*remote_key*/, const std::string& /*upload_id*/,
                                  uint32_t part_number, const std::vector<uint8_t>& bytes,
                                  ProgressCB progress, AbortCB should_abort) override {
        const int now_in_flight = ++m_in_flight;
        int seen = m_max_in_flight.load();
        while (now_in_flight > seen && !m_max_in_flight.compare_exchange_weak(seen, now_in_flight)) {
        }

        CoordinatorResult result = serve_part(part_number, bytes, progress, should_abort);
        --m_in_flight;
        return result;
    }

    CoordinatorResult complete_upload(const std::string& /*remote_key*/, const std::string& /*upload_id*/,
                                      const std::vector<CompletedPart>& parts) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_complete_calls.push_back(parts);
        return CoordinatorResult{};
    }

    CoordinatorResult put_whole(const std::string& remote_key, const std::vector<uint8_t>& bytes,
                                ProgressCB progress, AbortCB /*should_abort*/) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_put_whole_calls;
            m_whole_keys.push_back(remote_key);
            m_whole_bytes = bytes.size();
        }
        if (progress) {
            const size_t half = bytes.size() / 2;
            progress(half, bytes.size());
            progress(bytes.size(), bytes.size());
        }
        return CoordinatorResult{};
    }

    TransferValidation validate_still_open(const std::string& /*transfer_id*/) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_validate_calls;
        return m_validation;
    }

    // ---- inspection ----

    int create_calls() { std::lock_guard<std::mutex> l(m_mutex); return m_create_calls; }
    int put_whole_calls() { std::lock_guard<std::mutex> l(m_mutex); return m_put_whole_calls; }
    int validate_calls() { std::lock_guard<std::mutex> l(m_mutex); return m_validate_calls; }
    size_t whole_bytes() { std::lock_guard<std::mutex> l(m_mutex); return m_whole_bytes; }
    std::vector<std::string> whole_keys() { std::lock_guard<std::mutex> l(m_mutex); return m_whole_keys; }
    int upload_part_calls() { std::lock_guard<std::mutex> l(m_mutex); return m_part_calls; }
    int accepted_count() { std::lock_guard<std::mutex> l(m_mutex); return static_cast<int>(m_accepted.size()); }
    int max_in_flight() const { return m_max_in_flight.load(); }

    // Part numbers in acceptance order
    std::vector<uint32_t> accepted() { std::lock_guard<std::mutex> l(m_mutex); return m_accepted; }
    // Every part number upload_part was called with, in call order
    std::vector<uint32_t> attempted() { std::lock_guard<std::mutex> l(m_mutex); return m_attempted; }
    std::vector<std::vector<CompletedPart>> complete_calls() {
        std::lock_guard<std::mutex> l(m_mutex);
        return m_complete_calls;
    }

    static std::string etag_for(uint32_t part_number, size_t length) {
        std::ostringstream oss;
        oss << "etag-" << part_number << "-" << length;
        return oss.str();
    }

private:
    CoordinatorResult serve_part(uint32_t part_number, const std::vector<uint8_t>& bytes,
                                             const ProgressCB& progress, const AbortCB& should_abort) {
        Failure scripted{CoordinatorOutcome::OK, 200};
        std::function<void(uint32_t)> hook;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_part_calls;
            m_attempted.push_back(part_number);
            auto it = m_script.find(part_number);
            if (it == m_script.end() || it->second.empty()) {
                it = m_script.find(0);
            }
            if (it != m_script.end() && !it->second.empty()) {
                scripted = it->second.front();
                it->second.pop_front();
            }
            hook = m_call_hook;
        }
        if (hook) {
            hook(part_number);
        }

        if (progress && !bytes.empty()) {
            progress(bytes.size() / 2, bytes.size());
        }

        // Latency, and the accept gate, both honor the abort callback
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_latency_ms.load());
        while (true) {
            if (should_abort && should_abort()) {
                CoordinatorResult aborted;
                aborted.outcome = CoordinatorOutcome::ABORTED;
                aborted.status = 0;
                return aborted;
            }
            const bool latency_done = std::chrono::steady_clock::now() >= deadline;
            bool gate_open = true;
            if (scripted.outcome == CoordinatorOutcome::OK && m_accept_limit.load() >= 0) {
                std::lock_guard<std::mutex> lock(m_mutex);
                gate_open = static_cast<int>(m_accepted.size()) < m_accept_limit.load();
            }
            if (latency_done && gate_open) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        if (scripted.outcome != CoordinatorOutcome::OK) {
            CoordinatorResult failed;
            failed.outcome = scripted.outcome;
            failed.status = scripted.status;
            failed.message = "scripted failure";
            return failed;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_accept_limit.load() >= 0 && static_cast<int>(m_accepted.size()) >= m_accept_limit.load()) {
            // Another worker took the last slot while we were waiting
            CoordinatorResult aborted;
            aborted.outcome = CoordinatorOutcome::NETWORK_ERROR;
            aborted.status = 0;
            aborted.message = "gate closed";
            return aborted;
        }
        if (progress) {
            progress(bytes.size(), bytes.size());
        }
        m_accepted.push_back(part_number);
        CoordinatorResult ok;
        ok.etag = etag_for(part_number, bytes.size());
        return ok;
    }

    std::mutex m_mutex;
    std::map<uint32_t, std::deque<Failure>> m_script;
    std::atomic<int> m_latency_ms{0};
    std::atomic<int> m_accept_limit{-1};
    std::atomic<int> m_in_flight{0};
    std::atomic<int> m_max_in_flight{0};
    TransferValidation m_validation{true, ""};
    std::function<void(uint32_t)> m_call_hook;

    int m_create_calls = 0;
    int m_put_whole_calls = 0;
    int m_validate_calls = 0;
    int m_part_calls = 0;
    size_t m_whole_bytes = 0;
    std::vector<std::string> m_whole_keys;
    std::vector<uint32_t> m_accepted;
    std::vector<uint32_t> m_attempted;
    std::vector<std::vector<CompletedPart>> m_complete_calls;
};

#endif // FAKE_COORDINATOR_H
