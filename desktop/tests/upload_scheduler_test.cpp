#include "upload_scheduler.h"
#include "chunk_upload_task.h"
#include "concurrency_governor.h"
#include "network_quality_monitor.h"
#include "retry_policy.h"
#include "session_state.h"
#include "upload_worker_pool.h"
#include "fake_coordinator.h"
#include "logger.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static const uint64_t PART = 1024;
static const uint32_t PARTS = 25;

static bool write_pattern_file(const std::filesystem::path& p, size_t bytes) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return false;
    for (size_t i = 0; i < bytes; ++i) {
        out.put(static_cast<char>(i % 253));
    }
    return static_cast<bool>(out);
}

static bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

static RetryPolicy::Config fast_retries() {
    RetryPolicy::Config cfg;
    cfg.base_delay_ms = 1;
    return cfg;
}

// Everything one scheduler needs, with 1 KiB parts so no large files are written
struct Harness {
    NetworkQualityMonitor monitor;
    ConcurrencyGovernor governor;
    RetryPolicy policy;
    UploadWorkerPool pool;
    SessionState state;
    JobControl control;
    FakeCoordinator coordinator;
    std::filesystem::path dir;

    Harness(const std::filesystem::path& workdir, const std::string& name)
        : monitor(NetworkQualityMonitor::Config{}),
          governor(monitor, ConcurrencyGovernor::Config{}),
          policy(monitor, fast_retries()),
          pool(MAX_CONCURRENCY),
          state((workdir / (name + ".json")).string(), "transfer-" + name),
          dir(workdir) {}

    UploadScheduler::Context context() {
        return UploadScheduler::Context{coordinator, monitor, governor, pool, state,
                                        policy, control, 60000, false};
    }

    bool add_multipart_job(const std::string& id, uint32_t parts) {
        const auto path = dir / (id + ".bin");
        if (!write_pattern_file(path, parts * PART)) return false;
        FileUploadJob job;
        job.id = id;
        job.filename = id + ".bin";
        job.local_path = path.string();
        job.size = parts * PART;
        job.layout.probe_size = PART;
        job.layout.base_size = PART;
        job.layout.probe_parts = PROBE_PARTS;
        return state.add_job(job);
    }

    FileUploadJob job(const std::string& id) {
        FileUploadJob j;
        state.get_job(id, j);
        return j;
    }
};

static bool covers_all_parts_sorted(const std::vector<CompletedPart>& parts, uint32_t total) {
    if (parts.size() != total) return false;
    for (uint32_t i = 0; i < total; ++i) {
        if (parts[i].part_number != i + 1) return false;
        if (parts[i].etag != FakeCoordinator::etag_for(i + 1, PART)) return false;
    }
    return true;
}

// Runs the scheduler on its own thread; false if it has not returned in time
static bool run_within(Harness& h, const std::string& job_id, std::chrono::seconds timeout,
                       JobStatus& status, UploadError& error) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread runner([&h, job_id, &status, &error, done]() {
        UploadScheduler scheduler(h.context(), job_id);
        status = scheduler.run();
        error = scheduler.last_error();
        done->store(true);
    });
    if (!wait_until([&done] { return done->load(); }, timeout)) {
        // The process is about to report failure; the stuck thread is left behind
        runner.detach();
        return false;
    }
    runner.join();
    return true;
}

static bool test_single_upload(const std::filesystem::path& dir) {
    Harness h(dir, "single");
    const auto path = dir / "small.txt";
    TEST_ASSERT(write_pattern_file(path, 3000), "write file");

    FileUploadJob job;
    job.id = "small";
    job.filename = "small.txt";
    job.local_path = path.string();
    job.size = 3000;
    TEST_ASSERT(h.state.add_job(job), "add job");

    UploadScheduler scheduler(h.context(), "small");
    TEST_ASSERT(scheduler.run() == JobStatus::COMPLETED, "completed");
    TEST_ASSERT(h.coordinator.put_whole_calls() == 1, "exactly one putWhole");
    TEST_ASSERT(h.coordinator.upload_part_calls() == 0, "never uploadPart");
    TEST_ASSERT(h.coordinator.create_calls() == 0, "no multipart session");
    TEST_ASSERT(h.coordinator.whole_bytes() == 3000, "whole file sent");
    TEST_ASSERT(h.coordinator.whole_keys()[0] == "small/small.txt", "default remote key");
    TEST_ASSERT(h.job("small").progress == 100.0, "progress 100");
    return true;
}

static bool test_multipart_coverage(const std::filesystem::path& dir) {
    Harness h(dir, "coverage");
    TEST_ASSERT(h.add_multipart_job("cov", PARTS), "add job");
    h.coordinator.set_latency(std::chrono::milliseconds(3));
    // Early parts fail first, so they complete last
    h.coordinator.script_part(1, CoordinatorOutcome::NETWORK_ERROR, 0, 2);
    h.coordinator.script_part(2, CoordinatorOutcome::CONNECTION_LOST, 0, 1);

    std::atomic<bool> saw_partial{false};
    h.state.set_listener([&](const FileUploadJob& job) {
        if (job.progress > 0.0 && job.progress < 100.0) saw_partial = true;
    });

    // Throughput samples may move the tier during the run, the target is fixed at dispatch
    const int limit = h.monitor.adaptive_concurrency(PARTS * PART, PARTS, false);
    UploadScheduler scheduler(h.context(), "cov");
    TEST_ASSERT(scheduler.run() == JobStatus::COMPLETED, "completed");
    TEST_ASSERT(h.coordinator.create_calls() == 1, "one createUpload");
    TEST_ASSERT(h.coordinator.put_whole_calls() == 0, "no putWhole");

    std::vector<uint32_t> accepted = h.coordinator.accepted();
    std::set<uint32_t> unique(accepted.begin(), accepted.end());
    TEST_ASSERT(accepted.size() == PARTS && unique.size() == PARTS, "every part accepted exactly once");
    TEST_ASSERT(accepted.front() != 1 && accepted.front() != 2, "retried parts complete out of order");

    auto completes = h.coordinator.complete_calls();
    TEST_ASSERT(completes.size() == 1, "one completeUpload");
    TEST_ASSERT(covers_all_parts_sorted(completes[0], PARTS), "completeUpload gets sorted parts 1..25");
    TEST_ASSERT(covers_all_parts_sorted(h.job("cov").completed_parts, PARTS), "job parts complete");

    TEST_ASSERT(h.coordinator.max_in_flight() <= limit, "in-flight never exceeds the limit");

    TEST_ASSERT(saw_partial.load(), "intermediate progress reported");
    TEST_ASSERT(h.job("cov").progress == 100.0, "progress ends at 100");
    return true;
}

static bool test_pause_and_resume_7_of_25(const std::filesystem::path& dir) {
    Harness h(dir, "pause");
    TEST_ASSERT(h.add_multipart_job("p", PARTS), "add job");
    h.coordinator.set_latency(std::chrono::milliseconds(2));
    h.coordinator.set_accept_limit(7);

    JobStatus first = JobStatus::PENDING;
    std::thread runner([&]() {
        UploadScheduler scheduler(h.context(), "p");
        first = scheduler.run();
    });
    TEST_ASSERT(wait_until([&] { return h.coordinator.accepted_count() == 7 &&
                                        h.job("p").completed_parts.size() == 7; },
                           std::chrono::seconds(5)), "7 parts accepted");
    h.control.request(UploadErrorKind::PAUSED);
    runner.join();

    TEST_ASSERT(first == JobStatus::PAUSED, "paused");
    FileUploadJob paused = h.job("p");
    TEST_ASSERT(paused.status == JobStatus::PAUSED, "job status paused");
    TEST_ASSERT(paused.completed_parts.size() == 7, "7 parts preserved");

    const int calls_at_pause = h.coordinator.upload_part_calls();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    TEST_ASSERT(h.coordinator.upload_part_calls() == calls_at_pause, "no uploadPart while paused");
    TEST_ASSERT(h.job("p").completed_parts.size() == 7, "parts unchanged while paused");

    std::set<uint32_t> done_before;
    for (const auto& part : paused.completed_parts) done_before.insert(part.part_number);
    const size_t attempted_before = h.coordinator.attempted().size();

    h.control.clear();
    h.coordinator.set_accept_limit(-1);
    UploadScheduler resumed(h.context(), "p");
    TEST_ASSERT(resumed.run() == JobStatus::COMPLETED, "resumed job completes");

    std::vector<uint32_t> attempted = h.coordinator.attempted();
    std::set<uint32_t> uploaded_after(attempted.begin() + static_cast<long>(attempted_before), attempted.end());
    TEST_ASSERT(uploaded_after.size() == PARTS - 7, "exactly the 18 missing parts are uploaded");
    for (uint32_t part : uploaded_after) {
        TEST_ASSERT(done_before.count(part) == 0, "no completed part is uploaded again");
    }
    TEST_ASSERT(h.coordinator.create_calls() == 1, "multipart session reused");
    TEST_ASSERT(covers_all_parts_sorted(h.job("p").completed_parts, PARTS), "all parts after resume");
    return true;
}

static bool test_validation_error_is_permanent(const std::filesystem::path& dir) {
    Harness h(dir, "invalid");
    TEST_ASSERT(h.add_multipart_job("v", PARTS), "add job");
    h.coordinator.set_latency(std::chrono::milliseconds(2));
    h.coordinator.script_part(5, CoordinatorOutcome::INVALID_RESPONSE, 200, 1);

    UploadScheduler scheduler(h.context(), "v");
    TEST_ASSERT(scheduler.run() == JobStatus::ERROR, "job fails");
    TEST_ASSERT(scheduler.last_error().kind == UploadErrorKind::VALIDATION_ERROR, "validation error");

    std::vector<uint32_t> attempted = h.coordinator.attempted();
    TEST_ASSERT(std::count(attempted.begin(), attempted.end(), 5u) == 1, "validation errors are not retried");
    TEST_ASSERT(h.coordinator.complete_calls().empty(), "no completeUpload");

    FileUploadJob failed = h.job("v");
    TEST_ASSERT(failed.status == JobStatus::ERROR, "status error");
    TEST_ASSERT(failed.error_message == "Upload error occurred. Click retry to continue.", "user message");
    TEST_ASSERT(!failed.has_part(5), "failed part not recorded");
    const size_t kept = failed.completed_parts.size();
    TEST_ASSERT(kept >= 4, "in-flight successes are kept");

    // Retry from error continues from the recorded parts
    UploadScheduler retry(h.context(), "v");
    TEST_ASSERT(retry.run() == JobStatus::COMPLETED, "retry completes");
    std::vector<uint32_t> accepted = h.coordinator.accepted();
    std::set<uint32_t> unique(accepted.begin(), accepted.end());
    TEST_ASSERT(unique.size() == accepted.size(), "no part accepted twice");
    TEST_ASSERT(covers_all_parts_sorted(h.job("v").completed_parts, PARTS), "all parts after retry");
    return true;
}

static bool test_retries_exhausted(const std::filesystem::path& dir) {
    Harness h(dir, "exhausted");
    TEST_ASSERT(h.add_multipart_job("x", 6), "add job");
    h.coordinator.script_part(3, CoordinatorOutcome::SERVER_ERROR, 503, 4);

    UploadScheduler scheduler(h.context(), "x");
    TEST_ASSERT(scheduler.run() == JobStatus::ERROR, "job fails");
    TEST_ASSERT(scheduler.last_error().kind == UploadErrorKind::UPLOAD_FAILED, "upload failed");
    TEST_ASSERT(scheduler.last_error().cause == UploadErrorKind::SERVER_ERROR, "caused by server errors");
    TEST_ASSERT(scheduler.last_error().part_number == 3, "part 3");

    std::vector<uint32_t> attempted = h.coordinator.attempted();
    TEST_ASSERT(std::count(attempted.begin(), attempted.end(), 3u) == 4, "1 attempt + 3 retries");
    TEST_ASSERT(h.job("x").error_message == "Server temporarily overloaded. Click retry to continue.",
                "server overload message");
    return true;
}

static bool test_breaker_under_load(const std::filesystem::path& dir) {
    Harness h(dir, "breaker");
    TEST_ASSERT(h.add_multipart_job("b", PARTS), "add job");
    h.coordinator.set_latency(std::chrono::milliseconds(2));
    // The first five calls, whatever part they carry, get a 503
    h.coordinator.script_part(0, CoordinatorOutcome::SERVER_ERROR, 503, 5);

    std::atomic<int> lowest{100};
    ConcurrencyGovernor& governor = h.governor;
    h.coordinator.set_call_hook([&lowest, &governor](uint32_t) {
        const int c = governor.current_concurrency();
        int seen = lowest.load();
        while (c < seen && !lowest.compare_exchange_weak(seen, c)) {
        }
    });

    UploadScheduler scheduler(h.context(), "b");
    TEST_ASSERT(scheduler.run() == JobStatus::COMPLETED, "job survives the overload");
    TEST_ASSERT(h.governor.target_concurrency() == 5, "target from the monitor");
    TEST_ASSERT(lowest.load() == 2, "breaker lowered concurrency to max(2, floor(5*0.5))");
    TEST_ASSERT(h.coordinator.upload_part_calls() == static_cast<int>(PARTS) + 5, "failed attempts retried");
    TEST_ASSERT(h.governor.current_concurrency() > 2, "concurrency recovers on sustained success");
    return true;
}

static bool test_cancel(const std::filesystem::path& dir) {
    Harness h(dir, "cancel");
    TEST_ASSERT(h.add_multipart_job("c", PARTS), "add job");
    h.coordinator.set_accept_limit(3);

    JobStatus result = JobStatus::PENDING;
    std::thread runner([&]() {
        UploadScheduler scheduler(h.context(), "c");
        result = scheduler.run();
    });
    TEST_ASSERT(wait_until([&] { return h.coordinator.accepted_count() == 3; }, std::chrono::seconds(5)),
                "3 parts accepted");
    h.control.request(UploadErrorKind::CANCELLED);
    runner.join();

    TEST_ASSERT(result == JobStatus::CANCELLED, "cancelled");
    FileUploadJob job = h.job("c");
    TEST_ASSERT(job.status == JobStatus::CANCELLED, "status cancelled");
    TEST_ASSERT(job.completed_parts.empty(), "parts discarded");
    TEST_ASSERT(job.error_message.empty(), "cancel is not an error");
    TEST_ASSERT(h.coordinator.complete_calls().empty(), "no completeUpload");
    return true;
}

static bool test_unreadable_source(const std::filesystem::path& dir) {
    Harness h(dir, "io");
    TEST_ASSERT(h.add_multipart_job("gone", PARTS), "add job");
    std::filesystem::remove(dir / "gone.bin");

    UploadScheduler scheduler(h.context(), "gone");
    TEST_ASSERT(scheduler.run() == JobStatus::ERROR, "fails");
    TEST_ASSERT(scheduler.last_error().kind == UploadErrorKind::IO_ERROR, "io error");
    TEST_ASSERT(h.job("gone").error_message == "Source file is no longer readable. Please reselect the file.",
                "reselect message");
    TEST_ASSERT(h.coordinator.upload_part_calls() == 0, "nothing uploaded");
    return true;
}

static bool test_throwing_listener(const std::filesystem::path& dir) {
    Harness h(dir, "listener");
    TEST_ASSERT(h.add_multipart_job("l", 8), "add job");
    h.coordinator.set_latency(std::chrono::milliseconds(2));

    std::atomic<int> thrown{0};
    h.state.set_listener([&thrown](const FileUploadJob& job) {
        if (job.progress > 0.0 && job.progress < 100.0) {
            ++thrown;
            throw std::runtime_error("listener failed");
        }
    });

    JobStatus status = JobStatus::PENDING;
    UploadError error;
    TEST_ASSERT(run_within(h, "l", std::chrono::seconds(20), status, error), "scheduler returns");
    TEST_ASSERT(thrown.load() > 0, "listener threw during the run");
    TEST_ASSERT(status == JobStatus::COMPLETED, "listener failures do not affect the upload");
    TEST_ASSERT(h.job("l").completed_parts.size() == 8, "all parts recorded");
    TEST_ASSERT(h.coordinator.complete_calls().size() == 1, "one completeUpload");
    return true;
}

static bool test_throwing_coordinator(const std::filesystem::path& dir) {
    Harness h(dir, "throwing");
    TEST_ASSERT(h.add_multipart_job("t", 10), "add job");
    h.coordinator.set_latency(std::chrono::milliseconds(2));
    h.coordinator.set_call_hook([](uint32_t part_number) {
        if (part_number == 4) {
            throw std::runtime_error("transport crashed");
        }
    });

    JobStatus status = JobStatus::PENDING;
    UploadError error;
    TEST_ASSERT(run_within(h, "t", std::chrono::seconds(20), status, error), "scheduler does not hang");
    TEST_ASSERT(status == JobStatus::ERROR, "job fails");
    TEST_ASSERT(error.kind == UploadErrorKind::UPLOAD_FAILED, "upload failed");
    TEST_ASSERT(error.part_number == 4, "failing part reported");
    TEST_ASSERT(error.message.find("transport crashed") != std::string::npos, "exception text kept");

    FileUploadJob failed = h.job("t");
    TEST_ASSERT(failed.status == JobStatus::ERROR, "status error");
    TEST_ASSERT(!failed.error_message.empty(), "user message set");
    TEST_ASSERT(!failed.has_part(4), "throwing part not recorded");
    TEST_ASSERT(h.coordinator.complete_calls().empty(), "no completeUpload");

    // The pool is still usable once the throwing part is gone
    h.coordinator.set_call_hook(nullptr);
    TEST_ASSERT(run_within(h, "t", std::chrono::seconds(20), status, error), "retry returns");
    TEST_ASSERT(status == JobStatus::COMPLETED, "retry completes");
    TEST_ASSERT(covers_all_parts_sorted(h.job("t").completed_parts, 10), "all parts after retry");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    const auto workdir = std::filesystem::temp_directory_path() / "chunklift_scheduler_tests";
    std::error_code ec;
    std::filesystem::remove_all(workdir, ec);
    std::filesystem::create_directories(workdir, ec);

    std::cout << "--- UploadScheduler tests (" << workdir << ") ---" << std::endl;

    if (test_single_upload(workdir)) std::cout << "PASS: single upload" << std::endl;
    if (test_multipart_coverage(workdir)) std::cout << "PASS: multipart coverage" << std::endl;
    if (test_pause_and_resume_7_of_25(workdir)) std::cout << "PASS: pause at 7 of 25, resume" << std::endl;
    if (test_validation_error_is_permanent(workdir)) std::cout << "PASS: validation error" << std::endl;
    if (test_retries_exhausted(workdir)) std::cout << "PASS: retries exhausted" << std::endl;
    if (test_breaker_under_load(workdir)) std::cout << "PASS: breaker under load" << std::endl;
    if (test_cancel(workdir)) std::cout << "PASS: cancel" << std::endl;
    if (test_unreadable_source(workdir)) std::cout << "PASS: unreadable source" << std::endl;
    if (test_throwing_listener(workdir)) std::cout << "PASS: throwing listener" << std::endl;
    if (test_throwing_coordinator(workdir)) std::cout << "PASS: throwing coordinator" << std::endl;

    std::filesystem::remove_all(workdir, ec);
    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
