#include "upload_worker_pool.h"
#include "logger.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <set>
#include <mutex>
#include <stdexcept>
#include <thread>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool test_runs_all_tasks() {
    UploadWorkerPool pool(4);
    TEST_ASSERT(pool.worker_count() == 4, "worker count");

    std::atomic<int> done{0};
    for (int i = 0; i < 100; ++i) {
        TEST_ASSERT(pool.submit([&done] { ++done; }), "submit accepted");
    }
    pool.shutdown(true);
    TEST_ASSERT(done.load() == 100, "every queued task ran");
    TEST_ASSERT(!pool.submit([] {}), "submit refused after shutdown");
    return true;
}

static bool test_bounded_parallelism() {
    UploadWorkerPool pool(3);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::mutex ids_mutex;
    std::set<std::thread::id> ids;

    for (int i = 0; i < 12; ++i) {
        pool.submit([&] {
            const int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            {
                std::lock_guard<std::mutex> lock(ids_mutex);
                ids.insert(std::this_thread::get_id());
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --running;
        });
    }
    pool.shutdown(true);
    TEST_ASSERT(peak.load() <= 3, "never more tasks than workers");
    TEST_ASSERT(peak.load() >= 2, "tasks ran in parallel");
    TEST_ASSERT(ids.size() <= 3, "tasks ran on pool threads");
    return true;
}

static bool test_throwing_task_keeps_worker() {
    UploadWorkerPool pool(1);
    std::atomic<bool> after{false};
    pool.submit([] { throw std::runtime_error("boom"); });
    pool.submit([&after] { after = true; });
    pool.shutdown(true);
    TEST_ASSERT(after.load(), "worker survives a throwing task");
    return true;
}

static bool test_counters() {
    UploadWorkerPool pool(1);
    std::atomic<bool> release{false};
    std::atomic<bool> started{false};
    pool.submit([&] {
        started = true;
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    });
    pool.submit([] {});
    pool.submit([] {});

    while (!started) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    TEST_ASSERT(pool.active_tasks() == 1, "one active task");
    TEST_ASSERT(pool.pending_tasks() == 2, "two queued tasks");

    release = true;
    pool.shutdown(true);
    TEST_ASSERT(pool.pending_tasks() == 0, "queue drained");
    TEST_ASSERT(pool.active_tasks() == 0, "nothing active");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "--- UploadWorkerPool tests ---" << std::endl;

    if (test_runs_all_tasks()) std::cout << "PASS: runs all tasks" << std::endl;
    if (test_bounded_parallelism()) std::cout << "PASS: bounded parallelism" << std::endl;
    if (test_throwing_task_keeps_worker()) std::cout << "PASS: throwing task" << std::endl;
    if (test_counters()) std::cout << "PASS: counters" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
