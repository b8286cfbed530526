#include "logger.h"
#include <mutex>
#include <string>
#include <iostream>
#include <queue>
#include <thread>
#include <memory>
#include <condition_variable>
#include <atomic>
#include <algorithm>
#include <cctype>

/**
 * @brief Tag prepended to each line.
 */
static std::string g_sessionTag = "chunklift";

/**
 * @brief Protects the tag, the level and the callback.
 */
static std::mutex g_logMutex;

static std::atomic<LogLevel> g_log_level{LogLevel::INFO};

static std::function<void(const std::string&)> g_log_callback;

/**
 * @brief Async logging state
 */
static std::atomic<bool> g_async_logging_enabled(false);
static std::queue<std::string> g_log_queue;
static std::mutex g_log_queue_mutex;
static std::condition_variable g_log_queue_cv;
static std::atomic<bool> g_log_thread_running(false);
static std::unique_ptr<std::thread> g_log_thread;

void setSessionTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sessionTag = tag;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel get_log_level() {
    return g_log_level.load();
}

LogLevel parse_log_level(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none" || v == "off") return LogLevel::NONE;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::NONE: return "NONE";
    }
    return "INFO";
}

/**
 * @brief Writes one formatted line to the callback or stderr.
 * The callback runs without g_logMutex held, so it may log itself.
 */
static void emit_line(const std::string& line) {
    std::function<void(const std::string&)> callback;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_log_callback) {
            std::cerr << line << std::endl;
            return;
        }
        callback = g_log_callback;
    }
    callback(line);
}

/**
 * @brief Background thread worker for async logging
 */
static void async_log_worker() {
    for (;;) {
        std::unique_lock<std::mutex> lock(g_log_queue_mutex);
        g_log_queue_cv.wait(lock, [] { return !g_log_queue.empty() || !g_log_thread_running; });

        if (g_log_queue.empty()) {
            if (!g_log_thread_running) break;
            continue;
        }

        auto msg = std::move(g_log_queue.front());
        g_log_queue.pop();
        lock.unlock();

        emit_line(msg);
    }
}

void enable_async_logging() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_async_logging_enabled) return;

    g_log_thread_running = true;
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
    g_async_logging_enabled = true;
}

void disable_async_logging() {
    if (!g_async_logging_enabled.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        g_log_thread_running = false;
    }
    g_log_queue_cv.notify_all();

    // The worker drains the queue before it exits
    if (g_log_thread && g_log_thread->joinable()) {
        g_log_thread->join();
    }
    g_log_thread.reset();
}

bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

void nativeLog(LogLevel level, const std::string& message) {
    std::string tag;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        tag = g_sessionTag;
    }
    std::string line = "[" + tag + "] " + log_level_name(level) + " " + message;

    if (is_async_logging_enabled()) {
        {
            std::lock_guard<std::mutex> lock(g_log_queue_mutex);
            g_log_queue.push(std::move(line));
        }
        g_log_queue_cv.notify_one();
    } else {
        emit_line(line);
    }
}
