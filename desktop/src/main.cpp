#include "upload_engine.h"
#include "local_directory_coordinator.h"
#include "logger.h"
#include "config_manager.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <map>
#include <signal.h>
#include <string>
#include <vector>

static std::atomic<bool> g_interrupted(false);

static void handle_interrupt(int) {
    g_interrupted = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] COMMAND [ARGS]\n\n"
              << "Commands:\n"
              << "  upload FILE...           Upload one or more files\n"
              << "  resume [JOB_ID=PATH]...  Resume the interrupted session; optionally reselect\n"
              << "                           the source file of a job\n"
              << "  status                   Show jobs of the interrupted session\n"
              << "\nOptions:\n"
              << "  --config FILE      Path to configuration file (default: config.json)\n"
              << "  --log-level LVL    Log level: debug|info|warning|error|none (default: from config)\n"
              << "  --store DIR        Local coordinator directory (default: from config)\n"
              << "  --snapshot FILE    Session snapshot path (default: from config)\n"
              << "  --low-resource     Fewer workers, more conservative circuit breaker\n"
              << "  --help             Show this help message\n"
              << "\nCtrl-C pauses running uploads; run 'resume' to continue them.\n"
              << std::endl;
}

static void print_job(const FileUploadJob& job) {
    char pct[16];
    std::snprintf(pct, sizeof(pct), "%3d%%", job.progress_percent());
    std::cout << "  " << job.id << "  " << job.filename << "  " << format_bytes(job.size)
              << "  " << job_status_name(job.status) << "  " << pct;
    if (job.is_multipart()) {
        std::cout << "  parts " << job.completed_parts.size() << "/" << job.total_parts();
    }
    if (!job.error_message.empty()) {
        std::cout << "  " << job.error_message;
    }
    std::cout << std::endl;
}

// Wait for every job, printing progress once a second. Ctrl-C pauses them.
static int drive(UploadEngine& engine, LocalDirectoryCoordinator& coordinator,
                 const std::vector<std::string>& job_ids) {
    bool pause_sent = false;
    size_t finished = 0;
    std::map<std::string, bool> done;

    while (finished < job_ids.size()) {
        if (g_interrupted && !pause_sent) {
            std::cout << "\nPausing uploads..." << std::endl;
            for (const auto& id : job_ids) {
                engine.pause(id);
            }
            pause_sent = true;
        }

        for (const auto& id : job_ids) {
            if (done[id]) continue;
            if (engine.wait_for_job(id, std::chrono::milliseconds(1000 / job_ids.size() + 1))) {
                done[id] = true;
                ++finished;
            }
        }

        for (const auto& id : job_ids) {
            FileUploadJob job;
            if (engine.status(id, job)) {
                print_job(job);
            }
        }
    }

    int exit_code = 0;
    bool all_completed = true;
    for (const auto& job : engine.jobs()) {
        if (job.status == JobStatus::COMPLETED) continue;
        if (job.status == JobStatus::CANCELLED) continue;
        all_completed = false;
        if (job.status == JobStatus::ERROR) {
            exit_code = 1;
        } else if (exit_code == 0) {
            exit_code = 2;
        }
    }

    if (all_completed) {
        coordinator.mark_transfer_completed(engine.transfer_id());
        std::cout << "All uploads completed." << std::endl;
    } else if (exit_code == 2) {
        std::cout << "Uploads paused. Run 'resume' to continue." << std::endl;
    }
    return exit_code;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, handle_interrupt);
    signal(SIGTERM, handle_interrupt);

    std::string config_path = "config.json";
    std::string log_level_arg;
    std::string store_dir;
    std::string snapshot_path;
    bool low_resource = false;
    std::string command;
    std::vector<std::string> args;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" || arg == "--log-level" || arg == "--store" || arg == "--snapshot") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--config") config_path = value;
            else if (arg == "--log-level") log_level_arg = value;
            else if (arg == "--store") store_dir = value;
            else snapshot_path = value;
        } else if (arg == "--low-resource") {
            low_resource = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else if (command.empty()) {
            command = arg;
        } else {
            args.push_back(arg);
        }
    }

    if (command != "upload" && command != "resume" && command != "status") {
        print_usage(argv[0]);
        return 1;
    }
    if (command == "upload" && args.empty()) {
        std::cerr << "Error: upload requires at least one file" << std::endl;
        return 1;
    }

    // Load configuration with fallbacks (useful when running from build/bin)
    set_log_level(LogLevel::WARNING);
    ConfigManager& cfg = ConfigManager::getInstance();
    std::vector<std::string> candidates = {config_path, "../config.json", "../../config.json"};
    bool loaded = false;
    for (const auto& c : candidates) {
        if (std::filesystem::exists(c) && cfg.loadConfig(c)) {
            loaded = true;
            break;
        }
    }
    if (!loaded) {
        std::cerr << "Warning: no configuration file found, using defaults" << std::endl;
    }

    set_log_level(parse_log_level(log_level_arg.empty() ? cfg.getLogLevel() : log_level_arg));
    if (cfg.isAsyncLogging()) {
        enable_async_logging();
    }

    UploadEngine::Config engine_config = UploadEngine::Config::from_config_manager();
    if (!snapshot_path.empty()) engine_config.snapshot_path = snapshot_path;
    if (low_resource) engine_config.low_resource_mode = true;

    LocalDirectoryCoordinator::Options store_options;
    store_options.root = store_dir.empty() ? cfg.getCoordinatorRoot() : store_dir;
    store_options.transfer_ttl_hours = cfg.getTransferTtlHours();
    LocalDirectoryCoordinator coordinator(store_options);
    std::string error;
    if (!coordinator.open(error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    NetworkQualityMonitor::HintProvider hint;
    if (cfg.hasConnectionHint()) {
        const double bandwidth = cfg.getHintBandwidthMbps();
        const double latency = cfg.getHintLatencyMs();
        hint = [bandwidth, latency](NetworkSample& out) {
            out.bandwidth_mbps = bandwidth;
            out.latency_ms = latency;
            return true;
        };
    }

    UploadEngine engine(coordinator, engine_config, hint);
    int exit_code = 0;

    if (command == "upload") {
        setSessionTag(engine.transfer_id());
        coordinator.register_transfer(engine.transfer_id());

        std::vector<std::string> job_ids;
        for (const auto& path : args) {
            std::string id;
            UploadError err;
            if (!engine.start(path, id, err)) {
                std::cerr << "Error: " << err.message << std::endl;
                exit_code = 1;
                continue;
            }
            std::cout << "Started " << id << " for " << path << std::endl;
            job_ids.push_back(id);
        }
        if (!job_ids.empty()) {
            const int rc = drive(engine, coordinator, job_ids);
            if (rc != 0) exit_code = rc;
        }
    } else {
        if (!engine.detect_interrupted_session()) {
            std::cout << "No interrupted session found." << std::endl;
            engine.shutdown();
            disable_async_logging();
            return 0;
        }
        setSessionTag(engine.transfer_id());

        if (command == "status") {
            std::cout << "Interrupted session " << engine.transfer_id() << ":" << std::endl;
            for (const auto& job : engine.jobs()) {
                print_job(job);
            }
        } else {
            std::map<std::string, std::string> reselected;
            for (const auto& a : args) {
                const auto eq = a.find('=');
                if (eq == std::string::npos) {
                    std::cerr << "Error: expected JOB_ID=PATH, got " << a << std::endl;
                    return 1;
                }
                reselected[a.substr(0, eq)] = a.substr(eq + 1);
            }

            std::vector<std::string> job_ids;
            for (const auto& id : engine.resumable_jobs()) {
                UploadError err;
                const auto it = reselected.find(id);
                if (!engine.resume(id, it == reselected.end() ? "" : it->second, err)) {
                    std::cerr << "Error: " << id << ": " << err.message << std::endl;
                    exit_code = 1;
                    continue;
                }
                job_ids.push_back(id);
            }
            if (!job_ids.empty()) {
                const int rc = drive(engine, coordinator, job_ids);
                if (rc != 0) exit_code = rc;
            }
        }
    }

    engine.shutdown();
    disable_async_logging();
    return exit_code;
}
