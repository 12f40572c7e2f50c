/**
 * PodSync CLI - Fetch a video or playlist, convert it and copy it onto an iPod
 */

#include "PipelineOrchestrator.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

static bool g_verbose = false;
static volatile std::sig_atomic_t g_interrupted = 0;

// ── Logging ──────────────────────────────────────────────────────────────

void log_ts(const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::cout << "[" << std::put_time(std::localtime(&time), "%H:%M:%S")
              << "." << std::setfill('0') << std::setw(3) << ms.count() << "] "
              << message << std::endl;
}

void log_phase(const std::string& name) {
    std::cout << std::endl;
    std::cout << "════════════════════════════════════════════════════════════" << std::endl;
    std::cout << "  " << name << std::endl;
    std::cout << "════════════════════════════════════════════════════════════" << std::endl;
}

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return ss.str();
}

// Only records the signal; the watcher thread in main turns it into Cancel()
extern "C" void handle_sigint(int) {
    g_interrupted = 1;
}

// ── Main ─────────────────────────────────────────────────────────────────

void print_usage(const char* prog) {
    std::cout << "PodSync CLI - YouTube to iPod transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << prog << " <url> [options]" << std::endl;
    std::cout << "       " << prog << " --list-devices" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --format <m4a|mp3|mp4>  Output format (default m4a, mp4 = video)" << std::endl;
    std::cout << "  --quality <kbps>        Audio bitrate (default 256)" << std::endl;
    std::cout << "  --mount-point <path>    Use this mounted iPod instead of discovery" << std::endl;
    std::cout << "  --device <id>           Pick a discovered device by id" << std::endl;
    std::cout << "  --temp-dir <path>       Raw download directory (default temp)" << std::endl;
    std::cout << "  --output-dir <path>     Converted file directory (default converted)" << std::endl;
    std::cout << "  --workers <n>           Parallel fetch/convert workers (default 2)" << std::endl;
    std::cout << "  --resolution <WxH>      Video resolution (default 640x480)" << std::endl;
    std::cout << "  --skip-transfer         Stop after converting" << std::endl;
    std::cout << "  --clean-temp            Delete raw downloads afterwards" << std::endl;
    std::cout << "  --unmount               Unmount the iPod after transfer" << std::endl;
    std::cout << "  --overwrite             Re-convert files that already exist" << std::endl;
    std::cout << "  --verbose               Show component logging" << std::endl;
    std::cout << "  --help                  Show this help" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) { print_usage(argv[0]); return 1; }

    PipelineConfig config;
    DeviceSelector selector;
    std::string reference;
    std::string format = "m4a";
    int quality = 256;
    bool list_devices = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](const char* name) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "ERROR: " << name << " needs a value" << std::endl;
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--help") { print_usage(argv[0]); return 0; }
        else if (arg == "--verbose") g_verbose = true;
        else if (arg == "--list-devices") list_devices = true;
        else if (arg == "--format") format = next("--format");
        else if (arg == "--quality") quality = std::atoi(next("--quality").c_str());
        else if (arg == "--mount-point") selector.mount_point = next("--mount-point");
        else if (arg == "--device") selector.device_id = next("--device");
        else if (arg == "--temp-dir") config.temp_dir = next("--temp-dir");
        else if (arg == "--output-dir") config.output_dir = next("--output-dir");
        else if (arg == "--workers") config.workers = static_cast<size_t>(std::atoi(next("--workers").c_str()));
        else if (arg == "--resolution") config.video_resolution = next("--resolution");
        else if (arg == "--skip-transfer") config.skip_transfer = true;
        else if (arg == "--clean-temp") config.clean_temp = true;
        else if (arg == "--unmount") config.unmount_after_transfer = true;
        else if (arg == "--overwrite") config.overwrite = true;
        else if (arg[0] != '-') reference = arg;
        else {
            std::cerr << "ERROR: Unknown option " << arg << std::endl;
            return 1;
        }
    }

    if (quality <= 0) {
        std::cerr << "ERROR: Invalid quality" << std::endl;
        return 1;
    }
    if (config.workers == 0) config.workers = 1;

    PipelineOrchestrator orchestrator(config, [](const std::string& msg) {
        if (g_verbose) log_ts("  " + msg);
    });

    if (list_devices) {
        auto devices = orchestrator.DiscoverDevices();
        if (devices.empty()) {
            std::cout << "No iPod found." << std::endl;
            return 1;
        }
        for (auto& device : devices) {
            std::cout << "  " << device.id << "  " << device.name << " (" << device.model << ")"
                      << " [" << DiscoveryStrategyToString(device.strategy) << "]";
            if (device.mount_point) std::cout << " at " << *device.mount_point;
            std::cout << std::endl;
        }
        return 0;
    }

    if (reference.empty()) {
        std::cerr << "ERROR: No URL given" << std::endl;
        return 1;
    }

    int last_percent[3] = {-1, -1, -1};
    orchestrator.SetProgressCallback([&last_percent](const ProgressUpdate& update) {
        int& last = last_percent[static_cast<int>(update.stage)];
        if (update.indeterminate) {
            if (update.pulse % 20 == 0) log_ts("  ... " + update.message);
            return;
        }
        if (update.percent != last) {
            last = update.percent;
            log_ts("  [" + std::string(PipelineStageToString(update.stage)) + "] " +
                   std::to_string(update.percent) + "% " + update.message);
        }
    });

    g_interrupted = 0;
    std::signal(SIGINT, handle_sigint);

    std::atomic<bool> run_finished{false};
    std::thread interrupt_watcher([&orchestrator, &run_finished]() {
        while (!run_finished.load()) {
            if (g_interrupted) {
                log_ts("Interrupted, finishing the current item...");
                orchestrator.Cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    log_phase("Run: " + reference);
    auto start_time = std::chrono::steady_clock::now();

    RunSummary summary;
    Status status = orchestrator.Run(reference, format, quality, selector, &summary);

    run_finished.store(true);
    interrupt_watcher.join();
    std::signal(SIGINT, SIG_DFL);

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time).count();

    log_phase("Summary");
    std::cout << "  State:       " << PipelineStateToString(summary.final_state)
              << (summary.cancelled ? " (cancelled)" : "") << std::endl;
    std::cout << "  Acquisition: " << summary.acquisition.succeeded << "/" << summary.acquisition.attempted << std::endl;
    std::cout << "  Transcode:   " << summary.transcode.succeeded << "/" << summary.transcode.attempted << std::endl;
    std::cout << "  Transfer:    " << summary.transfer.succeeded << "/" << summary.transfer.attempted << std::endl;
    std::cout << "  Elapsed:     " << elapsed << "s" << std::endl;

    uint64_t transferred_bytes = 0;
    for (const auto& path : summary.transferred_paths) {
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (!ec) transferred_bytes += size;
    }
    if (!summary.transferred_paths.empty()) {
        std::cout << "  Copied:      " << format_bytes(transferred_bytes) << std::endl;
    }

    if (!summary.failures.empty()) {
        std::cout << std::endl << "  Failures:" << std::endl;
        for (const auto& f : summary.failures) {
            std::cout << "    ✗ [" << PipelineStageToString(f.stage) << "] "
                      << (f.title.empty() ? f.item_id : f.title)
                      << " (" << ErrorKindToString(f.error) << "): " << f.message << std::endl;
        }
    }

    if (!status.ok()) {
        std::cerr << std::endl << "ERROR: " << ErrorKindToString(status.kind)
                  << ": " << summary.failure_reason << std::endl;
        return 1;
    }
    return 0;
}
