/**
 * @file bulk_download_example.cpp
 * @brief Download every task in a task-list JSON file
 *
 * This example demonstrates:
 * - Loading scraped download tasks with parse_task_list()
 * - Opening the checkpoint store in the download root
 * - Running the tasks through a work_dispatcher
 * - Printing the run report
 *
 * Running it twice is safe: completed files are skipped and interrupted
 * ones resume from their partial file.
 */

#include <kcenon/bulk_download/bulk_download.h>
#include <kcenon/bulk_download/core/logging.h>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::bulk_download;

namespace {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto read_text(const std::string& path, std::string& out) -> bool {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    out = oss.str();
    return true;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Bulk Download Example" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <task_list.json> <download_root>"
              << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -j, --jobs <n>          Max concurrent downloads (default: 4)" << std::endl;
    std::cout << "  --retry-forbidden       Retry HTTP 403 like a transient failure" << std::endl;
    std::cout << "  --json-logs             Emit structured JSON log lines" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::size_t jobs = 4;
    bool retry_forbidden = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-j" || arg == "--jobs") {
            if (++i >= argc) {
                std::cerr << "Error: --jobs requires an argument" << std::endl;
                return 1;
            }
            jobs = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "--retry-forbidden") {
            retry_forbidden = true;
        } else if (arg == "--json-logs") {
            get_logger().set_output_format(log_output_format::json);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string text;
    if (!read_text(positional[0], text)) {
        std::cerr << "Error: cannot read " << positional[0] << std::endl;
        return 1;
    }

    auto tasks = parse_task_list(text);
    if (!tasks) {
        std::cerr << "Error: " << tasks.error().message << std::endl;
        return 1;
    }

    auto store = checkpoint_store::open(std::filesystem::path(positional[1]));
    if (!store) {
        std::cerr << "Error: " << store.error().message << std::endl;
        return 1;
    }

    worker_config worker;
    worker.retry_forbidden = retry_forbidden;

    auto dispatcher = work_dispatcher::builder(store.value())
                          .with_concurrency(jobs)
                          .with_worker_config(worker)
                          .build();
    if (!dispatcher) {
        std::cerr << "Error: " << dispatcher.error().message << std::endl;
        return 1;
    }

    std::cout << "Downloading " << tasks.value().size() << " files with " << jobs
              << " workers" << std::endl;

    auto report = dispatcher.value().run(tasks.value());
    if (!report) {
        std::cerr << "Run aborted: " << report.error().message << std::endl;
        return 2;
    }

    const auto& r = report.value();
    for (const auto& outcome : r.outcomes) {
        if (!outcome.success) {
            std::cout << "  FAILED " << outcome.destination.string() << " ["
                      << to_string(outcome.kind) << "] " << outcome.error_message << std::endl;
        }
    }

    std::cout << std::endl;
    std::cout << "Downloaded:  " << r.downloaded << std::endl;
    std::cout << "Skipped:     " << r.skipped << std::endl;
    std::cout << "Failed:      " << r.failed << std::endl;
    std::cout << "Cancelled:   " << r.cancelled << std::endl;
    std::cout << "Transferred: " << format_bytes(r.bytes_transferred) << " in "
              << r.elapsed.count() << " ms ("
              << format_bytes(static_cast<uint64_t>(r.throughput_bytes_per_second)) << "/s)"
              << std::endl;
    if (r.protocol_restarts > 0) {
        std::cout << "Range restarts: " << r.protocol_restarts << std::endl;
    }

    auto closed = store.value().close();
    if (!closed) {
        std::cerr << "Error: " << closed.error().message << std::endl;
        return 2;
    }
    return r.all_succeeded() ? 0 : 3;
}
