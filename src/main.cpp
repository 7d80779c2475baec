#include "multiprogress/jobs.hpp"
#include "multiprogress/multi_progress.hpp"
#include "multiprogress/summary.hpp"
#include "multiprogress/terminal.hpp"

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace {
void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-d <directory>] [-x <command>]... [<url1> <file1> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -x <command>     Run a shell command as a task (repeatable)\n"
              << "  -h, --help       Show this message\n"
              << "Environment:\n"
              << "  COLUMNS                   Override the detected terminal width\n"
              << "  MULTIPROGRESS_DEBUG=true  Print layout diagnostics to stderr" << std::endl;
}
} // namespace

int main(int argc, char** argv) {
    try {
        std::filesystem::path download_dir = std::filesystem::current_path();
        std::vector<multiprogress::Job> jobs;
        std::vector<std::string> commands;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-d") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }

                download_dir = argv[arg_index + 1];
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                         + download_dir.string() + " - " + ec.message());
                }
                arg_index += 2;
            } else if (option == "-x") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }

                commands.emplace_back(argv[arg_index + 1]);
                arg_index += 2;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if ((argc - arg_index) % 2 != 0 || (commands.empty() && argc - arg_index < 2)) {
            printUsage(argv[0]);
            return 1;
        }

        for (auto& command : commands) {
            jobs.push_back(multiprogress::makeCommandJob(std::move(command)));
        }
        if (arg_index < argc) {
            multiprogress::ensureCurlInitialized();
        }
        for (int i = arg_index; i < argc; i += 2) {
            const std::filesystem::path destination = download_dir / argv[i + 1];
            jobs.push_back(multiprogress::makeDownloadJob(argv[i], destination.string()));
        }

        multiprogress::MultiProgress progress;
        std::vector<multiprogress::ProgressSpinnerPtr> bars;
        bars.reserve(jobs.size());
        for (std::size_t i = 0; i < jobs.size(); ++i) {
            bars.push_back(progress.addBar(fmt::format("job-{}", i), jobs[i].description));
        }

        multiprogress::ensureInitialLines(std::cout, static_cast<int>(bars.size()));
        progress.start();

        std::vector<std::thread> workers;
        workers.reserve(jobs.size());
        for (std::size_t i = 0; i < jobs.size(); ++i) {
            workers.emplace_back([&job = jobs[i], bar = bars[i]]() {
                multiprogress::runJob(job, bar);
            });
        }
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        progress.stop();

        std::size_t succeeded = 0;
        std::vector<std::string> failed;
        for (const auto& bar : bars) {
            if (bar->status() == multiprogress::TaskStatus::Success) {
                ++succeeded;
            } else {
                failed.push_back(bar->description());
            }
        }
        multiprogress::printSummary(std::cout, bars.size(), succeeded, failed);

        return failed.empty() ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
