#pragma once

#include "progress_spinner.hpp"

#include <string>

namespace multiprogress {

// A unit of background work that drives one progress task.
struct Job {
    enum class Kind {
        Download,
        Command,
    };

    Kind kind{Kind::Command};
    std::string description;
    std::string source;      // URL or shell command line
    std::string destination; // output file of a download
};

[[nodiscard]] Job makeDownloadJob(std::string url, std::string destination);
[[nodiscard]] Job makeCommandJob(std::string command);

// Runs curl_global_init once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

// Each runner starts the task and leaves it in Success or Failed. The return
// value says which.
bool runDownload(const ProgressSpinnerPtr& bar, const std::string& url, const std::string& destination);
bool runCommand(const ProgressSpinnerPtr& bar, const std::string& command);
bool runJob(const Job& job, const ProgressSpinnerPtr& bar);

} // namespace multiprogress
