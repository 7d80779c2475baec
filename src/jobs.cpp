#include "multiprogress/jobs.hpp"
#include "multiprogress/spinner_writer.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <sys/wait.h>

namespace multiprogress {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

struct DownloadContext {
    FILE* file{nullptr};
    SpinnerWriter* sink{nullptr};
};

// Writes the chunk to disk, then reports what landed there through the task's sink.
std::size_t downloadWriteCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<DownloadContext*>(userdata);
    if (!ctx || !ctx->file) {
        return 0;
    }

    const std::size_t written = std::fwrite(ptr, 1, size * nmemb, ctx->file);
    if (ctx->sink && written > 0) {
        SpinnerWriter::curlWriteCallback(ptr, 1, written, ctx->sink);
    }
    return written;
}

std::string displayName(const std::string& destination) {
    std::string name = std::filesystem::path{destination}.filename().string();
    if (name.empty()) {
        name = destination;
    }
    if (name.empty()) {
        name = "(unnamed)";
    }
    return name;
}

std::string describeExitStatus(int status) {
    if (WIFEXITED(status)) {
        return fmt::format("exited with status {}", WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return fmt::format("terminated by signal {}", WTERMSIG(status));
    }
    return fmt::format("ended with wait status {}", status);
}

} // namespace

Job makeDownloadJob(std::string url, std::string destination) {
    Job job;
    job.kind = Job::Kind::Download;
    job.description = displayName(destination);
    job.source = std::move(url);
    job.destination = std::move(destination);
    return job;
}

Job makeCommandJob(std::string command) {
    Job job;
    job.kind = Job::Kind::Command;
    job.description = command;
    job.source = std::move(command);
    return job;
}

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

bool runDownload(const ProgressSpinnerPtr& bar, const std::string& url, const std::string& destination) {
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    bar->start();

    std::unique_ptr<FILE, FileDeleter> file{std::fopen(destination.c_str(), "wb")};
    if (!file) {
        bar->fail("Cannot create destination file: " + destination);
        return false;
    }

    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        bar->fail("Failed to allocate curl handle");
        return false;
    }

    SpinnerWriter sink{bar};
    DownloadContext ctx{file.get(), &sink};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &downloadWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        bar->fail(std::string{"curl error: "} + curl_easy_strerror(res));
        return false;
    }

    if (std::fflush(file.get()) != 0) {
        bar->fail("Failed to write output file: " + destination);
        return false;
    }

    bar->complete();
    return true;
}

bool runCommand(const ProgressSpinnerPtr& bar, const std::string& command) {
    bar->start();

    // stderr is folded into the pipe so that neither stream reaches the terminal.
    const std::string shell_command = "(" + command + ") 2>&1";
    FILE* pipe = popen(shell_command.c_str(), "r");
    if (!pipe) {
        bar->fail("Cannot start command: " + command);
        return false;
    }

    SpinnerWriter sink{bar};
    std::array<char, 4096> buffer{};
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        sink.write(buffer.data(), n);
    }

    const int status = pclose(pipe);
    if (status == -1) {
        bar->fail("Failed to wait for command: " + command);
        return false;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        bar->fail(describeExitStatus(status));
        return false;
    }

    bar->complete();
    return true;
}

bool runJob(const Job& job, const ProgressSpinnerPtr& bar) {
    switch (job.kind) {
    case Job::Kind::Download:
        return runDownload(bar, job.source, job.destination);
    case Job::Kind::Command:
        return runCommand(bar, job.source);
    }
    bar->skip();
    return false;
}

} // namespace multiprogress
