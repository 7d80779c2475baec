#pragma once

#include "progress_spinner.hpp"

#include <cstddef>
#include <streambuf>

namespace multiprogress {

// Counts bytes written into task progress and drops the payload.
class SpinnerWriter : public std::streambuf {
public:
    explicit SpinnerWriter(ProgressSpinnerPtr bar);

    // Always consumes everything, including empty writes.
    std::size_t write(const char* data, std::size_t size);

    // libcurl write callback; userdata is the SpinnerWriter.
    static std::size_t curlWriteCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);

    [[nodiscard]] const ProgressSpinnerPtr& bar() const noexcept { return bar_; }

protected:
    std::streamsize xsputn(const char_type* s, std::streamsize count) override;
    int_type overflow(int_type ch) override;

private:
    ProgressSpinnerPtr bar_;
};

} // namespace multiprogress
