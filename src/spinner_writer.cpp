#include "multiprogress/spinner_writer.hpp"

#include <utility>

namespace multiprogress {

SpinnerWriter::SpinnerWriter(ProgressSpinnerPtr bar) : bar_(std::move(bar)) {}

std::size_t SpinnerWriter::write(const char* /*data*/, std::size_t size) {
    if (bar_) {
        bar_->addBytes(size);
    }
    return size;
}

std::size_t SpinnerWriter::curlWriteCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* writer = static_cast<SpinnerWriter*>(userdata);
    if (!writer) {
        return 0;
    }
    return writer->write(ptr, size * nmemb);
}

std::streamsize SpinnerWriter::xsputn(const char_type* s, std::streamsize count) {
    if (count <= 0) {
        return 0;
    }
    write(s, static_cast<std::size_t>(count));
    return count;
}

SpinnerWriter::int_type SpinnerWriter::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }
    write(nullptr, 1);
    return ch;
}

} // namespace multiprogress
