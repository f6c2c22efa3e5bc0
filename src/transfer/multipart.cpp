#include "outbox/transfer/multipart.hpp"

#include <random>

namespace outbox::transfer {

namespace {

// Quotes and CR/LF cannot appear inside a quoted parameter.
std::string quote_safe(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\r' || c == '\n') {
            out += '_';
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace

MultipartBuilder::MultipartBuilder()
    : boundary_(generate_boundary()) {}

MultipartBuilder::MultipartBuilder(std::string boundary)
    : boundary_(std::move(boundary)) {}

MultipartBuilder& MultipartBuilder::add_field(const std::string& name, const std::string& value) {
    parts_.push_back({"Content-Disposition: form-data; name=\"" + quote_safe(name) + "\"\r\n", value});
    return *this;
}

MultipartBuilder& MultipartBuilder::add_file(const std::string& name,
                                             const std::string& filename,
                                             const std::string& content_type,
                                             std::string data) {
    parts_.push_back({"Content-Disposition: form-data; name=\"" + quote_safe(name)
                          + "\"; filename=\"" + quote_safe(filename) + "\"\r\n"
                          + "Content-Type: " + content_type + "\r\n",
                      std::move(data)});
    return *this;
}

std::string MultipartBuilder::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartBuilder::build() const {
    std::size_t size = boundary_.size() + 8;
    for (const auto& part : parts_) {
        size += boundary_.size() + part.headers.size() + part.data.size() + 10;
    }

    std::string body;
    body.reserve(size);
    for (const auto& part : parts_) {
        body += "--";
        body += boundary_;
        body += "\r\n";
        body += part.headers;
        body += "\r\n";
        body += part.data;
        body += "\r\n";
    }
    body += "--";
    body += boundary_;
    body += "--\r\n";
    return body;
}

std::string MultipartBuilder::generate_boundary() {
    static constexpr char kHex[] = "0123456789abcdef";
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 15);

    std::string boundary = "----outbox-";
    for (int i = 0; i < 32; ++i) {
        boundary += kHex[digit(engine)];
    }
    return boundary;
}

} // namespace outbox::transfer
