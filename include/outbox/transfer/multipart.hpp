#pragma once

#include <string>
#include <vector>

namespace outbox::transfer {

/**
 * @brief Assembles a multipart/form-data request body (RFC 7578)
 *
 * Parts are emitted in the order they were added.
 */
class MultipartBuilder {
public:
    MultipartBuilder();
    explicit MultipartBuilder(std::string boundary);

    MultipartBuilder& add_field(const std::string& name, const std::string& value);
    MultipartBuilder& add_file(const std::string& name,
                               const std::string& filename,
                               const std::string& content_type,
                               std::string data);

    /// "multipart/form-data; boundary=..."
    std::string content_type() const;
    const std::string& boundary() const { return boundary_; }

    std::string build() const;

    /// 32 random hex digits behind a fixed prefix.
    static std::string generate_boundary();

private:
    struct Part {
        std::string headers;
        std::string data;
    };

    std::string boundary_;
    std::vector<Part> parts_;
};

} // namespace outbox::transfer
