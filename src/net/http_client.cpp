#include "outbox/net/http_client.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <optional>

namespace outbox::net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

/**
 * @brief One request/response round trip
 *
 * Follows the same shared_from_this chaining as a server-side connection:
 * every async step captures `self` so the exchange lives until the last
 * handler has run. resolve → connect → header → body slices → read.
 */
class HttpExchange : public std::enable_shared_from_this<HttpExchange> {
public:
    HttpExchange(asio::io_context& io_context,
                 http::request<http::empty_body> header,
                 std::string body,
                 std::chrono::milliseconds timeout,
                 const SendProgress* progress)
        : resolver_(io_context)
        , stream_(io_context)
        , header_(std::move(header))
        , body_(std::move(body))
        , timeout_(timeout)
        , progress_(progress) {}

    void start(const std::string& host, std::uint16_t port) {
        auto self = shared_from_this();
        resolver_.async_resolve(host, std::to_string(port),
            [this, self](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    return fail(ec, "resolve");
                }
                stream_.expires_after(timeout_);
                stream_.async_connect(results,
                    [this, self](beast::error_code connect_ec, const tcp::endpoint&) {
                        if (connect_ec) {
                            return fail(connect_ec, "connect");
                        }
                        write_header();
                    });
            });
    }

    Result<HttpReply> result() const {
        if (reply_) {
            return Ok(*reply_);
        }
        return Fail<HttpReply>(ErrorCode::TransportError,
                               error_.empty() ? std::string("HTTP exchange did not complete") : error_);
    }

private:
    void write_header() {
        auto self = shared_from_this();
        stream_.expires_after(timeout_);
        http::async_write(stream_, header_,
            [this, self](beast::error_code ec, std::size_t) {
                if (ec) {
                    return fail(ec, "write header");
                }
                report_progress();
                write_body();
            });
    }

    void write_body() {
        if (sent_ >= body_.size()) {
            return read_response();
        }

        auto self = shared_from_this();
        const auto slice = std::min(BeastHttpClient::kWriteChunkSize, body_.size() - sent_);
        stream_.expires_after(timeout_);
        asio::async_write(stream_, asio::buffer(body_.data() + sent_, slice),
            [this, self](beast::error_code ec, std::size_t written) {
                if (ec) {
                    return fail(ec, "write body");
                }
                sent_ += written;
                report_progress();
                write_body();
            });
    }

    void read_response() {
        auto self = shared_from_this();
        stream_.expires_after(timeout_);
        http::async_read(stream_, buffer_, response_,
            [this, self](beast::error_code ec, std::size_t) {
                if (ec) {
                    return fail(ec, "read response");
                }
                HttpReply reply;
                reply.status = static_cast<int>(response_.result_int());
                reply.body = std::move(response_.body());
                reply.content_type = std::string(response_[http::field::content_type]);
                reply_ = std::move(reply);

                beast::error_code shutdown_ec;
                stream_.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
                if (shutdown_ec && shutdown_ec != beast::errc::not_connected) {
                    spdlog::debug("HTTP socket shutdown: {}", shutdown_ec.message());
                }
            });
    }

    void report_progress() {
        if (progress_ && *progress_ && !body_.empty()) {
            (*progress_)(sent_, body_.size());
        }
    }

    void fail(beast::error_code ec, const char* stage) {
        if (ec == beast::error::timeout) {
            error_ = std::string("timed out during ") + stage;
        } else {
            error_ = std::string(stage) + " failed: " + ec.message();
        }
    }

    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    http::request<http::empty_body> header_;
    std::string body_;
    std::chrono::milliseconds timeout_;
    const SendProgress* progress_;

    std::size_t sent_ = 0;
    beast::flat_buffer buffer_;
    http::response<http::string_body> response_;
    std::optional<HttpReply> reply_;
    std::string error_;
};

} // namespace

BeastHttpClient::BeastHttpClient(std::string user_agent)
    : user_agent_(std::move(user_agent)) {}

Result<HttpReply> BeastHttpClient::get(const Url& url, std::chrono::milliseconds timeout) {
    return execute(url, false, {}, {}, timeout, nullptr);
}

Result<HttpReply> BeastHttpClient::post(const Url& url,
                                        const std::string& content_type,
                                        std::string body,
                                        std::chrono::milliseconds timeout,
                                        const SendProgress& progress) {
    return execute(url, true, content_type, std::move(body), timeout, &progress);
}

Result<HttpReply> BeastHttpClient::execute(const Url& url,
                                           bool is_post,
                                           const std::string& content_type,
                                           std::string body,
                                           std::chrono::milliseconds timeout,
                                           const SendProgress* progress) {
    http::request<http::empty_body> header{is_post ? http::verb::post : http::verb::get, url.target, 11};
    header.set(http::field::host, url.host_header());
    header.set(http::field::user_agent, user_agent_);
    header.keep_alive(false);
    if (is_post) {
        header.set(http::field::content_type, content_type);
        header.content_length(body.size());
    }

    try {
        asio::io_context io_context;
        auto exchange = std::make_shared<HttpExchange>(io_context, std::move(header), std::move(body),
                                                       timeout, progress);
        exchange->start(url.host, url.port);
        io_context.run();
        return exchange->result();
    } catch (const boost::system::system_error& e) {
        return Fail<HttpReply>(ErrorCode::TransportError, e.what());
    }
}

} // namespace outbox::net
