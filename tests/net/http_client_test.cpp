#include "outbox/net/http_client.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

using namespace outbox;
using namespace outbox::net;

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

/**
 * One-connection HTTP server on 127.0.0.1 with an ephemeral port
 *
 * Reply mode answers the first request with a canned response. Silent mode
 * accepts the connection and never reads or writes, which is what a hung
 * server looks like to the client.
 */
class LoopbackServer {
public:
    enum class Mode {
        Reply,
        Silent
    };

    explicit LoopbackServer(http::response<http::string_body> response, Mode mode = Mode::Reply)
        : acceptor_(io_context_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        , response_(std::move(response))
        , mode_(mode) {
        acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
            on_accept(ec, std::move(socket));
        });
        thread_ = std::thread([this] { io_context_.run(); });
    }

    ~LoopbackServer() {
        io_context_.stop();
        thread_.join();
    }

    Url url(const std::string& target) const {
        Url result;
        result.host = "127.0.0.1";
        result.port = acceptor_.local_endpoint().port();
        result.target = target;
        return result;
    }

    std::optional<http::request<http::string_body>> received() const {
        std::lock_guard lock(mutex_);
        return received_;
    }

private:
    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            return;
        }
        socket_.emplace(std::move(socket));
        if (mode_ == Mode::Silent) {
            return;
        }

        http::async_read(*socket_, buffer_, request_, [this](beast::error_code read_ec, std::size_t) {
            if (read_ec) {
                return;
            }
            {
                std::lock_guard lock(mutex_);
                received_ = request_;
            }
            response_.prepare_payload();
            http::async_write(*socket_, response_, [this](beast::error_code, std::size_t) {
                beast::error_code ignored;
                socket_->shutdown(tcp::socket::shutdown_send, ignored);
            });
        });
    }

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    http::response<http::string_body> response_;
    Mode mode_;

    std::optional<tcp::socket> socket_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;

    mutable std::mutex mutex_;
    std::optional<http::request<http::string_body>> received_;
    std::thread thread_;
};

http::response<http::string_body> make_response(http::status status, std::string body, const std::string& type) {
    http::response<http::string_body> response{status, 11};
    response.set(http::field::content_type, type);
    response.body() = std::move(body);
    return response;
}

} // namespace

TEST(BeastHttpClientTest, PostStreamsBodyInSlicesWithProgress) {
    LoopbackServer server(make_response(http::status::created, R"({"ok":true})", "application/json"));
    BeastHttpClient client;

    const std::string body(200 * 1000, 'x');
    std::vector<std::pair<std::uint64_t, std::uint64_t>> progress;
    auto reply = client.post(server.url("/_api/v1/upload"), "multipart/form-data; boundary=abc", body,
                             std::chrono::milliseconds(5000),
                             [&](std::uint64_t sent, std::uint64_t total) { progress.emplace_back(sent, total); });

    ASSERT_TRUE(reply.is_ok()) << reply.error().message;
    EXPECT_EQ(reply.value().status, 201);
    EXPECT_TRUE(reply.value().is_success());
    EXPECT_EQ(reply.value().body, R"({"ok":true})");
    EXPECT_EQ(reply.value().content_type, "application/json");

    // One report after the header, then one per slice at least.
    const auto slices = (body.size() + BeastHttpClient::kWriteChunkSize - 1) / BeastHttpClient::kWriteChunkSize;
    ASSERT_GE(progress.size(), slices + 1);
    EXPECT_EQ(progress.front().first, 0u);
    for (std::size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GE(progress[i].first, progress[i - 1].first);
        EXPECT_EQ(progress[i].second, body.size());
    }
    EXPECT_EQ(progress.back().first, body.size());

    auto request = server.received();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method(), http::verb::post);
    EXPECT_EQ(std::string(request->target()), "/_api/v1/upload");
    EXPECT_EQ(request->body().size(), body.size());
    EXPECT_EQ(std::string((*request)[http::field::content_type]), "multipart/form-data; boundary=abc");
}

TEST(BeastHttpClientTest, GetReturnsErrorStatusAsReply) {
    LoopbackServer server(make_response(http::status::service_unavailable, "down", "text/plain"));
    BeastHttpClient client("outbox-test/1.0");

    const auto url = server.url("/_api/v1/health");
    auto reply = client.get(url, std::chrono::milliseconds(5000));

    ASSERT_TRUE(reply.is_ok()) << reply.error().message;
    EXPECT_EQ(reply.value().status, 503);
    EXPECT_FALSE(reply.value().is_success());
    EXPECT_EQ(reply.value().body, "down");
    EXPECT_EQ(reply.value().content_type, "text/plain");

    auto request = server.received();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method(), http::verb::get);
    EXPECT_EQ(std::string((*request)[http::field::host]), url.host_header());
    EXPECT_EQ(std::string((*request)[http::field::user_agent]), "outbox-test/1.0");
}

TEST(BeastHttpClientTest, SilentServerTimesOut) {
    LoopbackServer server(make_response(http::status::ok, "", "text/plain"), LoopbackServer::Mode::Silent);
    BeastHttpClient client;

    const auto started = std::chrono::steady_clock::now();
    auto reply = client.get(server.url("/_api/v1/health"), std::chrono::milliseconds(200));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(reply.is_error());
    EXPECT_EQ(reply.error().code, ErrorCode::TransportError);
    EXPECT_EQ(reply.error().message, "timed out during read response");
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(BeastHttpClientTest, RefusedConnectionIsTransportError) {
    std::uint16_t port = 0;
    {
        // Grab a free port, then close it so nothing listens there.
        asio::io_context io_context;
        tcp::acceptor reserved(io_context, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        port = reserved.local_endpoint().port();
    }

    Url url;
    url.host = "127.0.0.1";
    url.port = port;
    url.target = "/";

    BeastHttpClient client;
    auto reply = client.get(url, std::chrono::milliseconds(2000));
    ASSERT_TRUE(reply.is_error());
    EXPECT_EQ(reply.error().code, ErrorCode::TransportError);
    EXPECT_EQ(reply.error().message.rfind("connect failed", 0), 0u) << reply.error().message;
}
