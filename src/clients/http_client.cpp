#include "hybridrag/clients/http_client.hpp"
#include "hybridrag/error.hpp"
#include "hybridrag/logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <array>
#include <limits>
#include <memory>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace hybridrag {
namespace {

using Clock = std::chrono::steady_clock;

http::request<http::string_body> build_request(const HttpRequest& request, const HttpEndpoint& endpoint) {
    const http::verb verb = http::string_to_verb(request.method);
    HYBRIDRAG_CHECK_ARGUMENT(verb != http::verb::unknown, "unsupported HTTP method " + request.method);

    http::request<http::string_body> req{verb, request.target, 11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, "hybridrag");
    for (const auto& header : request.headers) {
        req.set(header.first, header.second);
    }
    if (!request.body.empty()) {
        if (req.find(http::field::content_type) == req.end()) {
            req.set(http::field::content_type, "application/json");
        }
        req.body() = request.body;
    }
    req.prepare_payload();
    return req;
}

/**
 * One request/response exchange on a private io_context. Each asynchronous
 * step is started and then driven to completion with run(), which keeps the
 * calling code sequential while leaving every socket operation cancellable
 * from another thread.
 */
class Exchange {
public:
    Exchange(const HttpEndpoint& endpoint, ssl::context* tls, const CancellationToken& token)
        : endpoint_(endpoint)
        , token_(token)
        , deadline_(Clock::now() + endpoint.timeout)
        , resolver_(ioc_)
        , plain_(ioc_) {
        if (tls) {
            secure_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, *tls);
        }
        // Posted so the cancel runs on the thread driving the io_context.
        on_cancel_ = token_.register_callback([this]() {
            asio::post(ioc_, [this]() {
                resolver_.cancel();
                lowest().cancel();
            });
        });
    }

    ~Exchange() {
        on_cancel_.reset();
        beast::error_code ec;
        lowest().socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            HYBRIDRAG_LOG_DEBUG("http {}:{} shutdown: {}", endpoint_.host, endpoint_.port, ec.message());
        }
    }

    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    void connect() {
        check("resolve");
        tcp::resolver::results_type endpoints;
        auto ec = await([&](auto handler) {
            resolver_.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
                                    [&endpoints, handler](beast::error_code e,
                                                          tcp::resolver::results_type results) mutable {
                                        endpoints = std::move(results);
                                        handler(e);
                                    });
        });
        if (ec) fail(ec, "resolve");

        arm("connect");
        ec = await([&](auto handler) { lowest().async_connect(endpoints, handler); });
        if (ec) fail(ec, "connect");

        if (secure_) {
            if (!SSL_set_tlsext_host_name(secure_->native_handle(), endpoint_.host.c_str())) {
                throw TransportError(ErrorCode::CONNECTION_FAILED, "cannot set TLS server name", where());
            }
            secure_->set_verify_callback(ssl::host_name_verification(endpoint_.host));
            arm("handshake");
            ec = await([&](auto handler) { secure_->async_handshake(ssl::stream_base::client, handler); });
            if (ec) fail(ec, "handshake");
        }
    }

    void write(const http::request<http::string_body>& req) {
        arm("write");
        auto ec = visit([&](auto& stream) {
            return await([&](auto handler) { http::async_write(stream, req, handler); });
        });
        if (ec) fail(ec, "write");
    }

    HttpResponse read_all() {
        arm("read");
        http::response<http::string_body> res;
        auto ec = visit([&](auto& stream) {
            return await([&](auto handler) { http::async_read(stream, buffer_, res, handler); });
        });
        if (ec) fail(ec, "read");

        HttpResponse response;
        response.status = res.result_int();
        response.body = std::move(res.body());
        return response;
    }

    unsigned read_streaming(const HttpClient::ChunkHandler& on_chunk) {
        http::response_parser<http::buffer_body> parser;
        parser.body_limit(std::numeric_limits<std::uint64_t>::max());

        arm("read");
        auto ec = visit([&](auto& stream) {
            return await([&](auto handler) { http::async_read_header(stream, buffer_, parser, handler); });
        });
        if (ec) fail(ec, "read");

        const unsigned status = parser.get().result_int();
        const bool ok = status >= 200 && status < 300;
        std::string error_body;

        std::array<char, 4096> chunk;
        while (!parser.is_done()) {
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();

            arm("read");
            ec = visit([&](auto& stream) {
                return await([&](auto handler) { http::async_read(stream, buffer_, parser, handler); });
            });
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) fail(ec, "read");

            const std::size_t n = chunk.size() - parser.get().body().size;
            if (n == 0) {
                continue;
            }
            if (!ok) {
                error_body.append(chunk.data(), n);
                continue;
            }
            if (!on_chunk(std::string_view(chunk.data(), n))) {
                HYBRIDRAG_LOG_DEBUG("http {}: consumer stopped the stream early", where());
                break;
            }
        }

        if (!ok) {
            throw TransportError(ErrorCode::HTTP_STATUS, "HTTP " + std::to_string(status), error_body);
        }
        return status;
    }

private:
    template<typename Initiate>
    beast::error_code await(Initiate&& initiate) {
        beast::error_code result;
        initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
        ioc_.restart();
        ioc_.run();
        return result;
    }

    template<typename F>
    beast::error_code visit(F&& f) {
        if (secure_) {
            return f(*secure_);
        }
        return f(plain_);
    }

    beast::tcp_stream& lowest() {
        return secure_ ? beast::get_lowest_layer(*secure_) : plain_;
    }

    std::string where() const {
        return endpoint_.host + ":" + std::to_string(endpoint_.port);
    }

    void check(const char* stage) {
        if (token_.is_cancelled()) {
            throw CancelledError(std::string("http ") + stage + " cancelled", where());
        }
        if (Clock::now() >= deadline_) {
            throw TransportError(ErrorCode::NETWORK_TIMEOUT, std::string("http ") + stage + " timed out", where());
        }
    }

    // Applies what is left of the overall timeout to the next operation.
    void arm(const char* stage) {
        check(stage);
        lowest().expires_at(deadline_);
    }

    [[noreturn]] void fail(const beast::error_code& ec, const char* stage) {
        if (token_.is_cancelled()) {
            throw CancelledError(std::string("http ") + stage + " cancelled", where());
        }
        if (ec == beast::error::timeout || Clock::now() >= deadline_) {
            throw TransportError(ErrorCode::NETWORK_TIMEOUT,
                                 std::string("http ") + stage + " timed out", where());
        }
        if (ec.category() == http::make_error_code(http::error::bad_version).category()) {
            throw TransportError(ErrorCode::PROTOCOL_ERROR,
                                 std::string("http ") + stage + ": " + ec.message(), where());
        }
        throw TransportError(ErrorCode::CONNECTION_FAILED,
                             std::string("http ") + stage + ": " + ec.message(), where());
    }

    const HttpEndpoint& endpoint_;
    CancellationToken token_;
    Clock::time_point deadline_;
    asio::io_context ioc_;
    tcp::resolver resolver_;
    beast::tcp_stream plain_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> secure_;
    beast::flat_buffer buffer_;
    CallbackRegistration on_cancel_;
};

} // namespace

HttpClient::HttpClient(HttpEndpoint endpoint) : endpoint_(std::move(endpoint)) {
    HYBRIDRAG_CHECK_ARGUMENT(!endpoint_.host.empty(), "HTTP endpoint host is required");
    if (endpoint_.use_tls) {
        ssl_context_ = std::make_shared<ssl::context>(ssl::context::tls_client);
        ssl_context_->set_default_verify_paths();
        ssl_context_->set_verify_mode(ssl::verify_peer);
    }
}

HttpResponse HttpClient::send(const HttpRequest& request, const CancellationToken& token) {
    HYBRIDRAG_LOG_DEBUG("HTTP {} {}:{}{}", request.method, endpoint_.host, endpoint_.port, request.target);
    auto req = build_request(request, endpoint_);

    Exchange exchange(endpoint_, ssl_context_.get(), token);
    exchange.connect();
    exchange.write(req);
    HttpResponse response = exchange.read_all();

    HYBRIDRAG_LOG_DEBUG("HTTP {} {} -> {}", request.method, request.target, response.status);
    return response;
}

unsigned HttpClient::send_streaming(const HttpRequest& request, const ChunkHandler& on_chunk,
                                    const CancellationToken& token) {
    HYBRIDRAG_LOG_DEBUG("HTTP {} {}:{}{} (streaming)", request.method, endpoint_.host, endpoint_.port,
                        request.target);
    auto req = build_request(request, endpoint_);

    Exchange exchange(endpoint_, ssl_context_.get(), token);
    exchange.connect();
    exchange.write(req);
    return exchange.read_streaming(on_chunk);
}

} // namespace hybridrag
