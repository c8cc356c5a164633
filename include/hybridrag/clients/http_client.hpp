#pragma once

#include "hybridrag/cancellation.hpp"

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace hybridrag {

struct HttpEndpoint {
    std::string host = "localhost";
    std::uint16_t port = 80;
    bool use_tls = false;
    std::chrono::milliseconds timeout{30000};
};

struct HttpRequest {
    std::string method = "GET";  // GET | POST | PUT | DELETE
    std::string target = "/";
    std::string body;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    unsigned status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * Blocking HTTP/1.1 client over Boost.Beast, one connection per call.
 *
 * Every call runs on its own io_context with an overall timeout. A
 * cancellation token cancels the socket operations in flight, so an
 * abandoned call releases its connection immediately. Transport problems
 * throw TransportError; cancellation throws CancelledError. Non-2xx
 * responses are returned, not thrown.
 */
class HttpClient {
public:
    // Receives body bytes as they are read; return false to stop reading.
    using ChunkHandler = std::function<bool(std::string_view chunk)>;

    explicit HttpClient(HttpEndpoint endpoint);
    virtual ~HttpClient() = default;

    virtual HttpResponse send(const HttpRequest& request, const CancellationToken& token = {});

    // Streams the body; returns the status. A non-2xx status is read in full
    // and thrown as TransportError(HTTP_STATUS) with the body as context.
    virtual unsigned send_streaming(const HttpRequest& request, const ChunkHandler& on_chunk,
                                    const CancellationToken& token = {});

    const HttpEndpoint& endpoint() const { return endpoint_; }

protected:
    // For test doubles that never touch the network.
    HttpClient() = default;

private:
    HttpEndpoint endpoint_;
    std::shared_ptr<boost::asio::ssl::context> ssl_context_;
};

} // namespace hybridrag
