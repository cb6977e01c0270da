#include "httpclient.hpp"

HttpTransport::HttpTransport(IoQueue& io, uint64_t timeoutMs, std::string userAgent)
    : io_(io)
    , timeoutMs_(timeoutMs)
    , userAgent_(std::move(userAgent))
{
}

void HttpTransport::request(Method method, const std::string& urlStr, const HeaderMap<>& headers,
    const std::string& body, Callback cb)
{
    const auto url = Url::parse(urlStr);
    if (!url) {
        slog::error("Could not parse URL for request: '", urlStr, "'");
        cb(std::make_error_code(std::errc::invalid_argument), Response());
        return;
    }

    auto requestHeaders = headers;
    if (!requestHeaders.contains("User-Agent")) {
        requestHeaders.set("User-Agent", userAgent_);
    }

    slog::debug(toString(method), " ", urlStr);
    if (url->scheme == "http") {
        auto session
            = ClientSession<TcpConnectionFactory>::create(io_, url->host, url->port, timeoutMs_);
        session->request(method, url->target, requestHeaders, body, std::move(cb));
    } else if (url->scheme == "https") {
        auto session = ClientSession<SslClientConnectionFactory>::create(
            io_, url->host, url->port, timeoutMs_);
        session->request(method, url->target, requestHeaders, body, std::move(cb));
    } else {
        slog::error("Invalid scheme in request url: '", url->scheme, "'");
        cb(std::make_error_code(std::errc::protocol_not_supported), Response());
    }
}
