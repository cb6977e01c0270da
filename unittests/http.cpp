#include "test.hpp"

#include "http.hpp"

TEST_CASE("Url::parse")
{
    const auto url = Url::parse("https://acme-v02.api.letsencrypt.org/directory");
    TEST_REQUIRE(url);
    TEST_CHECK(url->scheme == "https");
    TEST_CHECK(url->host == "acme-v02.api.letsencrypt.org");
    TEST_CHECK(url->port == 0);
    TEST_CHECK(url->target == "/directory");

    const auto withPort = Url::parse("HTTP://localhost:14000/dir?x=1#frag");
    TEST_REQUIRE(withPort);
    TEST_CHECK(withPort->scheme == "http");
    TEST_CHECK(withPort->port == 14000);
    TEST_CHECK(withPort->target == "/dir?x=1");

    const auto noPath = Url::parse("https://[::1]:8443");
    TEST_REQUIRE(noPath);
    TEST_CHECK(noPath->host == "::1");
    TEST_CHECK(noPath->port == 8443);
    TEST_CHECK(noPath->target == "/");
}

TEST_CASE("Url::parse fails")
{
    TEST_CHECK(!Url::parse("/relative/path"));
    TEST_CHECK(!Url::parse("https://"));
    TEST_CHECK(!Url::parse("https://host:port/"));
    TEST_CHECK(!Url::parse("https://host:99999/"));
    TEST_CHECK(!Url::parse("https://[::1/"));
}

TEST_CASE("Response::parse")
{
    const auto resp = Response::parse("HTTP/1.1 201 Created\r\n"
                                      "Replay-Nonce: abc\r\n"
                                      "location:  https://ca/acme/acct/1 \r\n"
                                      "\r\n"
                                      "{}");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::Created);
    TEST_CHECK(resp->headers.get("replay-nonce") == std::optional<std::string_view>("abc"));
    TEST_CHECK(resp->headers.get("Location")
        == std::optional<std::string_view>("https://ca/acme/acct/1"));
    TEST_CHECK(resp->body == "{}");

    const auto noHeaders = Response::parse("HTTP/1.1 204 No Content\r\n\r\n");
    TEST_REQUIRE(noHeaders);
    TEST_CHECK(noHeaders->status == StatusCode::NoContent);
    TEST_CHECK(noHeaders->body.empty());
}

TEST_CASE("Response::parse fails")
{
    TEST_CHECK(!Response::parse("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n"));
    TEST_CHECK(!Response::parse("SPDY 200 OK\r\n\r\n"));
    TEST_CHECK(!Response::parse("HTTP/1.1 abc OK\r\n\r\n"));
    TEST_CHECK(!Response::parse("HTTP/1.1 200 OK\r\nno colon\r\n\r\n"));
}

TEST_CASE("isSuccess")
{
    TEST_CHECK(isSuccess(StatusCode::Ok));
    TEST_CHECK(isSuccess(StatusCode::NoContent));
    TEST_CHECK(isSuccess(static_cast<StatusCode>(299)));
    TEST_CHECK(!isSuccess(static_cast<StatusCode>(301)));
    TEST_CHECK(!isSuccess(StatusCode::BadRequest));
}

TEST_CASE("decodeChunked")
{
    TEST_CHECK(decodeChunked("4\r\nWiki\r\n6;ext=1\r\npedia \r\nE\r\nin \r\n\r\nchunks.\r\n0\r\n\r\n")
        == std::optional<std::string>("Wikipedia in \r\n\r\nchunks."));
    TEST_CHECK(decodeChunked("0\r\nTrailer: x\r\n\r\n") == std::optional<std::string>(""));
}

TEST_CASE("decodeChunked incomplete or malformed")
{
    TEST_CHECK(!decodeChunked("4\r\nWiki\r\n"));
    TEST_CHECK(!decodeChunked("4\r\nWi"));
    TEST_CHECK(!decodeChunked("zz\r\nWiki\r\n0\r\n\r\n"));
    TEST_CHECK(!decodeChunked("2\r\nWiki\r\n0\r\n\r\n"));
}

TEST_CASE("HeaderMap is case-insensitive")
{
    HeaderMap<> headers;
    headers.add("Content-Type", "application/jose+json");
    TEST_CHECK(headers.contains("content-type"));
    TEST_CHECK(headers.set("CONTENT-TYPE", "text/plain") == 1);
    TEST_CHECK(headers.get("Content-Type") == std::optional<std::string_view>("text/plain"));
    TEST_CHECK(headers.remove("content-type") == 1);
    TEST_CHECK(!headers.contains("Content-Type"));
}

namespace {
using State = ResponseReader::State;
}

TEST_CASE("ResponseReader with Content-Length")
{
    ResponseReader reader(Method::Post);
    TEST_CHECK(reader.feed("HTTP/1.1 201 Created\r\nContent-Length: 5\r\nLoc", false)
        == State::Incomplete);
    TEST_CHECK(reader.feed("ation: https://ca/order/1\r\n\r\nab", false) == State::Incomplete);
    TEST_CHECK(reader.feed("cde", false) == State::Complete);
    TEST_CHECK(reader.response().status == StatusCode::Created);
    TEST_CHECK(reader.response().body == "abcde");
}

TEST_CASE("ResponseReader with chunked body")
{
    ResponseReader reader(Method::Get);
    TEST_CHECK(reader.feed("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n",
                   false)
        == State::Incomplete);
    TEST_CHECK(reader.feed("0\r\n\r\n", false) == State::Complete);
    TEST_CHECK(reader.response().body == "abc");
}

TEST_CASE("ResponseReader reads until close")
{
    ResponseReader reader(Method::Get);
    TEST_CHECK(reader.feed("HTTP/1.1 200 OK\r\n\r\n-----BEGIN", false) == State::Incomplete);
    TEST_CHECK(reader.feed(" CERTIFICATE-----", false) == State::Incomplete);
    TEST_CHECK(reader.feed("", true) == State::Complete);
    TEST_CHECK(reader.response().body == "-----BEGIN CERTIFICATE-----");
}

TEST_CASE("ResponseReader without body")
{
    ResponseReader head(Method::Head);
    TEST_CHECK(head.feed("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n", false)
        == State::Complete);
    TEST_CHECK(head.response().body.empty());

    ResponseReader noContent(Method::Post);
    TEST_CHECK(noContent.feed("HTTP/1.1 204 No Content\r\n\r\n", false) == State::Complete);
}

TEST_CASE("ResponseReader errors")
{
    ResponseReader truncated(Method::Get);
    TEST_CHECK(truncated.feed("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc", true)
        == State::Error);
    TEST_CHECK(truncated.error() == std::make_error_code(std::errc::connection_reset));

    ResponseReader noHeader(Method::Get);
    TEST_CHECK(noHeader.feed("HTTP/1.1 200 OK\r\n", true) == State::Error);
    TEST_CHECK(noHeader.error() == std::make_error_code(std::errc::connection_reset));

    ResponseReader encoding(Method::Get);
    TEST_CHECK(encoding.feed("HTTP/1.1 200 OK\r\nTransfer-Encoding: gzip\r\n\r\n", false)
        == State::Error);
    TEST_CHECK(encoding.error() == std::make_error_code(std::errc::bad_message));

    ResponseReader length(Method::Get);
    TEST_CHECK(length.feed("HTTP/1.1 200 OK\r\nContent-Length: x\r\n\r\n", false) == State::Error);
    TEST_CHECK(length.error() == std::make_error_code(std::errc::bad_message));
}

TEST_CASE("ResponseReader limits the response size")
{
    ResponseReader untilClose(Method::Get, 64);
    TEST_CHECK(untilClose.feed("HTTP/1.1 200 OK\r\n\r\n", false) == State::Incomplete);
    TEST_CHECK(untilClose.feed(std::string(40, 'a'), false) == State::Incomplete);
    TEST_CHECK(untilClose.feed(std::string(40, 'a'), false) == State::Error);
    TEST_CHECK(untilClose.error() == std::make_error_code(std::errc::message_size));

    ResponseReader declared(Method::Get, 64);
    TEST_CHECK(declared.feed("HTTP/1.1 200 OK\r\nContent-Length: 1000000\r\n\r\n", false)
        == State::Error);
    TEST_CHECK(declared.error() == std::make_error_code(std::errc::message_size));

    ResponseReader exact(Method::Get, 64);
    const std::string head = "HTTP/1.1 200 OK\r\n\r\n";
    TEST_CHECK(exact.feed(head + std::string(64 - head.size(), 'a'), true) == State::Complete);
}
