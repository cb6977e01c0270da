#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "string.hpp"

enum class Method {
    Get,
    Head,
    Post,
};

std::string toString(Method method);

// Only the codes an ACME server is documented to send (RFC 8555, Section 6.7) plus the generic
// ones. Anything else is carried through as its numeric value.
enum class StatusCode : uint32_t {
    Invalid = 0,

    Ok = 200,
    Created = 201,
    NoContent = 204,

    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    Conflict = 409,
    UnsupportedMediaType = 415,
    TooManyRequests = 429,

    InternalServerError = 500,
    ServiceUnavailable = 503,
};

inline bool isSuccess(StatusCode status)
{
    return static_cast<uint32_t>(status) / 100 == 2;
}

template <typename StringType = std::string>
class HeaderMap {
public:
    HeaderMap() = default;
    HeaderMap(std::vector<std::pair<StringType, StringType>> h);

    bool contains(std::string_view name) const;
    std::optional<std::string_view> get(std::string_view name) const;
    std::optional<std::string_view> operator[](std::string_view name) const; // get
    const std::vector<std::pair<StringType, StringType>>& getEntries() const;

    void add(std::string_view name, std::string_view value);
    size_t set(std::string_view name, std::string_view value);
    size_t remove(std::string_view name);

    bool parse(std::string_view str);
    void serialize(std::string& str) const;

private:
    std::optional<size_t> find(std::string_view name) const;

    std::vector<std::pair<StringType, StringType>> headers_;
};

extern template class HeaderMap<std::string_view>;
extern template class HeaderMap<std::string>;

// Absolute http(s) URLs only. The ACME directory hands us nothing else.
struct Url {
    std::string fullRaw;
    std::string scheme;
    std::string host;
    uint16_t port = 0; // 0 if not specified
    // Path + query, i.e. what goes into the request line
    std::string target;

    static std::optional<Url> parse(std::string_view urlStr);
};

struct Response {
    StatusCode status = StatusCode::Invalid;
    HeaderMap<std::string> headers;
    std::string body = {};

    Response() = default;
    Response(StatusCode status, std::string body = {});
    Response(StatusCode status, std::string body, std::string_view contentType);

    // Parses the status line and the header section. Everything after the blank line is put into
    // body unchanged (it might be incomplete or chunk-encoded).
    static std::optional<Response> parse(std::string_view responseStr);
};

// Returns the position after the header section (after "\r\n\r\n") or nullopt if the header
// section is not complete yet.
std::optional<size_t> findHeaderEnd(std::string_view data);

// Decodes a complete chunked body (RFC 7230, 4.1). Chunk extensions and trailers are skipped.
// Returns nullopt if the data is malformed or not complete yet.
std::optional<std::string> decodeChunked(std::string_view data);

// Reads a single response from a "Connection: close" connection. The body is delimited by
// Content-Length, chunked encoding or the connection being closed.
class ResponseReader {
public:
    enum class State { Incomplete, Complete, Error };

    static constexpr size_t defaultMaxSize = 8 * 1024 * 1024;

    explicit ResponseReader(Method method, size_t maxSize = defaultMaxSize);

    // Pass closed = true once recv returned 0.
    State feed(std::string_view data, bool closed);

    // Only valid after feed returned Error
    std::error_code error() const { return error_; }

    // Only valid after feed returned Complete
    Response& response() { return response_; }

private:
    enum class BodyFraming { None, ContentLength, Chunked, UntilClose };

    State process(bool closed);
    std::error_code determineBodyFraming();
    State fail(std::errc err);

    Method method_;
    size_t maxSize_;
    std::string buffer_;
    std::optional<size_t> headerEnd_;
    BodyFraming framing_ = BodyFraming::None;
    size_t contentLength_ = 0;
    Response response_;
    std::error_code error_;
};
