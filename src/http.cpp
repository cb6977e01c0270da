#include "http.hpp"

#include <cassert>

#include "log.hpp"

std::string toString(Method method)
{
    switch (method) {
    case Method::Get:
        return "GET";
    case Method::Head:
        return "HEAD";
    case Method::Post:
        return "POST";
    default:
        return "INVALID";
    }
}

template <typename StringType>
HeaderMap<StringType>::HeaderMap(std::vector<std::pair<StringType, StringType>> h)
    : headers_(std::move(h))
{
}

template <typename StringType>
bool HeaderMap<StringType>::contains(std::string_view name) const
{
    return find(name).has_value();
}

template <typename StringType>
std::optional<std::string_view> HeaderMap<StringType>::get(std::string_view name) const
{
    const auto idx = find(name);
    if (idx) {
        return headers_[*idx].second;
    } else {
        return std::nullopt;
    }
}

template <typename StringType>
void HeaderMap<StringType>::add(std::string_view name, std::string_view value)
{
    headers_.emplace_back(StringType(name), StringType(value));
}

template <typename StringType>
size_t HeaderMap<StringType>::set(std::string_view name, std::string_view value)
{
    const auto removed = remove(name);
    add(name, value);
    return removed;
}

template <typename StringType>
size_t HeaderMap<StringType>::remove(std::string_view name)
{
    size_t removed = 0;
    for (auto it = headers_.begin(); it != headers_.end();) {
        if (ciEqual(it->first, name)) {
            it = headers_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

template <typename StringType>
std::optional<std::string_view> HeaderMap<StringType>::operator[](std::string_view name) const
{
    return get(name);
}

template <typename StringType>
const std::vector<std::pair<StringType, StringType>>& HeaderMap<StringType>::getEntries() const
{
    return headers_;
}

template <typename StringType>
void HeaderMap<StringType>::serialize(std::string& str) const
{
    for (const auto& [name, value] : headers_) {
        str.append(name);
        str.append(": ");
        str.append(value);
        str.append("\r\n");
    }
}

// Expects every line (including the last one) to be terminated by CRLF
template <typename StringType>
bool HeaderMap<StringType>::parse(std::string_view str)
{
    size_t cursor = 0;
    while (cursor < str.size()) {
        const auto lineEnd = str.find("\r\n", cursor);
        if (lineEnd == std::string_view::npos) {
            slog::debug("Unterminated header line");
            return false;
        }
        const auto line = str.substr(cursor, lineEnd - cursor);
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            slog::debug("No colon in header line");
            return false;
        }
        add(line.substr(0, colon), httpTrim(line.substr(colon + 1)));
        cursor = lineEnd + 2;
    }
    return true;
}

template <typename StringType>
std::optional<size_t> HeaderMap<StringType>::find(std::string_view name) const
{
    for (size_t i = 0; i < headers_.size(); ++i) {
        if (ciEqual(headers_[i].first, name)) {
            return i;
        }
    }
    return std::nullopt;
}

template class HeaderMap<std::string_view>;
template class HeaderMap<std::string>;

std::optional<Url> Url::parse(std::string_view urlStr)
{
    constexpr auto npos = std::string_view::npos;

    Url url;
    url.fullRaw = urlStr;

    const auto fragmentStart = urlStr.find('#');
    if (fragmentStart != npos) {
        urlStr = urlStr.substr(0, fragmentStart);
    }

    const auto schemeEnd = urlStr.find("://");
    if (schemeEnd == npos || schemeEnd == 0) {
        return std::nullopt;
    }
    url.scheme = std::string(urlStr.substr(0, schemeEnd));
    for (auto& ch : url.scheme) {
        ch = toLower(ch);
    }
    urlStr = urlStr.substr(schemeEnd + 3);

    const auto pathStart = urlStr.find_first_of("/?");
    const auto netLoc = urlStr.substr(0, pathStart);
    // user info is not something we will ever send, but don't mistake it for the host
    const auto at = netLoc.find('@');
    const auto hostPort = at == npos ? netLoc : netLoc.substr(at + 1);
    if (!hostPort.empty() && hostPort[0] == '[') {
        // IPv6 literal
        const auto close = hostPort.find(']');
        if (close == npos) {
            return std::nullopt;
        }
        url.host = std::string(hostPort.substr(1, close - 1));
        const auto rest = hostPort.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                return std::nullopt;
            }
            const auto port = parseInt<uint16_t>(rest.substr(1));
            if (!port) {
                return std::nullopt;
            }
            url.port = *port;
        }
    } else {
        const auto portDelim = hostPort.find(':');
        url.host = std::string(hostPort.substr(0, portDelim));
        if (portDelim != npos) {
            const auto port = parseInt<uint16_t>(hostPort.substr(portDelim + 1));
            if (!port) {
                return std::nullopt;
            }
            url.port = *port;
        }
    }

    if (url.host.empty()) {
        return std::nullopt;
    }

    if (pathStart == npos) {
        url.target = "/";
    } else if (urlStr[pathStart] == '?') {
        url.target = "/" + std::string(urlStr.substr(pathStart));
    } else {
        url.target = std::string(urlStr.substr(pathStart));
    }

    return url;
}

Response::Response(StatusCode status, std::string body)
    : status(status)
    , body(std::move(body))
{
}

Response::Response(StatusCode status, std::string body, std::string_view contentType)
    : status(status)
    , body(std::move(body))
{
    headers.add("Content-Type", contentType);
}

std::optional<Response> Response::parse(std::string_view responseStr)
{
    if (responseStr.substr(0, 7) != "HTTP/1.") {
        slog::debug("Response doesn't start with HTTP");
        return std::nullopt;
    }
    const auto statusLineEnd = responseStr.find("\r\n");
    if (statusLineEnd == std::string_view::npos) {
        slog::debug("No status line end");
        return std::nullopt;
    }
    const auto statusLine = responseStr.substr(0, statusLineEnd);

    const auto statusStart = statusLine.find(' ');
    if (statusStart == std::string_view::npos) {
        slog::debug("No status code in status line");
        return std::nullopt;
    }
    const auto statusEnd = statusLine.find(' ', statusStart + 1);
    const auto statusCodeStr = statusLine.substr(statusStart + 1,
        statusEnd == std::string_view::npos ? statusEnd : statusEnd - statusStart - 1);
    const auto statusCode = parseInt<uint32_t>(statusCodeStr);
    if (!statusCode || *statusCode < 100 || *statusCode > 999) {
        slog::debug("Invalid status code: '", statusCodeStr, "'");
        return std::nullopt;
    }

    const auto headerEnd = findHeaderEnd(responseStr);
    if (!headerEnd) {
        slog::debug("No headers end");
        return std::nullopt;
    }

    Response resp;
    resp.status = static_cast<StatusCode>(*statusCode);

    const auto headersStart = statusLineEnd + 2;
    // The header section includes the CRLF of the last header line, but not the empty line
    if (*headerEnd - 2 > headersStart
        && !resp.headers.parse(responseStr.substr(headersStart, *headerEnd - 2 - headersStart))) {
        return std::nullopt;
    }

    resp.body = responseStr.substr(*headerEnd);

    return resp;
}

std::optional<size_t> findHeaderEnd(std::string_view data)
{
    const auto pos = data.find("\r\n\r\n");
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return pos + 4;
}

std::optional<std::string> decodeChunked(std::string_view data)
{
    std::string body;
    size_t cursor = 0;
    while (true) {
        const auto sizeLineEnd = data.find("\r\n", cursor);
        if (sizeLineEnd == std::string_view::npos) {
            return std::nullopt;
        }
        auto sizeStr = data.substr(cursor, sizeLineEnd - cursor);
        const auto ext = sizeStr.find(';');
        if (ext != std::string_view::npos) {
            sizeStr = sizeStr.substr(0, ext);
        }
        const auto chunkSize = parseInt<size_t>(httpTrim(sizeStr), 16);
        if (!chunkSize) {
            return std::nullopt;
        }
        cursor = sizeLineEnd + 2;

        if (*chunkSize == 0) {
            // Skip trailers. The body is done after an empty line.
            while (true) {
                const auto lineEnd = data.find("\r\n", cursor);
                if (lineEnd == std::string_view::npos) {
                    return std::nullopt;
                }
                if (lineEnd == cursor) {
                    return body;
                }
                cursor = lineEnd + 2;
            }
        }

        if (data.size() < cursor + *chunkSize + 2) {
            return std::nullopt;
        }
        body.append(data.substr(cursor, *chunkSize));
        cursor += *chunkSize;
        if (data.substr(cursor, 2) != "\r\n") {
            return std::nullopt;
        }
        cursor += 2;
    }
}

ResponseReader::ResponseReader(Method method, size_t maxSize)
    : method_(method)
    , maxSize_(maxSize)
{
}

ResponseReader::State ResponseReader::feed(std::string_view data, bool closed)
{
    if (buffer_.size() + data.size() > maxSize_) {
        slog::error("Response exceeds ", maxSize_, " bytes");
        return fail(std::errc::message_size);
    }
    buffer_.append(data);
    return process(closed);
}

ResponseReader::State ResponseReader::process(bool closed)
{
    if (!headerEnd_) {
        headerEnd_ = findHeaderEnd(buffer_);
        if (!headerEnd_) {
            if (closed) {
                slog::error("Connection closed before response header was complete");
                return fail(std::errc::connection_reset);
            }
            return State::Incomplete;
        }

        auto response = Response::parse(buffer_);
        if (!response) {
            slog::error("Could not parse response");
            return fail(std::errc::bad_message);
        }
        response_ = std::move(*response);
        response_.body.clear();

        const auto ec = determineBodyFraming();
        if (ec) {
            error_ = ec;
            return State::Error;
        }
    }

    const auto body = std::string_view(buffer_).substr(*headerEnd_);
    switch (framing_) {
    case BodyFraming::None:
        return State::Complete;
    case BodyFraming::ContentLength:
        if (body.size() >= contentLength_) {
            response_.body = std::string(body.substr(0, contentLength_));
            return State::Complete;
        }
        if (closed) {
            slog::error("Connection closed before body was complete");
            return fail(std::errc::connection_reset);
        }
        return State::Incomplete;
    case BodyFraming::Chunked: {
        auto decoded = decodeChunked(body);
        if (decoded) {
            response_.body = std::move(*decoded);
            return State::Complete;
        }
        if (closed) {
            slog::error("Connection closed before chunked body was complete");
            return fail(std::errc::bad_message);
        }
        return State::Incomplete;
    }
    case BodyFraming::UntilClose:
        if (closed) {
            response_.body = std::string(body);
            return State::Complete;
        }
        return State::Incomplete;
    default:
        return fail(std::errc::bad_message);
    }
}

std::error_code ResponseReader::determineBodyFraming()
{
    const auto status = static_cast<uint32_t>(response_.status);
    if (method_ == Method::Head || status / 100 == 1 || status == 204 || status == 304) {
        framing_ = BodyFraming::None;
        return {};
    }

    const auto transferEncoding = response_.headers.get("Transfer-Encoding");
    if (transferEncoding) {
        if (!ciEqual(httpTrim(*transferEncoding), "chunked")) {
            slog::error("Unsupported Transfer-Encoding: ", *transferEncoding);
            return std::make_error_code(std::errc::bad_message);
        }
        framing_ = BodyFraming::Chunked;
        return {};
    }

    const auto contentLength = response_.headers.get("Content-Length");
    if (contentLength) {
        const auto length = parseInt<uint64_t>(httpTrim(*contentLength));
        if (!length) {
            slog::error("Invalid Content-Length");
            return std::make_error_code(std::errc::bad_message);
        }
        if (*length > maxSize_) {
            slog::error("Content-Length ", *length, " exceeds ", maxSize_, " bytes");
            return std::make_error_code(std::errc::message_size);
        }
        contentLength_ = static_cast<size_t>(*length);
        framing_ = BodyFraming::ContentLength;
        return {};
    }

    framing_ = BodyFraming::UntilClose;
    return {};
}

ResponseReader::State ResponseReader::fail(std::errc err)
{
    error_ = std::make_error_code(err);
    return State::Error;
}
