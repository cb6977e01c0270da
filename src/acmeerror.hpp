#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "http.hpp"

enum class AcmeErrorKind {
    Transport, // Connection, TLS or timeout failure
    Protocol, // Non-success status or a missing header/field
    Decode, // Body is not JSON or does not have the expected shape
    Signing, // Could not produce the JWS
};

std::string_view toString(AcmeErrorKind kind);

// RFC 7807 problem document, as returned by ACME servers (RFC 8555 Section 6.7)
struct Problem {
    std::string type;
    std::string detail;
    std::optional<uint32_t> status;

    static std::optional<Problem> parse(std::string_view body);
};

struct AcmeError {
    AcmeErrorKind kind = AcmeErrorKind::Protocol;
    std::string message;
    StatusCode status = StatusCode::Invalid;
    std::error_code transportError;
    std::optional<Problem> problem;

    static AcmeError transport(std::string message, std::error_code ec);
    static AcmeError protocol(std::string message);
    // Maps a non-success response, parsing the body as a problem document if possible
    static AcmeError protocol(std::string message, const Response& response);
    static AcmeError decode(std::string message);
    static AcmeError signing(std::string message);

    bool isBadNonce() const;

    // Prefixes the message with the operation that failed, e.g. "new order: "
    AcmeError& withContext(std::string_view context);
};

std::string toString(const AcmeError& error);
