#include "acmeerror.hpp"

#include <minijson.hpp>

#include "acmeprotocol.hpp"

std::string_view toString(AcmeErrorKind kind)
{
    switch (kind) {
    case AcmeErrorKind::Transport:
        return "transport";
    case AcmeErrorKind::Protocol:
        return "protocol";
    case AcmeErrorKind::Decode:
        return "decode";
    case AcmeErrorKind::Signing:
        return "signing";
    default:
        return "unknown";
    }
}

std::optional<Problem> Problem::parse(std::string_view body)
{
    auto json = minijson::parse(body);
    if (!json) {
        return std::nullopt;
    }
    Problem problem;
    if (!::parse(*json, problem)) {
        return std::nullopt;
    }
    return problem;
}

AcmeError AcmeError::transport(std::string message, std::error_code ec)
{
    AcmeError err;
    err.kind = AcmeErrorKind::Transport;
    err.message = std::move(message);
    err.transportError = ec;
    return err;
}

AcmeError AcmeError::protocol(std::string message)
{
    AcmeError err;
    err.kind = AcmeErrorKind::Protocol;
    err.message = std::move(message);
    return err;
}

AcmeError AcmeError::protocol(std::string message, const Response& response)
{
    auto err = protocol(std::move(message));
    err.status = response.status;
    err.problem = Problem::parse(response.body);
    return err;
}

AcmeError AcmeError::decode(std::string message)
{
    AcmeError err;
    err.kind = AcmeErrorKind::Decode;
    err.message = std::move(message);
    return err;
}

AcmeError AcmeError::signing(std::string message)
{
    AcmeError err;
    err.kind = AcmeErrorKind::Signing;
    err.message = std::move(message);
    return err;
}

bool AcmeError::isBadNonce() const
{
    return problem && problem->type == "urn:ietf:params:acme:error:badNonce";
}

AcmeError& AcmeError::withContext(std::string_view context)
{
    message = std::string(context) + ": " + message;
    return *this;
}

std::string toString(const AcmeError& error)
{
    std::string str = error.message;
    if (error.kind == AcmeErrorKind::Transport && error.transportError) {
        str.append(" (");
        str.append(error.transportError.message());
        str.append(")");
    }
    if (error.status != StatusCode::Invalid) {
        str.append(" [status ");
        str.append(std::to_string(static_cast<uint32_t>(error.status)));
        str.append("]");
    }
    if (error.problem) {
        str.append(" ");
        str.append(error.problem->type);
        if (!error.problem->detail.empty()) {
            str.append(": ");
            str.append(error.problem->detail);
        }
    }
    return str;
}
