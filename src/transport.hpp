#pragma once

#include <string>
#include <system_error>

#include "function.hpp"
#include "http.hpp"

// One HTTP exchange with an absolute URL. The callback is called exactly once, either with an
// error (connection, TLS, timeout, malformed response) or with the complete response. Non-2xx
// responses are not errors on this level.
class Transport {
public:
    using Callback = Function<void(std::error_code, Response&&)>;

    virtual ~Transport() = default;

    virtual void request(Method method, const std::string& url, const HeaderMap<>& headers,
        const std::string& body, Callback cb)
        = 0;
};
