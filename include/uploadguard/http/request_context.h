#pragma once

#include <string>

namespace uploadguard::http {

/// @brief Per-request metadata used for logging and error responses.
struct RequestContext {
    std::string request_id;
    std::string method;
    std::string target;
    std::string remote;
    /// Caller identity forwarded by the auth layer in `X-User-Id`; may be empty.
    std::string user_id;
};

}  // namespace uploadguard::http
