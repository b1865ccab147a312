#pragma once

#include <courier/coro/task.hpp>
#include <courier/requests/result.hpp>

#include <string>

namespace courier::net {

/// Capability to perform one encoded method call
///
/// Implementations own endpoint construction, authentication and
/// connection handling. A single transport is shared by every request of a
/// bot and must accept concurrent calls.
///
/// `call` must be lazy like the requests built on top of it: the returned
/// task does nothing until it is driven. Destroying the task while it is
/// suspended abandons the call; the implementation must not resume it later.
class transport {
public:
    virtual ~transport() = default;

    /// Call a remote method
    /// @param method Bot API method name, e.g. "sendMessage"
    /// @param body Encoded JSON payload
    /// @return Raw response body, or a `network` error
    virtual coro::task<request_result<std::string>> call(std::string method, std::string body) = 0;
};

} // namespace courier::net
