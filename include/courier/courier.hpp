#pragma once

/// Courier - typed requests for the Telegram Bot API
///
/// Version: 0.1.0
///
/// This header provides the request layer: payloads, requests, the bot
/// requester and the request wrappers. The HTTP transport lives in
/// <courier/net/http_transport.hpp> and is included separately, since it
/// pulls in Boost.Beast and OpenSSL.

// Version information
#define COURIER_VERSION_MAJOR 0
#define COURIER_VERSION_MINOR 1
#define COURIER_VERSION_PATCH 0

// Coroutine support
#include "coro/promise_base.hpp"
#include "coro/task.hpp"
#include "coro/sync_wait.hpp"

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

// Value types and payloads
#include "types/types.hpp"
#include "payloads/payloads.hpp"

// Request layer
#include "requests/errors.hpp"
#include "requests/result.hpp"
#include "requests/future.hpp"
#include "requests/request.hpp"
#include "requests/response.hpp"
#include "requests/json_request.hpp"
#include "requests/requester.hpp"

// Transport boundary and the bot
#include "net/transport.hpp"
#include "net/transport_config.hpp"
#include "bot.hpp"

// Request wrappers
#include "adaptors/cache_me.hpp"
#include "adaptors/default_parse_mode.hpp"
#include "adaptors/trace.hpp"

#include <tuple>

/// Root namespace for the Courier library
namespace courier {

/// Get library version string
inline const char* version() noexcept {
    return "0.1.0";
}

/// Get library version as tuple
inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(COURIER_VERSION_MAJOR, COURIER_VERSION_MINOR, COURIER_VERSION_PATCH);
}

} // namespace courier
