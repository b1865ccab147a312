#pragma once

/// @file response.hpp
/// @brief Decoding of the Bot API response envelope
///
/// Every response body has the shape
/// @code
/// {"ok": true,  "result": <output>}
/// {"ok": false, "error_code": 400, "description": "...",
///  "parameters": {"retry_after": 5} | {"migrate_to_chat_id": -100123}}
/// @endcode

#include "result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace courier {

namespace detail {

inline request_error decode_failure(const nlohmann::json& j) {
    api_error err;
    err.description = j.value("description", std::string{});
    err.error_code = j.value("error_code", 0);

    auto params = j.find("parameters");
    if (params != j.end() && params->is_object()) {
        if (auto it = params->find("retry_after"); it != params->end() && it->is_number_integer()) {
            return request_error::flood(std::chrono::seconds(it->get<int64_t>()), std::move(err));
        }
        if (auto it = params->find("migrate_to_chat_id"); it != params->end() && it->is_number_integer()) {
            return request_error::migrated(it->get<int64_t>(), std::move(err));
        }
    }
    return request_error::from_api(std::move(err));
}

} // namespace detail

/// Decode a raw response body into the output of a method
/// @tparam T The output type bound to the payload
/// @param body Raw response body as returned by the transport
template<typename T>
request_result<T> decode_response(std::string_view body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return request_result<T>(request_error::bad_json(
            "response is not a JSON object", std::string(body)));
    }

    try {
        if (j.at("ok").get<bool>()) {
            return request_result<T>(j.at("result").get<T>());
        }
        return request_result<T>(detail::decode_failure(j));
    } catch (const nlohmann::json::exception& e) {
        return request_result<T>(request_error::bad_json(e.what(), std::string(body)));
    }
}

} // namespace courier
