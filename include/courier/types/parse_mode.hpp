#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>

namespace courier::types {

/// Text formatting style for message text
enum class parse_mode : uint8_t {
    markdown_v2,
    html,
    markdown,   // legacy Markdown, kept for compatibility
};

NLOHMANN_JSON_SERIALIZE_ENUM(parse_mode, {
    {parse_mode::markdown_v2, "MarkdownV2"},
    {parse_mode::html, "HTML"},
    {parse_mode::markdown, "Markdown"},
})

} // namespace courier::types
