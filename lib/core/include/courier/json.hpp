/*
Module Name:
- json.hpp

Abstract:
- glaze-backed JSON encode/decode shared by the executor and the built-in parsers.
- Decoding ignores unknown keys and requires every non-nullable member.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <string>
#include <string_view>

// Glaze
#include <glaze/json.hpp>

// Project
#include <courier/log.hpp>

namespace courier
{

    inline constexpr glz::opts json_opts{
        .error_on_unknown_keys = false,
        .error_on_missing_keys = true,
    };

    /// Minimal {"error": "..."} payload some backends answer with.
    struct BackendErrorEnvelope
    {
        std::string error;

        struct glaze
        {
            using T = BackendErrorEnvelope;
            static constexpr auto value = glz::object("error", &T::error);
        };
    };

    /// Decode text into T. The error side holds glaze's formatted diagnostic.
    template <class T>
    [[nodiscard]] glz::expected<T, std::string> decode_json(std::string_view text)
    {
        const std::string buffer{ text }; // NUL-terminated copy for glaze
        T value{};
        if (const glz::error_ctx ec = glz::read<json_opts>(value, buffer); ec)
            return glz::unexpected(glz::format_error(ec, buffer));
        return value;
    }

    /// Encode value; failures are logged as warnings and yield nullopt.
    template <class T>
    [[nodiscard]] std::optional<std::string> encode_json(const T& value, bool pretty = false)
    {
        std::string out;
        if (const glz::error_ctx ec = glz::write<json_opts>(value, out); ec)
        {
            log::warning("json", "failed to encode value: " + glz::format_error(ec, out));
            return std::nullopt;
        }
        if (pretty)
            return glz::prettify_json(out);
        return out;
    }

} // namespace courier
