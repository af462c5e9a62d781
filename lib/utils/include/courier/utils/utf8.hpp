/*
Module Name:
- utf8.hpp

Abstract:
- Strict UTF-8 validation for byte slices received from the network.
- Rejects overlong forms, surrogates, code points above U+10FFFF and
  truncated sequences, so a chunk split inside a code point is reported as
  undecodable rather than silently repaired.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <string_view>

// Project
#include <courier/utils/attributes.hpp>

namespace courier::utf8 {

[[nodiscard]] inline bool is_valid(std::string_view s) noexcept
{
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    const std::size_t n = s.size();
    std::size_t i = 0;

    while (i < n) {
        const unsigned char c = p[i];
        if (COURIER_LIKELY(c < 0x80)) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0)
                lo = 0xA0; // overlong
            else if (c == 0xED)
                hi = 0x9F; // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0)
                lo = 0x90; // overlong
            else if (c == 0xF4)
                hi = 0x8F; // > U+10FFFF
        } else {
            return false;
        }

        if (i + len > n)
            return false;

        // Only the first continuation byte has a narrowed range.
        if (p[i + 1] < lo || p[i + 1] > hi)
            return false;
        for (std::size_t k = 2; k < len; ++k) {
            if ((p[i + k] & 0xC0) != 0x80)
                return false;
        }
        i += len;
    }
    return true;
}

} // namespace courier::utf8
