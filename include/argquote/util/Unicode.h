// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace argquote {

class Unicode
{
public:
    static constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

    static constexpr bool isSurrogate(uint32_t unit) noexcept
    {
        return unit >= 0xD800 && unit <= 0xDFFF;
    }

    static constexpr bool isHighSurrogate(uint32_t unit) noexcept
    {
        return unit >= 0xD800 && unit <= 0xDBFF;
    }

    static constexpr bool isLowSurrogate(uint32_t unit) noexcept
    {
        return unit >= 0xDC00 && unit <= 0xDFFF;
    }

    static void encode(char*& p, int code)
    {
        if (code <= 0x7F)
        {
            // 1-byte sequence: 0xxxxxxx
            *p++ = static_cast<char>(code);
        }
        else if (code <= 0x7FF)
        {
            // 2-byte sequence: 110xxxxx 10xxxxxx
            *p++ = static_cast<char>(0xC0 | (code >> 6));
            *p++ = static_cast<char>(0x80 | (code & 0x3F));
        }
        else if (code <= 0xFFFF)
        {
            // 3-byte sequence: 1110xxxx 10xxxxxx 10xxxxxx
            *p++ = static_cast<char>(0xE0 | (code >> 12));
            *p++ = static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            *p++ = static_cast<char>(0x80 | (code & 0x3F));
        }
        else if (code <= 0x10FFFF)
        {
            // 4-byte sequence: 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
            *p++ = static_cast<char>(0xF0 | (code >> 18));
            *p++ = static_cast<char>(0x80 | ((code >> 12) & 0x3F));
            *p++ = static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            *p++ = static_cast<char>(0x80 | (code & 0x3F));
        }
        // Code points above 0x10FFFF are dropped
    }

    /// @brief Converts UTF-8 to UTF-16. Ill-formed sequences
    /// (including encoded surrogates) become U+FFFD.
    ///
    /// Lossy; intended for display only.
    ///
    static std::u16string toUtf16(std::string_view s);

    /// @brief Converts UTF-16 to UTF-8. Unpaired surrogates
    /// become U+FFFD.
    ///
    /// Lossy; intended for display only.
    ///
    static std::string toUtf8(std::u16string_view s);
};

} // namespace argquote
