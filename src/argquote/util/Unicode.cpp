// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <argquote/util/Unicode.h>

namespace argquote {

std::u16string Unicode::toUtf16(std::string_view s)
{
    std::u16string out;
    out.reserve(s.size());

    const unsigned char* p = reinterpret_cast<const unsigned char*>(s.data());
    const unsigned char* end = p + s.size();
    while (p < end)
    {
        uint32_t code = *p++;
        if (code < 0x80)
        {
            out.push_back(static_cast<char16_t>(code));
            continue;
        }

        int remaining;
        uint32_t min;
        if ((code & 0xE0) == 0xC0)
        {
            remaining = 1;
            code &= 0x1F;
            min = 0x80;
        }
        else if ((code & 0xF0) == 0xE0)
        {
            remaining = 2;
            code &= 0x0F;
            min = 0x800;
        }
        else if ((code & 0xF8) == 0xF0)
        {
            remaining = 3;
            code &= 0x07;
            min = 0x10000;
        }
        else
        {
            // Stray continuation byte or invalid lead byte
            out.push_back(static_cast<char16_t>(REPLACEMENT_CHAR));
            continue;
        }

        while (remaining > 0 && p < end && (*p & 0xC0) == 0x80)
        {
            code = (code << 6) | (*p++ & 0x3F);
            remaining--;
        }

        if (remaining > 0 || code < min || code > 0x10FFFF || isSurrogate(code))
        {
            // Truncated, overlong, out of range or encoded surrogate
            out.push_back(static_cast<char16_t>(REPLACEMENT_CHAR));
        }
        else if (code >= 0x10000)
        {
            code -= 0x10000;
            out.push_back(static_cast<char16_t>(0xD800 + (code >> 10)));
            out.push_back(static_cast<char16_t>(0xDC00 + (code & 0x3FF)));
        }
        else
        {
            out.push_back(static_cast<char16_t>(code));
        }
    }
    return out;
}

std::string Unicode::toUtf8(std::u16string_view s)
{
    std::string out;
    out.reserve(s.size());

    const char16_t* p = s.data();
    const char16_t* end = p + s.size();
    while (p < end)
    {
        uint32_t code = *p++;
        if (isHighSurrogate(code) && p < end && isLowSurrogate(*p))
        {
            code = 0x10000 + ((code - 0xD800) << 10) + (*p++ - 0xDC00);
        }
        else if (isSurrogate(code))
        {
            code = REPLACEMENT_CHAR;
        }
        char buf[4];
        char* pEnd = buf;
        encode(pEnd, static_cast<int>(code));
        out.append(buf, pEnd - buf);
    }
    return out;
}

} // namespace argquote
