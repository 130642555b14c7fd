// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

// Windows inline implementations for argquote::ShellEscape

#include <argquote/text/WindowsEscape.h>

static_assert(sizeof(argquote::NativeChar) == 2, "Windows arguments are UTF-16 strings");

namespace argquote
{

inline NativeEscaped ShellEscape::escape(NativeStringView s)
{
    return WindowsEscape::escape(s);
}

inline void ShellEscape::appendEscaped(NativeString& out, NativeStringView s)
{
    WindowsEscape::appendEscaped(out, s);
}

} // namespace argquote
