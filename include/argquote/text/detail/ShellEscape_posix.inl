// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

// POSIX inline implementations for argquote::ShellEscape

#include <argquote/text/PosixEscape.h>

static_assert(sizeof(argquote::NativeChar) == 1, "POSIX arguments are byte strings");

namespace argquote
{

inline NativeEscaped ShellEscape::escape(NativeStringView s)
{
    return PosixEscape::escape(s);
}

inline void ShellEscape::appendEscaped(NativeString& out, NativeStringView s)
{
    PosixEscape::appendEscaped(out, s);
}

} // namespace argquote
