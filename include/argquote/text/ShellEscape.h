// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <argquote/text/Escaped.h>

namespace argquote {

#ifdef _WIN32
using NativeChar = wchar_t;
#else
using NativeChar = char;
#endif

using NativeString = std::basic_string<NativeChar>;
using NativeStringView = std::basic_string_view<NativeChar>;
using NativeEscaped = BasicEscaped<NativeChar>;

/// @brief Escapes arguments for the shell of the platform we are
/// compiled for: PosixEscape on POSIX systems, WindowsEscape on
/// Windows.
///
/// To build a command line, join the escaped arguments with single
/// spaces.
///
class ShellEscape
{
public:
	static NativeEscaped escape(NativeStringView s);

	static NativeEscaped escape(const NativeChar* s)
	{
		return escape(NativeStringView(s));
	}

	static NativeEscaped escape(const NativeString& s)
	{
		return escape(NativeStringView(s));
	}

	// A borrowed result would outlive a temporary string
	static NativeEscaped escape(NativeString&& s) = delete;

	/// @brief Escapes the native form of a path. If no quoting is
	/// needed, the result refers to the path's own storage.
	///
	static NativeEscaped escape(const std::filesystem::path& path)
	{
		return escape(NativeStringView(path.native()));
	}

	static NativeEscaped escape(std::filesystem::path&& path) = delete;

	static void appendEscaped(NativeString& out, NativeStringView s);
};

} // namespace argquote

#if defined(_WIN32)
#include "detail/ShellEscape_win.inl"
#else
#include "detail/ShellEscape_posix.inl"
#endif
