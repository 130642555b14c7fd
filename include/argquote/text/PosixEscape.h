// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <string>
#include <string_view>
#include <argquote/text/Escaped.h>

namespace argquote {

/// @brief Quotes byte strings for POSIX shells (sh, bash, zsh).
///
class PosixEscape
{
public:
	/// @brief Returns true if the byte can appear in an unquoted
	/// argument: ASCII letters, digits and `-_=/,.+`
	///
	/// Other characters such as `:` or `@` are harmless in most
	/// shells, but are quoted anyway.
	///
	static constexpr bool isAllowed(char ch) noexcept
	{
		return (ch >= 'a' && ch <= 'z') ||
			(ch >= 'A' && ch <= 'Z') ||
			(ch >= '0' && ch <= '9') ||
			ch == '-' || ch == '_' || ch == '=' || ch == '/' ||
			ch == ',' || ch == '.' || ch == '+';
	}

	static bool needsQuoting(std::string_view s) noexcept;

	/**
	 * @brief Escapes a string so that a POSIX shell treats it as
	 * one literal word.
	 *
	 * If the string is non-empty and consists only of allowed
	 * characters (see isAllowed()), it is returned as-is (borrowed).
	 * Otherwise, the string is wrapped in single quotes; any `'` or
	 * `!` is written as `'\'` or `'\!'`, which leaves and re-enters
	 * the quoted span. All other bytes (including bytes that are
	 * not valid UTF-8) are copied unchanged.
	 *
	 * Example:
	 * @code
	 * PosixEscape::escape("it's");    // 'it'\''s'
	 * PosixEscape::escape("");        // ''
	 * PosixEscape::escape("a/b.txt"); // a/b.txt
	 * @endcode
	 */
	static Escaped escape(std::string_view s);

	/// @brief Appends the escaped form of `s` (as returned by escape())
	/// to `out`.
	///
	static void appendEscaped(std::string& out, std::string_view s);
};

} // namespace argquote
