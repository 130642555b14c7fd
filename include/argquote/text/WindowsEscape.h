// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <string>
#include <string_view>
#include <argquote/text/Escaped.h>
#include <argquote/util/Unicode.h>

namespace argquote {

/**
 * @brief Quotes UTF-16 strings for Windows command lines, following
 * the rules used by the Microsoft C runtime (and CommandLineToArgvW)
 * to split a command line into arguments.
 *
 * The string functions accept any 16-bit code unit type: `char16_t`
 * on every platform, and `wchar_t` on Windows. Code units are never
 * validated; unpaired surrogates are copied like any other unit.
 */
class WindowsEscape
{
public:
	/// @brief Returns true if the code unit forces the argument to
	/// be quoted: space, tab, newline, double quote, or a surrogate.
	///
	/// Surrogates are judged one unit at a time, so even a valid
	/// surrogate pair causes quoting.
	///
	static constexpr bool isDisallowed(char16_t unit) noexcept
	{
		return unit == u' ' || unit == u'"' || unit == u'\n' ||
			unit == u'\t' || Unicode::isSurrogate(unit);
	}

	template<typename Unit>
	static bool needsQuoting(std::basic_string_view<Unit> s) noexcept;

	/**
	 * @brief Escapes a string so that it is parsed as a single
	 * argument.
	 *
	 * If the string is non-empty and contains no disallowed units
	 * (see isDisallowed()), it is returned as-is (borrowed).
	 * Otherwise, it is wrapped in double quotes:
	 *
	 * - A run of N backslashes followed by `"` becomes 2N+1
	 *   backslashes followed by `"`
	 * - A run of N backslashes at the end becomes 2N backslashes,
	 *   so the closing quote is not escaped
	 * - Any other backslashes are copied unchanged
	 *
	 * Example:
	 * @code
	 * WindowsEscape::escape(u"C:\\my docs\\");  // "C:\my docs\\"
	 * WindowsEscape::escape(u"say \"hi\"");     // "say \"hi\""
	 * WindowsEscape::escape(u"");               // ""
	 * @endcode
	 */
	template<typename Unit>
	static BasicEscaped<Unit> escape(std::basic_string_view<Unit> s);

	static Escaped16 escape(const char16_t* s)
	{
		return escape(std::u16string_view(s));
	}

	/// @brief Appends the escaped form of `s` (as returned by escape())
	/// to `out`.
	///
	template<typename Unit>
	static void appendEscaped(std::basic_string<Unit>& out,
		std::basic_string_view<Unit> s);
};

} // namespace argquote
