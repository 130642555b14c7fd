// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <argquote/text/WindowsEscape.h>

namespace argquote {

namespace {

template<typename Unit>
void appendQuoted(std::basic_string<Unit>& out, std::basic_string_view<Unit> s)
{
	constexpr Unit BACKSLASH = static_cast<Unit>('\\');
	constexpr Unit QUOTE = static_cast<Unit>('"');

	const Unit* p = s.data();
	const Unit* end = p + s.size();

	out.push_back(QUOTE);
	for (;;)
	{
		size_t slashes = 0;
		while (p < end && *p == BACKSLASH)
		{
			slashes++;
			p++;
		}
		if (p == end)
		{
			// Trailing backslashes must not escape the closing quote
			out.append(slashes * 2, BACKSLASH);
			break;
		}
		Unit unit = *p++;
		if (unit == QUOTE)
		{
			out.append(slashes * 2 + 1, BACKSLASH);
		}
		else
		{
			out.append(slashes, BACKSLASH);
		}
		out.push_back(unit);
	}
	out.push_back(QUOTE);
}

} // namespace

template<typename Unit>
bool WindowsEscape::needsQuoting(std::basic_string_view<Unit> s) noexcept
{
	static_assert(sizeof(Unit) == 2, "Requires 16-bit code units");

	if (s.empty()) return true;
	for (Unit unit : s)
	{
		if (isDisallowed(static_cast<char16_t>(unit))) return true;
	}
	return false;
}

template<typename Unit>
BasicEscaped<Unit> WindowsEscape::escape(std::basic_string_view<Unit> s)
{
	if (!needsQuoting(s)) return BasicEscaped<Unit>::borrowed(s);

	std::basic_string<Unit> out;
	out.reserve(s.size() + 2);
	appendQuoted(out, s);
	return BasicEscaped<Unit>::owned(std::move(out));
}

template<typename Unit>
void WindowsEscape::appendEscaped(std::basic_string<Unit>& out,
	std::basic_string_view<Unit> s)
{
	if (needsQuoting(s))
	{
		appendQuoted(out, s);
	}
	else
	{
		out.append(s);
	}
}

template bool WindowsEscape::needsQuoting<char16_t>(std::u16string_view) noexcept;
template Escaped16 WindowsEscape::escape<char16_t>(std::u16string_view);
template void WindowsEscape::appendEscaped<char16_t>(
	std::u16string&, std::u16string_view);

#ifdef _WIN32
template bool WindowsEscape::needsQuoting<wchar_t>(std::wstring_view) noexcept;
template BasicEscaped<wchar_t> WindowsEscape::escape<wchar_t>(std::wstring_view);
template void WindowsEscape::appendEscaped<wchar_t>(
	std::wstring&, std::wstring_view);
#endif

} // namespace argquote
