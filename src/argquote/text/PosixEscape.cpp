// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <argquote/text/PosixEscape.h>

namespace argquote {

namespace {

void appendQuoted(std::string& out, std::string_view s)
{
	const char* p = s.data();
	const char* end = p + s.size();

	out.push_back('\'');
	while (p < end)
	{
		const char* start = p;

		// Copy bytes verbatim up to the next ' or !
		while (p < end && *p != '\'' && *p != '!') ++p;
		if (p > start) out.append(start, p - start);
		if (p == end) break;

		// Close the quote, write the escaped char, re-open the quote
		char quoted[4] = { '\'', '\\', *p++, '\'' };
		out.append(quoted, sizeof(quoted));
	}
	out.push_back('\'');
}

} // namespace

bool PosixEscape::needsQuoting(std::string_view s) noexcept
{
	if (s.empty()) return true;
	for (char ch : s)
	{
		if (!isAllowed(ch)) return true;
	}
	return false;
}

Escaped PosixEscape::escape(std::string_view s)
{
	if (!needsQuoting(s)) return Escaped::borrowed(s);

	std::string out;
	out.reserve(s.size() + 2);
	appendQuoted(out, s);
	return Escaped::owned(std::move(out));
}

void PosixEscape::appendEscaped(std::string& out, std::string_view s)
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

} // namespace argquote
