// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace argquote {

/**
 * @brief The result of escaping a shell argument: either a view of
 * the caller's input (if no quoting was needed), or a newly built
 * sequence of code units owned by this object.
 *
 * A borrowed result is only valid as long as the input it was created
 * from. It must not be used to modify that input.
 *
 * Comparisons look at the code units only; a borrowed result and an
 * owned result with the same contents are equal.
 */
template<typename Char>
class BasicEscaped
{
public:
	using View = std::basic_string_view<Char>;
	using String = std::basic_string<Char>;

	BasicEscaped() : owned_(false) {}

	static BasicEscaped borrowed(View s) noexcept
	{
		BasicEscaped e;
		e.borrowed_ = s;
		return e;
	}

	static BasicEscaped owned(String s) noexcept
	{
		BasicEscaped e;
		e.string_ = std::move(s);
		e.owned_ = true;
		return e;
	}

	// view() is derived on each call and never cached

	bool isBorrowed() const noexcept { return !owned_; }
	bool isEmpty() const noexcept { return size() == 0; }

	View view() const noexcept
	{
		return owned_ ? View(string_) : borrowed_;
	}

	operator View() const noexcept { return view(); }

	const Char* data() const noexcept { return view().data(); }
	size_t size() const noexcept { return view().size(); }

	String toString() const &
	{
		return String(view());
	}

	String toString() &&
	{
		if (owned_) return std::move(string_);
		return String(borrowed_);
	}

	bool operator==(View other) const noexcept
	{
		return view() == other;
	}

	bool operator==(const BasicEscaped& other) const noexcept
	{
		return view() == other.view();
	}

private:
	View borrowed_;
	String string_;
	bool owned_;
};

using Escaped = BasicEscaped<char>;
using Escaped16 = BasicEscaped<char16_t>;

} // namespace argquote
