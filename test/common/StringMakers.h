// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <catch2/catch_tostring.hpp>
#include <string>
#include <string_view>
#include "argquote/text/Escaped.h"
#include "argquote/util/Unicode.h"

// Lets Catch print UTF-16 strings and escape results in failure
// messages (C++20 deletes the ostream inserter for char16_t)

namespace Catch {

template<>
struct StringMaker<std::u16string_view>
{
	static std::string convert(std::u16string_view s)
	{
		return StringMaker<std::string>::convert(argquote::Unicode::toUtf8(s));
	}
};

template<>
struct StringMaker<std::u16string>
{
	static std::string convert(const std::u16string& s)
	{
		return StringMaker<std::u16string_view>::convert(s);
	}
};

template<>
struct StringMaker<argquote::Escaped>
{
	static std::string convert(const argquote::Escaped& e)
	{
		return StringMaker<std::string_view>::convert(e.view());
	}
};

template<>
struct StringMaker<argquote::Escaped16>
{
	static std::string convert(const argquote::Escaped16& e)
	{
		return StringMaker<std::u16string_view>::convert(e.view());
	}
};

} // namespace Catch
