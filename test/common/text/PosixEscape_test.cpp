// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <string_view>
#include "argquote/text/PosixEscape.h"
#include "StringMakers.h"

using namespace argquote;
using namespace std::string_view_literals;

static void requireEscaped(std::string_view input, std::string_view expected)
{
	Escaped e = PosixEscape::escape(input);
	REQUIRE(e.view() == expected);
}

TEST_CASE("PosixEscape: quoting")
{
	requireEscaped("", "''");
	requireEscaped(" ", "' '");
	requireEscaped("*", "'*'");
	requireEscaped("--features=\"default\"", "'--features=\"default\"'");
	requireEscaped("linker=gcc -L/foo -Wl,bar", "'linker=gcc -L/foo -Wl,bar'");
	requireEscaped("it's", "'it'\\''s'");
	requireEscaped("hello!", "'hello'\\!''");
	requireEscaped("'!\\$`\\\\\\n ", "''\\'''\\!'\\$`\\\\\\n '");
	requireEscaped("user@host:/tmp", "'user@host:/tmp'");
	requireEscaped("tab\there", "'tab\there'");
	requireEscaped("line\nbreak", "'line\nbreak'");
}

TEST_CASE("PosixEscape: safe arguments are borrowed")
{
	std::string_view safe = "--aaa=bbb-ccc";
	Escaped e = PosixEscape::escape(safe);
	REQUIRE(e.isBorrowed());
	REQUIRE(e.data() == safe.data());
	REQUIRE(e == safe);

	std::string_view all =
		"abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_=/,.+";
	REQUIRE(PosixEscape::escape(all) == all);
	REQUIRE(PosixEscape::escape(all).isBorrowed());
}

TEST_CASE("PosixEscape: allowed characters")
{
	for (int i = 0; i < 256; i++)
	{
		char ch = static_cast<char>(i);
		bool expected = (ch >= 'a' && ch <= 'z') ||
			(ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
			std::string_view("-_=/,.+").find(ch) != std::string_view::npos;
		REQUIRE(PosixEscape::isAllowed(ch) == expected);
	}
	REQUIRE_FALSE(PosixEscape::isAllowed(':'));
	REQUIRE_FALSE(PosixEscape::isAllowed('@'));
	REQUIRE_FALSE(PosixEscape::isAllowed('~'));
}

TEST_CASE("PosixEscape: quoted results are owned")
{
	std::string input = "a b";
	Escaped e = PosixEscape::escape(input);
	REQUIRE_FALSE(e.isBorrowed());
	input[0] = 'X';
	REQUIRE(e == "'a b'"sv);
}

TEST_CASE("PosixEscape: invalid UTF-8 is kept byte for byte")
{
	std::string_view input("\x66\x6f\x80\x6f", 4);
	REQUIRE(PosixEscape::escape(input) == std::string_view("'\x66\x6f\x80\x6f'", 6));

	std::string_view withNul("a\0b", 3);
	REQUIRE(PosixEscape::escape(withNul) == std::string_view("'a\0b'", 5));

	std::string_view high("\xff\xfe", 2);
	REQUIRE(PosixEscape::escape(high) == std::string_view("'\xff\xfe'", 4));
}

TEST_CASE("PosixEscape::appendEscaped")
{
	std::string line = "cp";
	line.push_back(' ');
	PosixEscape::appendEscaped(line, "-r");
	line.push_back(' ');
	PosixEscape::appendEscaped(line, "my file's.txt");
	line.push_back(' ');
	PosixEscape::appendEscaped(line, "/tmp/out");
	REQUIRE(line == "cp -r 'my file'\\''s.txt' /tmp/out");

	std::string empty;
	PosixEscape::appendEscaped(empty, "");
	REQUIRE(empty == "''");
}

TEST_CASE("PosixEscape: unchanged output implies a safe argument")
{
	for (std::string_view s : { ""sv, "a"sv, "a b"sv, "x:y"sv, "--flag=1"sv, "!"sv })
	{
		Escaped e = PosixEscape::escape(s);
		if (e == s)
		{
			REQUIRE(e.isBorrowed());
			REQUIRE_FALSE(s.empty());
			for (char ch : s) REQUIRE(PosixEscape::isAllowed(ch));
		}
		else
		{
			REQUIRE(PosixEscape::needsQuoting(s));
		}
	}
}
