// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace argquote {

/// @brief The quote-args program: prints its operands as a single
/// command line, with each operand escaped so the target shell
/// reads it back as one argument.
///
///   quote-args [--posix | --windows | --native] [--lines] [--verbose]
///              [--] [ARG...]
///
class QuoteArgs
{
public:
	enum class Style
	{
		POSIX,
		WINDOWS
	};

#ifdef _WIN32
	static constexpr Style NATIVE_STYLE = Style::WINDOWS;
#else
	static constexpr Style NATIVE_STYLE = Style::POSIX;
#endif

	struct Options
	{
		Style style = NATIVE_STYLE;
		bool readLines = false;
		bool verbose = false;
		bool help = false;
		std::vector<std::string> operands;
	};

	/// @brief Parses the command line (argv[0] is skipped).
	///
	/// @throws std::invalid_argument for an unknown option
	///
	static Options parseOptions(int argc, const char* const argv[]);

	static std::string quotePosix(const std::vector<std::string>& args,
		bool verbose = false);

	/// @brief Quotes UTF-8 arguments for Windows: each one is converted
	/// to UTF-16, escaped, and the line converted back to UTF-8.
	///
	static std::string quoteWindows(const std::vector<std::string>& args,
		bool verbose = false);

	/// @brief Runs the program. With `--lines`, arguments are also read
	/// from `in`, one per line (a trailing CR is removed).
	///
	/// @return the exit status: 0 on success, 2 for a usage error
	///
	static int run(int argc, const char* const argv[],
		std::istream& in, std::ostream& out, std::ostream& err);

	static const char* const USAGE;
};

} // namespace argquote
