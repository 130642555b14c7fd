// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include "QuoteArgs.h"
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string_view>
#include <argquote/text/PosixEscape.h>
#include <argquote/text/WindowsEscape.h>
#include <argquote/util/Unicode.h>
#include <argquote/util/log.h>

namespace argquote {

const char* const QuoteArgs::USAGE =
    "Usage: quote-args [OPTIONS] [--] [ARG...]\n"
    "\n"
    "Prints ARGs as one command line, escaped for a shell.\n"
    "\n"
    "  --posix     Quote for POSIX shells (sh, bash)\n"
    "  --windows   Quote for Windows command lines\n"
    "  --native    Quote for this platform (default)\n"
    "  --lines     Also read arguments from stdin, one per line\n"
    "  --verbose   Report which arguments needed quoting\n"
    "  --help      Show this help\n";

QuoteArgs::Options QuoteArgs::parseOptions(int argc, const char* const argv[])
{
    Options options;
    int i = 1;
    for (; i < argc; i++)
    {
        std::string_view arg = argv[i];
        if (arg == "--")
        {
            i++;
            break;
        }
        if (arg.size() < 2 || arg[0] != '-')
        {
            // A lone "-" is an operand
            options.operands.emplace_back(arg);
            continue;
        }
        if (arg == "--posix")
        {
            options.style = Style::POSIX;
        }
        else if (arg == "--windows")
        {
            options.style = Style::WINDOWS;
        }
        else if (arg == "--native")
        {
            options.style = NATIVE_STYLE;
        }
        else if (arg == "--lines")
        {
            options.readLines = true;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            options.verbose = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            options.help = true;
        }
        else
        {
            throw std::invalid_argument(
                "Unknown option: " + std::string(arg));
        }
    }
    for (; i < argc; i++) options.operands.emplace_back(argv[i]);
    return options;
}

std::string QuoteArgs::quotePosix(const std::vector<std::string>& args, bool verbose)
{
    std::string line;
    for (const std::string& arg : args)
    {
        if (verbose)
        {
            FORCE_LOG("%s: %s",
                PosixEscape::needsQuoting(arg) ? "quoted" : "unchanged",
                arg.c_str());
        }
        if (!line.empty()) line.push_back(' ');
        PosixEscape::appendEscaped(line, arg);
    }
    return line;
}

std::string QuoteArgs::quoteWindows(const std::vector<std::string>& args, bool verbose)
{
    std::u16string line;
    for (const std::string& arg : args)
    {
        std::u16string wide = Unicode::toUtf16(arg);
        std::u16string_view view(wide);
        if (verbose)
        {
            FORCE_LOG("%s: %s",
                WindowsEscape::needsQuoting(view) ? "quoted" : "unchanged",
                arg.c_str());
        }
        if (!line.empty()) line.push_back(u' ');
        WindowsEscape::appendEscaped(line, view);
    }
    return Unicode::toUtf8(line);
}

int QuoteArgs::run(int argc, const char* const argv[],
    std::istream& in, std::ostream& out, std::ostream& err)
{
    try
    {
        Options options = parseOptions(argc, argv);
        if (options.help)
        {
            out << USAGE;
            return 0;
        }
        if (options.readLines)
        {
            std::string line;
            while (std::getline(in, line))
            {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                LOG("Read argument: %s", line.c_str());
                options.operands.push_back(line);
            }
        }
        LOG("Quoting %zu arguments for %s", options.operands.size(),
            options.style == Style::POSIX ? "POSIX" : "Windows");

        out << (options.style == Style::POSIX ?
            quotePosix(options.operands, options.verbose) :
            quoteWindows(options.operands, options.verbose)) << '\n';
        return 0;
    }
    catch (const std::invalid_argument& ex)
    {
        err << "quote-args: " << ex.what() << '\n';
        return 2;
    }
}

} // namespace argquote
