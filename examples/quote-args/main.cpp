// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <exception>
#include <iostream>
#include "QuoteArgs.h"

using namespace argquote;

int main(int argc, char* argv[])
{
    try
    {
        return QuoteArgs::run(argc, argv, std::cin, std::cout, std::cerr);
    }
    catch (const std::exception& ex)
    {
        std::cerr << "quote-args: " << ex.what() << '\n';
        return 1;
    }
}
