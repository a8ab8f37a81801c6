/*

address_decode.cpp
------------------

Reads one address per line from the standard input and prints its display
name, local part and domain, one per line.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the MIT license, see the accompanying file LICENSE or
copy at https://opensource.org/licenses/MIT.

*/


#include <cstdlib>
#include <iostream>
#include <postino/mime/address.hpp>
#include "example_util.hpp"


using std::cout;
using postino::address;


int main()
{
    postino::log::logger::instance().configure_from_env();
    int status = EXIT_SUCCESS;
    for (const auto& line : read_lines(std::cin))
    {
        if (line.empty())
            continue;

        auto addr = address::parse(line);
        if (!addr)
        {
            print_error(addr.error());
            status = EXIT_FAILURE;
            continue;
        }
        cout << addr->display_name() << '\n' << addr->local() << '\n' << addr->domain() << '\n';
    }
    return status;
}
