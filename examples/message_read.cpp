/*

message_read.cpp
----------------

Parses the message text given on the standard input and prints its fields.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the MIT license, see the accompanying file LICENSE or
copy at https://opensource.org/licenses/MIT.

*/


#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>
#include <postino/mime/message.hpp>
#include "example_util.hpp"


using std::cout;
using std::string;
using postino::message;


int main()
{
    auto& logger = postino::log::logger::instance();
    logger.set_level(postino::log::level::debug);
    logger.configure_from_env();

    string text{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    auto msg = message::parse(text);
    if (!msg)
    {
        print_error(msg.error());
        return EXIT_FAILURE;
    }

    cout << "From: " << msg->headers().from.value() << '\n';
    cout << "To:\n" << msg->headers().to.value() << '\n';
    cout << "Subject: " << msg->subject() << '\n';
    cout << "Date: " << msg->headers().date.value() << '\n';
    for (const auto& part : msg->parts())
    {
        cout << "--- " << part.content_type().value() << '\n';
        cout << part.body() << '\n';
    }
    return EXIT_SUCCESS;
}
