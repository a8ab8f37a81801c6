/*

message_compose.cpp
-------------------

Composes a message from the lines of the standard input and prints its text:

    sender display name
    sender local part
    sender domain
    recipients, comma separated
    subject
    date, for example `Thu, 3 Dec 2020 00:00:00 +0100`
    plain text body
    HTML body, optional


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the MIT license, see the accompanying file LICENSE or
copy at https://opensource.org/licenses/MIT.

*/


#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <postino/mime/message.hpp>
#include "example_util.hpp"


using std::cout;
using std::endl;
using std::string;
using std::vector;
using postino::address;
using postino::date_header;
using postino::from_header;
using postino::message;
using postino::message_headers;
using postino::recipients_header;
using postino::subject_header;


int main()
{
    postino::log::logger::instance().configure_from_env();
    vector<string> lines = read_lines(std::cin);
    if (lines.size() < 7)
    {
        std::cerr << "Expected at least 7 lines, got " << lines.size() << ".\n";
        return EXIT_FAILURE;
    }

    auto require_ok = [](const auto& res)
    {
        if (!res)
        {
            print_error(res.error());
            return false;
        }
        return true;
    };

    auto sender = address::from(lines[0], lines[1], lines[2]);
    if (!require_ok(sender))
        return EXIT_FAILURE;
    auto from = from_header::from(*sender);
    auto to = recipients_header::parse(lines[3]);
    auto subject = subject_header::from(lines[4]);
    auto date = date_header::parse(lines[5]);
    if (!require_ok(from) || !require_ok(to) || !require_ok(subject) || !require_ok(date))
        return EXIT_FAILURE;

    std::optional<string> html;
    if (lines.size() > 7)
        html = lines[7];

    auto msg = message::compose(message_headers{*from, *to, *subject, *date}, lines[6], html);
    if (!require_ok(msg))
        return EXIT_FAILURE;
    cout << msg->format() << endl;
    return EXIT_SUCCESS;
}
