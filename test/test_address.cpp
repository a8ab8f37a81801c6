/*

test_address.cpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE address_test

#include <algorithm>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <postino/mime/address.hpp>


using std::string;
using std::vector;
using postino::address;
using postino::decode_addresses;
using postino::encode_addresses;
using postino::error_code;


/**
Parsing an address with an unquoted display name.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_name_address)
{
    auto addr = address::parse("Daniele Buondonno <danibond@gmail.com>");
    BOOST_REQUIRE(addr);
    BOOST_CHECK_EQUAL(addr->display_name(), "Daniele Buondonno");
    BOOST_CHECK_EQUAL(addr->local(), "danibond");
    BOOST_CHECK_EQUAL(addr->domain(), "gmail.com");
    BOOST_CHECK_EQUAL(addr->addr_spec(), "danibond@gmail.com");
    BOOST_CHECK_EQUAL(addr->format(), "Daniele Buondonno <danibond@gmail.com>");
}


/**
Parsing addresses without display name, bare and bracketed.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_bare_address)
{
    auto bracketed = address::parse("<marcorossi@mail.it>");
    BOOST_REQUIRE(bracketed);
    BOOST_CHECK(bracketed->display_name().empty());
    BOOST_CHECK_EQUAL(bracketed->format(), "marcorossi@mail.it");

    auto bare = address::parse("  marcorossi@mail.it ");
    BOOST_REQUIRE(bare);
    BOOST_CHECK_EQUAL(bare->local(), "marcorossi");
    BOOST_CHECK_EQUAL(bare->domain(), "mail.it");
    BOOST_CHECK(*bare == *bracketed);
}


/**
Parsing a quoted display name holding the separator.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_quoted_name)
{
    auto addr = address::parse("\"Uno, o due\" <unoodue@mail.it>");
    BOOST_REQUIRE(addr);
    BOOST_CHECK_EQUAL(addr->display_name(), "Uno, o due");
    BOOST_CHECK_EQUAL(addr->format(), "\"Uno, o due\" <unoodue@mail.it>");

    auto again = address::parse(addr->format());
    BOOST_REQUIRE(again);
    BOOST_CHECK_EQUAL(again->display_name(), addr->display_name());
}


/**
Parsing a list mixing all address forms.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_list)
{
    auto list = decode_addresses("Daniele Buondonno <danibond@gmail.com>, marcorossi@mail.it,\"Uno, o due\" <unoodue@mail.it>");
    BOOST_REQUIRE(list);
    BOOST_REQUIRE_EQUAL(list->size(), 3U);
    BOOST_CHECK_EQUAL(list->at(0).display_name(), "Daniele Buondonno");
    BOOST_CHECK_EQUAL(list->at(1).addr_spec(), "marcorossi@mail.it");
    BOOST_CHECK_EQUAL(list->at(2).display_name(), "Uno, o due");
    BOOST_CHECK_EQUAL(encode_addresses(*list),
        "Daniele Buondonno <danibond@gmail.com>, marcorossi@mail.it, \"Uno, o due\" <unoodue@mail.it>");
}


/**
Parsing malformed address lists.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_list_errors)
{
    const vector<string> bad_lists{
        "",
        "   ",
        "a@b.it,,c@d.it",
        "a@b.it,",
        "\"Mario Rossi <mario@rossi.it>",
        "Mario Rossi <mario@rossi.it",
        "Mario Rossi",
        "\"Mario Rossi\"",
        "mario.rossi.it",
        "<mario@rossi.it> x",
        "bad local!@rossi.it",
        "Mar\xC3\xAC <mario@rossi.it>"};

    for (const auto& text : bad_lists)
    {
        auto list = decode_addresses(text);
        BOOST_REQUIRE_MESSAGE(!list, "accepted `" << text << "`");
        BOOST_CHECK(list.error().is(error_code::invalid_address));
        BOOST_CHECK(list.error().is_format_error());
    }

    auto two = address::parse("a@b.it, c@d.it");
    BOOST_REQUIRE(!two);
    BOOST_CHECK(two.error().is(error_code::invalid_address));
}


/**
Creating addresses from their parts.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(create_from_parts)
{
    auto addr = address::from(vector<string>{"Mario Rossi", "mario", "rossi.it"});
    BOOST_REQUIRE(addr);
    BOOST_CHECK_EQUAL(addr->format(), "Mario Rossi <mario@rossi.it>");

    auto short_parts = address::from(vector<string>{"mario", "rossi.it"});
    BOOST_REQUIRE(!short_parts);
    BOOST_CHECK(short_parts.error().is(error_code::validation_error));
    BOOST_CHECK(short_parts.error().is_validation_error());

    BOOST_CHECK(address::from("", "bad local!", "mail.it").error().is(error_code::invalid_address));
    BOOST_CHECK(address::from("", "mario#", "rossi.it").error().is(error_code::invalid_address));
    BOOST_CHECK(address::from("", "mario", "").error().is(error_code::invalid_address));
    BOOST_CHECK(address::from("Mario <Rossi>", "mario", "rossi.it").error().is(error_code::invalid_address));
}


/**
Validating local parts and domains.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(address_part_grammar)
{
    BOOST_CHECK(postino::is_valid_address_part("mario.rossi"));
    BOOST_CHECK(postino::is_valid_address_part("a+b=c{d}~e"));
    BOOST_CHECK(postino::is_valid_address_part("mail.it"));
    BOOST_CHECK(!postino::is_valid_address_part(""));
    BOOST_CHECK(!postino::is_valid_address_part("mario#"));
    BOOST_CHECK(!postino::is_valid_address_part("mario rossi"));
    BOOST_CHECK(!postino::is_valid_address_part("mario@rossi"));
}


/**
Quoting the display name only when it holds two word separations.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(format_quoting)
{
    auto format = [](const string& name)
    {
        return address::from(name, "x", "y.it")->format();
    };

    BOOST_CHECK_EQUAL(format("Mario"), "Mario <x@y.it>");
    BOOST_CHECK_EQUAL(format("Mario Rossi"), "Mario Rossi <x@y.it>");
    BOOST_CHECK_EQUAL(format("Mario Rossi "), "Mario Rossi  <x@y.it>");
    BOOST_CHECK_EQUAL(format("A  B"), "A  B <x@y.it>");
    BOOST_CHECK_EQUAL(format("A B C"), "\"A B C\" <x@y.it>");
    BOOST_CHECK_EQUAL(format("Rossi, Mario"), "\"Rossi, Mario\" <x@y.it>");
    BOOST_CHECK_EQUAL(format("Rossi,Mario"), "\"Rossi,Mario\" <x@y.it>");
}


/**
Reading back display names holding a comma.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(comma_in_display_name)
{
    auto rossi = address::from("Rossi, Mario", "mario", "mail.it");
    BOOST_REQUIRE(rossi);
    BOOST_CHECK_EQUAL(rossi->format(), "\"Rossi, Mario\" <mario@mail.it>");

    auto again = address::parse(rossi->format());
    BOOST_REQUIRE(again);
    BOOST_CHECK_EQUAL(again->display_name(), "Rossi, Mario");
    BOOST_CHECK_EQUAL(again->addr_spec(), "mario@mail.it");

    auto bianchi = *address::from("Bianchi, Anna", "anna", "mail.it");
    auto list = decode_addresses(encode_addresses({*rossi, bianchi}));
    BOOST_REQUIRE(list);
    BOOST_REQUIRE_EQUAL(list->size(), 2u);
    BOOST_CHECK_EQUAL(list->at(0).display_name(), "Rossi, Mario");
    BOOST_CHECK_EQUAL(list->at(1).display_name(), "Bianchi, Anna");
    BOOST_CHECK_EQUAL(list->at(1).addr_spec(), "anna@mail.it");
}


/**
Comparing addresses by local part and domain only.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(address_ordering)
{
    auto anna = *address::from("Zoe", "anna", "b.it");
    auto anna_again = *address::from("Anna", "anna", "b.it");
    auto bruno = *address::from("Alberto", "bruno", "a.it");
    auto anna_other = *address::from("", "anna", "c.it");

    BOOST_CHECK(anna == anna_again);
    BOOST_CHECK(anna < bruno);
    BOOST_CHECK(anna < anna_other);
    BOOST_CHECK(anna_other < bruno);

    vector<address> list{bruno, anna_other, anna};
    std::sort(list.begin(), list.end());
    BOOST_CHECK_EQUAL(list[0].display_name(), "Zoe");
    BOOST_CHECK_EQUAL(list[1].domain(), "c.it");
    BOOST_CHECK_EQUAL(list[2].local(), "bruno");
}
