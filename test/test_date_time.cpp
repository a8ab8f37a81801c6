/*

test_date_time.cpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE date_time_test

#include <chrono>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <postino/mime/date_time.hpp>


using std::string;
using std::vector;
using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;
using std::chrono::year;
using std::chrono::sys_days;
using std::chrono::local_days;
using postino::date_time;
using postino::error_code;


/**
Parsing and rendering a date with a positive offset.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_format_positive_offset)
{
    auto date = date_time::parse("Thu, 3 Dec 2020 00:00:00 +0100");
    BOOST_REQUIRE(date);
    BOOST_CHECK(date->instant() == sys_days{year{2020} / 12 / 2} + hours{23});
    BOOST_CHECK(date->offset() == minutes{60});
    BOOST_CHECK(date->local_time() == local_days{year{2020} / 12 / 3});
    BOOST_CHECK_EQUAL(date->format(), "Thu, 3 Dec 2020 00:00:00 +0100");
    BOOST_CHECK_EQUAL(date->format_iso(), "2020-12-03T00:00:00+01:00");
}


/**
Parsing and rendering a date with a negative offset.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_format_negative_offset)
{
    auto date = date_time::parse("Fri, 21 Nov 1997 09:55:06 -0600");
    BOOST_REQUIRE(date);
    BOOST_CHECK(date->instant() == sys_days{year{1997} / 11 / 21} + hours{15} + minutes{55} + seconds{6});
    BOOST_CHECK_EQUAL(date->format(), "Fri, 21 Nov 1997 09:55:06 -0600");
    BOOST_CHECK_EQUAL(date->format_iso(), "1997-11-21T09:55:06-06:00");
}


/**
Parsing the optional fields and the names in any case.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_optional_fields)
{
    auto full = date_time::parse("Thu, 3 Dec 2020 00:00:00 +0100");
    BOOST_REQUIRE(full);

    auto no_weekday = date_time::parse("3 Dec 2020 00:00:00 +0100");
    BOOST_REQUIRE(no_weekday);
    BOOST_CHECK(*no_weekday == *full);

    auto no_seconds = date_time::parse("Thu, 03 Dec 2020 00:00 +0100");
    BOOST_REQUIRE(no_seconds);
    BOOST_CHECK(*no_seconds == *full);

    auto lower_case = date_time::parse("  thu,  3 DEC 2020\t00:00:00 +0100 ");
    BOOST_REQUIRE(lower_case);
    BOOST_CHECK(*lower_case == *full);
}


/**
Parsing the GMT zone, rendered as such.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_gmt)
{
    auto date = date_time::parse("wed, 2 dec 2020 23:00:00 gmt");
    BOOST_REQUIRE(date);
    BOOST_CHECK(date->offset() == minutes{0});
    BOOST_CHECK_EQUAL(date->format(), "Wed, 2 Dec 2020 23:00:00 GMT");
    BOOST_CHECK_EQUAL(date->format_iso(), "2020-12-02T23:00:00Z");

    auto zero = date_time::parse("Wed, 2 Dec 2020 23:00:00 +0000");
    BOOST_REQUIRE(zero);
    BOOST_CHECK(*zero == *date);
}


/**
Ordering dates by instant, then by offset.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(date_ordering)
{
    auto plus_one = *date_time::parse("Thu, 3 Dec 2020 00:00:00 +0100");
    auto gmt = *date_time::parse("Wed, 2 Dec 2020 23:00:00 GMT");
    auto later = *date_time::parse("Thu, 3 Dec 2020 00:00:01 +0100");
    auto earlier = *date_time::parse("Fri, 21 Nov 1997 09:55:06 -0600");

    BOOST_CHECK(gmt.instant() == plus_one.instant());
    BOOST_CHECK(gmt != plus_one);
    BOOST_CHECK(gmt < plus_one);
    BOOST_CHECK(plus_one < later);
    BOOST_CHECK(earlier < gmt);
}


/**
Creating dates from instants and from wall clock times.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(create_date)
{
    auto from_local = date_time::from(local_days{year{2020} / 12 / 3}, minutes{60});
    BOOST_REQUIRE(from_local);
    auto from_instant = date_time::from(sys_days{year{2020} / 12 / 2} + hours{23}, minutes{60});
    BOOST_REQUIRE(from_instant);
    BOOST_CHECK(*from_local == *from_instant);
    BOOST_CHECK_EQUAL(from_local->format(), "Thu, 3 Dec 2020 00:00:00 +0100");

    auto edge = date_time::from(sys_days{year{2020} / 12 / 2}, hours{-18});
    BOOST_REQUIRE(edge);
    BOOST_CHECK_EQUAL(edge->format_iso(), "2020-12-01T06:00:00-18:00");

    auto too_far = date_time::from(sys_days{year{2020} / 12 / 2}, hours{19});
    BOOST_REQUIRE(!too_far);
    BOOST_CHECK(too_far.error().is(error_code::invalid_date));
}


/**
Limiting the local year to the four digits of the rendering.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(create_date_year_range)
{
    auto last = date_time::from(sys_days{year{9999} / 12 / 31} + hours{23}, minutes{0});
    BOOST_REQUIRE(last);
    BOOST_CHECK_EQUAL(last->format(), "Fri, 31 Dec 9999 23:00:00 GMT");
    auto last_again = date_time::parse(last->format());
    BOOST_REQUIRE(last_again);
    BOOST_CHECK(*last_again == *last);

    auto first = date_time::from(local_days{year{0} / 1 / 1}, minutes{0});
    BOOST_REQUIRE(first);
    BOOST_CHECK_EQUAL(first->format(), "Sat, 1 Jan 0000 00:00:00 GMT");
    auto first_again = date_time::parse(first->format());
    BOOST_REQUIRE(first_again);
    BOOST_CHECK(*first_again == *first);

    auto past_offset = date_time::from(sys_days{year{9999} / 12 / 31} + hours{23}, hours{2});
    BOOST_REQUIRE(!past_offset);
    BOOST_CHECK(past_offset.error().is(error_code::invalid_date));

    auto five_digits = date_time::from(sys_days{year{10000} / 1 / 1}, minutes{0});
    BOOST_REQUIRE(!five_digits);
    BOOST_CHECK(five_digits.error().is(error_code::invalid_date));

    auto negative = date_time::from(local_days{year{-1} / 12 / 31}, minutes{0});
    BOOST_REQUIRE(!negative);
    BOOST_CHECK(negative.error().is(error_code::invalid_date));
}


/**
Parsing malformed dates.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_errors)
{
    const vector<string> bad_dates{
        "",
        "Fri, 3 Dec 2020 00:00:00 +0100",
        "Thu 3 Dec 2020 00:00:00 +0100",
        "Thursday, 3 Dec 2020 00:00:00 +0100",
        "3 Dez 2020 00:00:00 +0100",
        "3 Dec 20 00:00:00 +0100",
        "3Dec 2020 00:00:00 +0100",
        "31 Apr 2021 10:00:00 +0000",
        "29 Feb 2021 10:00:00 +0000",
        "3 Dec 2020 24:00:00 +0100",
        "3 Dec 2020 10:60:00 +0100",
        "3 Dec 2020 10:00:60 +0100",
        "3 Dec 2020 1:00:00 +0100",
        "3 Dec 2020 10:00:00",
        "3 Dec 2020 10:00:00 +0160",
        "3 Dec 2020 10:00:00 +1900",
        "3 Dec 2020 10:00:00 CET",
        "3 Dec 2020 10:00:00 +100",
        "3 Dec 2020 10:00:00 +0100 extra",
        "2020-12-03T00:00:00+01:00"};

    for (const auto& text : bad_dates)
    {
        auto date = date_time::parse(text);
        BOOST_REQUIRE_MESSAGE(!date, "accepted `" << text << "`");
        BOOST_CHECK(date.error().is(error_code::invalid_date));
    }

    BOOST_CHECK(date_time::parse("29 Feb 2020 10:00:00 +0000"));
}
