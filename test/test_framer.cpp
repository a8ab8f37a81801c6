/*

test_framer.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE framer_test

#include <string>
#include <variant>
#include <vector>
#include <boost/algorithm/string/replace.hpp>
#include <boost/test/unit_test.hpp>
#include <postino/mime/framer.hpp>


using std::string;
using std::vector;
using postino::error_code;
using postino::media_type_t;
using postino::message_framer;
using postino::message_parse_options_t;
using postino::raw_header;
using postino::subject_header;


namespace
{

const string MESSAGE_HEADERS =
    "From: Daniele Buondonno <danibond@gmail.com>\n"
    "To: marcorossi@mail.it\n"
    "Subject: Hello\n"
    "Date: Thu, 3 Dec 2020 00:00:00 +0100";

const string PLAIN_PART = "Content-Type: text/plain; charset=\"us-ascii\"";

const string SINGLE_PART_MESSAGE = MESSAGE_HEADERS + "\n\n" + PLAIN_PART + "\n\nHi!";

const string MULTIPART_MESSAGE = MESSAGE_HEADERS + "\n\n"
    "MIME-Version: 1.0\n"
    "Content-Type: multipart/alternative; boundary=frontier\n"
    "\n"
    "This is a message with multiple parts in MIME format.\n"
    "--frontier\n"
    "Content-Type: text/plain; charset=\"us-ascii\"\n"
    "\n"
    "Hi\n"
    "--frontier\n"
    "Content-Type: text/html; charset=\"utf-8\"\n"
    "Content-Transfer-Encoding: base64\n"
    "\n"
    "PGI+SGk8L2I+\n"
    "--frontier--";

} // namespace


/**
Splitting a single part message with the content type in its own block.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(split_single_part)
{
    message_framer framer;
    auto frags = framer.split(SINGLE_PART_MESSAGE);
    BOOST_REQUIRE(frags);
    BOOST_REQUIRE_EQUAL(frags->size(), 1U);

    const auto& headers = frags->front().headers;
    BOOST_REQUIRE_EQUAL(headers.size(), 5U);
    BOOST_CHECK(headers[0] == (raw_header{"from", "Daniele Buondonno <danibond@gmail.com>"}));
    BOOST_CHECK(headers[3] == (raw_header{"date", "Thu, 3 Dec 2020 00:00:00 +0100"}));
    BOOST_CHECK(headers[4] == (raw_header{"content-type", "text/plain; charset=\"us-ascii\""}));
    BOOST_CHECK_EQUAL(frags->front().body, "Hi!");
}


/**
Splitting a single part message with the content type among the message headers.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(split_content_type_in_message_headers)
{
    message_framer framer;
    auto frags = framer.split(MESSAGE_HEADERS + "\n" + PLAIN_PART + "\n\nHi!\n\nBye!");
    BOOST_REQUIRE(frags);
    BOOST_REQUIRE_EQUAL(frags->size(), 1U);
    BOOST_CHECK_EQUAL(frags->front().headers.size(), 5U);
    BOOST_CHECK_EQUAL(frags->front().body, "Hi!\n\nBye!");
}


/**
Splitting a multipart message into the envelope and the alternatives.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(split_multipart)
{
    message_framer framer;
    auto frags = framer.split(MULTIPART_MESSAGE + "\n");
    BOOST_REQUIRE(frags);
    BOOST_REQUIRE_EQUAL(frags->size(), 3U);
    BOOST_CHECK_EQUAL(frags->at(0).headers.size(), 6U);
    BOOST_CHECK_EQUAL(frags->at(0).body, message_framer::MULTIPART_PLACEHOLDER);
    BOOST_CHECK_EQUAL(frags->at(1).headers.size(), 1U);
    BOOST_CHECK_EQUAL(frags->at(1).body, "Hi");
    BOOST_CHECK_EQUAL(frags->at(2).headers.size(), 2U);
    BOOST_CHECK(frags->at(2).headers[1] == (raw_header{"content-transfer-encoding", "base64"}));
    BOOST_CHECK_EQUAL(frags->at(2).body, "PGI+SGk8L2I+");
}


/**
Decoding a multipart message: unknown headers dropped, HTML body decoded.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_multipart)
{
    message_framer framer;
    auto frags = framer.decode(MULTIPART_MESSAGE);
    BOOST_REQUIRE(frags);
    BOOST_REQUIRE_EQUAL(frags->size(), 3U);

    BOOST_CHECK_EQUAL(frags->at(0).headers.size(), 5U);
    BOOST_REQUIRE(frags->at(0).content_type());
    BOOST_CHECK(frags->at(0).content_type()->is_multipart());

    BOOST_CHECK(frags->at(1).content_type()->media_type() == media_type_t::TEXT_PLAIN);
    BOOST_CHECK_EQUAL(frags->at(1).body, "Hi");

    BOOST_CHECK_EQUAL(frags->at(2).headers.size(), 1U);
    BOOST_CHECK(frags->at(2).content_type()->media_type() == media_type_t::TEXT_HTML);
    BOOST_CHECK_EQUAL(frags->at(2).body, "<b>Hi</b>");
}


/**
Decoding repeated and unknown headers.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_repeated_and_unknown_headers)
{
    const string text = "X-Mailer: postino\n"
        "Subject: First\n" + MESSAGE_HEADERS + "\nSubject: Last\n\n" + PLAIN_PART + "\n\nHi!";

    message_framer framer;
    auto frags = framer.decode(text);
    BOOST_REQUIRE(frags);
    const auto& headers = frags->front().headers;
    BOOST_REQUIRE_EQUAL(headers.size(), 5U);
    const auto* subject = std::get_if<subject_header>(&headers[0]);
    BOOST_REQUIRE(subject != nullptr);
    BOOST_CHECK_EQUAL(subject->subject(), "Last");
}


/**
Decoding a bad header value or a bad Base64 body.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_errors)
{
    message_framer framer;

    string bad_date = SINGLE_PART_MESSAGE;
    boost::replace_first(bad_date, "Thu, 3 Dec", "Fri, 3 Dec");
    auto date_frags = framer.decode(bad_date);
    BOOST_REQUIRE(!date_frags);
    BOOST_CHECK(date_frags.error().is(error_code::invalid_date));

    string bad_body = MULTIPART_MESSAGE;
    boost::replace_first(bad_body, "PGI+SGk8L2I+", "PGI+S*k8L2I+");
    auto body_frags = framer.decode(bad_body);
    BOOST_REQUIRE(!body_frags);
    BOOST_CHECK(body_frags.error().is(error_code::invalid_encoding));
}


/**
Splitting malformed message texts.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(split_errors)
{
    message_framer framer;
    auto check = [&framer](const string& text, error_code expected)
    {
        auto frags = framer.split(text);
        BOOST_REQUIRE_MESSAGE(!frags, "accepted `" << text << "`");
        BOOST_CHECK_MESSAGE(frags.error().is(expected), "unexpected error " << frags.error().to_string());
    };

    check("From: a@b.it\nSubject: Caf\xC3\xA9\n\n" + PLAIN_PART + "\n\nHi", error_code::not_ascii);
    check(MESSAGE_HEADERS + "\n" + PLAIN_PART, error_code::format_error);
    check("From: a@b.it\nTo: c@d.it\nSubject: Hello\n\n" + PLAIN_PART + "\n\nHi", error_code::format_error);
    check(MESSAGE_HEADERS + "\n folded\n\n" + PLAIN_PART + "\n\nHi", error_code::format_error);
    check(MESSAGE_HEADERS + "\nno colon here\n\n" + PLAIN_PART + "\n\nHi", error_code::format_error);
    check(MESSAGE_HEADERS + "\n\nHi!", error_code::format_error);
    check(MESSAGE_HEADERS + "\n\nContent-Type: text/plain\n\nHi!", error_code::invalid_header);

    string no_terminator = MULTIPART_MESSAGE;
    boost::replace_last(no_terminator, "--frontier--", "--frontier");
    check(no_terminator, error_code::missing_boundary);
    check(MULTIPART_MESSAGE + "\ntrailing text", error_code::format_error);
    check(MESSAGE_HEADERS + "\n\nMIME-Version: 1.0\nContent-Type: multipart/alternative; boundary=frontier\n\n" +
        message_framer::MULTIPART_PLACEHOLDER + "\n--frontier--", error_code::missing_boundary);
    check(MESSAGE_HEADERS + "\n\nContent-Type: multipart/alternative; boundary=frontier\n\nEnvelope\n--frontier\n" + PLAIN_PART +
        "\n--frontier--", error_code::format_error);
    check(MESSAGE_HEADERS + "\n\nContent-Type: multipart/alternative; boundary=frontier\n\nEnvelope\n--frontier\nX-Part: 1\n\nHi"
        "\n--frontier--", error_code::format_error);
}


/**
Reading CRLF texts with and without normalization.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(line_endings)
{
    string crlf_text = SINGLE_PART_MESSAGE;
    boost::replace_all(crlf_text, "\n", "\r\n");

    message_framer normalizing;
    auto frags = normalizing.split(crlf_text);
    BOOST_REQUIRE(frags);
    BOOST_CHECK_EQUAL(frags->front().headers.size(), 5U);
    BOOST_CHECK_EQUAL(frags->front().body, "Hi!");

    message_framer verbatim(message_parse_options_t{false});
    auto raw = verbatim.split(crlf_text);
    BOOST_REQUIRE(!raw);
    BOOST_CHECK(raw.error().is(error_code::format_error));
}


/**
Joining rendered parts into a message text.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(join_parts)
{
    BOOST_CHECK_EQUAL(message_framer::join_part("X: y", "body"), "X: y\n\nbody");
    BOOST_CHECK_EQUAL(message_framer::join("H: v", vector<string>{"P"}), "H: v\n\nP");
    BOOST_CHECK_EQUAL(message_framer::join("H: v", vector<string>{"A", "B", "C"}),
        "H: v\n\nA\n--frontier\nB\n--frontier\nC\n--frontier--");
}
