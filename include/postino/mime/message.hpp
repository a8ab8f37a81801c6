/*

message.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <boost/algorithm/string/join.hpp>
#include <postino/codec/base64.hpp>
#include <postino/codec/codec.hpp>
#include <postino/detail/ascii.hpp>
#include <postino/detail/log.hpp>
#include <postino/detail/result.hpp>
#include <postino/export.hpp>
#include <postino/mime/address.hpp>
#include <postino/mime/date_time.hpp>
#include <postino/mime/framer.hpp>
#include <postino/mime/headers.hpp>


namespace postino
{


/**
Part of a message: its content type and its decoded body.
**/
class POSTINO_EXPORT part
{
public:

    /**
    Creating a part from its header list.

    @param headers Part headers, exactly one content type and nothing else.
    @param body    Decoded body.
    @return        Part, `missing_header` without a content type, `validation_error` for any other header or a second content type,
                   `invalid_content_type` for an eight bit body declared as ASCII, `validation_error` for a carriage return in a body
                   not Base64 encoded.
    **/
    static result<part> from(std::vector<header> headers, std::string body);

    /**
    Creating a part from its content type.

    @param content_type Content type.
    @param body         Decoded body.
    @return             Part, or `invalid_content_type` for an eight bit body declared as ASCII, `validation_error` for a carriage
                        return in a body not Base64 encoded.
    **/
    static result<part> from(content_type_header content_type, std::string body);

    const content_type_header& content_type() const
    {
        return std::get<content_type_header>(headers_.front());
    }

    const std::vector<header>& headers() const
    {
        return headers_;
    }

    const std::string& body() const
    {
        return body_;
    }

    /**
    Rendering the part: content type lines, empty line, body.

    The body is Base64 encoded when the charset is UTF-8 or the media type is HTML.

    @return Part text.
    **/
    std::string format() const;

    friend bool operator==(const part&, const part&) = default;

private:

    part(std::vector<header> headers, std::string body)
        : headers_(std::move(headers)), body_(std::move(body))
    {
    }

    std::vector<header> headers_;

    std::string body_;
};


/**
Headers every message carries.
**/
struct POSTINO_EXPORT message_headers
{
    from_header from;

    recipients_header to;

    subject_header subject;

    date_header date;

    /**
    Collecting the message headers from a list in any order, the last one of a kind wins.

    @param headers Header list.
    @return        Message headers, `missing_header` if one of From, To, Subject, Date is absent, `validation_error` for a content type.
    **/
    static result<message_headers> from_list(const std::vector<header>& headers);

    /**
    Rendering the header lines in the order From, To, Subject, Date.
    **/
    std::string format() const
    {
        return from.format() + codec::END_OF_LINE + to.format() + codec::END_OF_LINE + subject.format() + codec::END_OF_LINE + date.format();
    }

    friend bool operator==(const message_headers&, const message_headers&) = default;
};


/**
Mail message: the headers and either a single plain text part, or the multipart envelope followed by the plain text and the HTML
alternatives.
**/
class POSTINO_EXPORT message
{
public:

    /**
    Creating a message from its headers and parts.

    @param headers Message headers.
    @param parts   Parts, a single `text/plain` one or the three parts `multipart/alternative`, `text/plain`, `text/html`.
    @return        Message, or `invalid_part_layout`, or `validation_error` for a body of a multipart message holding a boundary line
                   without being Base64 encoded.
    **/
    static result<message> from(message_headers headers, std::vector<part> parts);

    /**
    Creating a message from a header list and its parts.

    @param headers Headers in any order.
    @param parts   Parts.
    @return        Message, or the error of `message_headers::from_list(const std::vector<header>&)`, or `invalid_part_layout`.
    **/
    static result<message> from(const std::vector<header>& headers, std::vector<part> parts);

    /**
    Composing a message from the bodies.

    The charset of the text is ASCII when it is seven bit, UTF-8 otherwise. With an HTML body the message is multipart, the HTML part
    always UTF-8, an absent text giving an empty ASCII text part. An empty HTML body counts as absent.

    @param headers Message headers.
    @param text    Plain text body.
    @param html    HTML body.
    @return        Message, `null_input` when there is no body at all, or the error of the part and message factories.
    **/
    static result<message> compose(message_headers headers, std::optional<std::string> text, std::optional<std::string> html = std::nullopt);

    /**
    Parsing a message text.

    @param text    Message text.
    @param options Parsing options.
    @return        Message, or the error of `message_framer::decode(std::string)` or of the message and part factories.
    **/
    static result<message> parse(const std::string& text, message_parse_options_t options = message_parse_options_t{});

    const message_headers& headers() const
    {
        return headers_;
    }

    const address& sender() const
    {
        return headers_.from.sender();
    }

    const std::vector<address>& recipients() const
    {
        return headers_.to.recipients();
    }

    const std::string& subject() const
    {
        return headers_.subject.subject();
    }

    const date_time& date() const
    {
        return headers_.date.date();
    }

    const std::vector<part>& parts() const
    {
        return parts_;
    }

    bool is_multipart() const
    {
        return parts_.size() > 1;
    }

    /**
    Plain text body.
    **/
    const std::string& text_body() const
    {
        return is_multipart() ? parts_[1].body() : parts_.front().body();
    }

    /**
    HTML body, if any.
    **/
    std::optional<std::string> html_body() const
    {
        if (!is_multipart())
            return std::nullopt;
        return parts_[2].body();
    }

    /**
    Rendering the message text.

    @return Header lines, empty line, then the single part or the parts separated by the boundary lines.
    **/
    std::string format() const;

    friend bool operator==(const message&, const message&) = default;

private:

    message(message_headers headers, std::vector<part> parts)
        : headers_(std::move(headers)), parts_(std::move(parts))
    {
    }

    message_headers headers_;

    std::vector<part> parts_;
};


result<part> inline part::from(std::vector<header> headers, std::string body)
{
    std::optional<content_type_header> content_type;
    for (auto& hdr : headers)
    {
        auto* ct = std::get_if<content_type_header>(&hdr);
        if (ct == nullptr)
            return fail<part>(error_code::validation_error, "Header `" + std::string(header_type_name(type_of(hdr))) + "` is not allowed in a part.");
        if (content_type)
            return fail<part>(error_code::validation_error, "More than one content type in a part.");
        content_type = std::move(*ct);
    }
    if (!content_type)
        return fail<part>(error_code::missing_header, "Missing content type of a part.");
    return from(std::move(*content_type), std::move(body));
}


result<part> inline part::from(content_type_header content_type, std::string body)
{
    if (content_type.charset() == codec::CHARSET_ASCII && !is_ascii(body))
        return fail<part>(error_code::invalid_content_type, "Eight bit body declared as `" + codec::CHARSET_ASCII + "`.");
    // CRLF is turned into LF when a message is read
    if (!content_type.is_base64() && body.find(codec::CR_CHAR) != std::string::npos)
        return fail<part>(error_code::validation_error, "Carriage return in a body not Base64 encoded.");
    std::vector<header> headers;
    headers.emplace_back(std::move(content_type));
    return part(std::move(headers), std::move(body));
}


std::string inline part::format() const
{
    const content_type_header& ct = content_type();
    if (!ct.is_base64())
        return message_framer::join_part(ct.format(), body_);

    base64 b64;
    return message_framer::join_part(ct.format(), b64.encode_text(body_));
}


result<message_headers> inline message_headers::from_list(const std::vector<header>& headers)
{
    std::optional<from_header> from_hdr;
    std::optional<recipients_header> to_hdr;
    std::optional<subject_header> subject_hdr;
    std::optional<date_header> date_hdr;

    for (const auto& hdr : headers)
    {
        if (const auto* from_ptr = std::get_if<from_header>(&hdr))
            from_hdr = *from_ptr;
        else if (const auto* to_ptr = std::get_if<recipients_header>(&hdr))
            to_hdr = *to_ptr;
        else if (const auto* subject_ptr = std::get_if<subject_header>(&hdr))
            subject_hdr = *subject_ptr;
        else if (const auto* date_ptr = std::get_if<date_header>(&hdr))
            date_hdr = *date_ptr;
        else
            return fail<message_headers>(error_code::validation_error, "Content type among the message headers.");
    }

    if (!from_hdr)
        return fail<message_headers>(error_code::missing_header, "Missing header `From`.");
    if (!to_hdr)
        return fail<message_headers>(error_code::missing_header, "Missing header `To`.");
    if (!subject_hdr)
        return fail<message_headers>(error_code::missing_header, "Missing header `Subject`.");
    if (!date_hdr)
        return fail<message_headers>(error_code::missing_header, "Missing header `Date`.");
    return message_headers{std::move(*from_hdr), std::move(*to_hdr), std::move(*subject_hdr), std::move(*date_hdr)};
}


result<message> inline message::from(message_headers headers, std::vector<part> parts)
{
    auto media_type_of = [&parts](std::size_t i) { return parts[i].content_type().media_type(); };

    if (parts.size() == 1)
    {
        if (media_type_of(0) != media_type_t::TEXT_PLAIN)
            return fail<message>(error_code::invalid_part_layout, "Single part is not `text/plain`.");
    }
    else if (parts.size() == 3)
    {
        if (media_type_of(0) != media_type_t::MULTIPART_ALTERNATIVE || media_type_of(1) != media_type_t::TEXT_PLAIN ||
            media_type_of(2) != media_type_t::TEXT_HTML)
            return fail<message>(error_code::invalid_part_layout, "Parts are not `multipart/alternative`, `text/plain`, `text/html`.");

        const std::string boundary_line = codec::END_OF_LINE + "--" + content_type_header::BOUNDARY;
        for (const auto& prt : parts)
            if (!prt.content_type().is_base64() && (codec::END_OF_LINE + prt.body()).find(boundary_line) != std::string::npos)
                return fail<message>(error_code::validation_error, "Body holding the boundary line `--" + content_type_header::BOUNDARY + "`.");
    }
    else
        return fail<message>(error_code::invalid_part_layout, "Bad number of parts " + std::to_string(parts.size()) + ".");

    return message(std::move(headers), std::move(parts));
}


result<message> inline message::from(const std::vector<header>& headers, std::vector<part> parts)
{
    auto msg_headers = message_headers::from_list(headers);
    if (!msg_headers)
        return fail<message>(msg_headers.error());
    return from(std::move(*msg_headers), std::move(parts));
}


result<message> inline message::compose(message_headers headers, std::optional<std::string> text, std::optional<std::string> html)
{
    if (html && html->empty())
        html.reset();
    if (!text && !html)
        return fail<message>(error_code::null_input, "Neither a text nor an HTML body.");

    auto charset_of = [](const std::string& body) { return is_ascii(body) ? codec::CHARSET_ASCII : codec::CHARSET_UTF8; };
    std::string text_body = text.value_or(std::string());

    std::vector<part> parts;
    if (html)
    {
        auto envelope_ct = content_type_header::from(media_type_t::MULTIPART_ALTERNATIVE, std::string());
        if (!envelope_ct)
            return fail<message>(envelope_ct.error());
        auto envelope = part::from(std::move(*envelope_ct), message_framer::MULTIPART_PLACEHOLDER);
        if (!envelope)
            return fail<message>(envelope.error());
        parts.push_back(std::move(*envelope));
    }

    auto text_ct = content_type_header::from(media_type_t::TEXT_PLAIN, charset_of(text_body));
    if (!text_ct)
        return fail<message>(text_ct.error());
    auto text_part = part::from(std::move(*text_ct), std::move(text_body));
    if (!text_part)
        return fail<message>(text_part.error());
    parts.push_back(std::move(*text_part));

    if (html)
    {
        auto html_ct = content_type_header::from(media_type_t::TEXT_HTML, codec::CHARSET_UTF8);
        if (!html_ct)
            return fail<message>(html_ct.error());
        auto html_part = part::from(std::move(*html_ct), std::move(*html));
        if (!html_part)
            return fail<message>(html_part.error());
        parts.push_back(std::move(*html_part));
    }

    POSTINO_TRACE("composed message of " + std::to_string(parts.size()) + " parts");
    return from(std::move(headers), std::move(parts));
}


result<message> inline message::parse(const std::string& text, message_parse_options_t options)
{
    message_framer framer(options);
    auto fragments = framer.decode(text);
    if (!fragments)
        return fail<message>(fragments.error());

    std::vector<header> msg_headers;
    std::vector<part> parts;
    for (auto frag = fragments->begin(); frag != fragments->end(); frag++)
    {
        std::vector<header> part_headers;
        for (auto& hdr : frag->headers)
        {
            if (frag == fragments->begin() && type_of(hdr) != header_type::CONTENT_TYPE)
                msg_headers.push_back(std::move(hdr));
            else
                part_headers.push_back(std::move(hdr));
        }

        auto prt = part::from(std::move(part_headers), std::move(frag->body));
        if (!prt)
            return fail<message>(prt.error());
        parts.push_back(std::move(*prt));
    }
    return from(msg_headers, std::move(parts));
}


std::string inline message::format() const
{
    std::vector<std::string> part_texts;
    for (const auto& prt : parts_)
        part_texts.push_back(prt.format());
    return message_framer::join(headers_.format(), part_texts);
}


} // namespace postino


#ifdef _MSC_VER
#pragma warning(pop)
#endif
