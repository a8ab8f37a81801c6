/*

headers.hpp
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

#include <algorithm>
#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <postino/codec/codec.hpp>
#include <postino/codec/encoded_word.hpp>
#include <postino/detail/ascii.hpp>
#include <postino/detail/log.hpp>
#include <postino/detail/result.hpp>
#include <postino/export.hpp>
#include <postino/mime/address.hpp>
#include <postino/mime/date_time.hpp>


namespace postino
{


/**
Kinds of the recognized headers.
**/
enum class header_type {FROM, TO, SUBJECT, DATE, CONTENT_TYPE};


/**
Header name as written on the wire.

@param type Header kind.
@return     One of `From`, `To`, `Subject`, `Date`, `Content-Type`.
**/
inline std::string_view header_type_name(header_type type)
{
    switch (type)
    {
        case header_type::FROM: return "From";
        case header_type::TO: return "To";
        case header_type::SUBJECT: return "Subject";
        case header_type::DATE: return "Date";
        case header_type::CONTENT_TYPE: return "Content-Type";
    }
    return "";
}


/**
Header kind for a name, compared case insensitive.

@param name Header name.
@return     Kind, or nothing for a header this codec ignores.
**/
inline std::optional<header_type> header_type_from_name(std::string_view name)
{
    for (auto type : {header_type::FROM, header_type::TO, header_type::SUBJECT, header_type::DATE, header_type::CONTENT_TYPE})
        if (detail::iequals_ascii(header_type_name(type), name))
            return type;
    return std::nullopt;
}


namespace detail
{

inline constexpr std::string_view HEADER_SEPARATOR_STR{": "};

inline std::string header_line(header_type type, const std::string& value)
{
    std::string line(header_type_name(type));
    line += HEADER_SEPARATOR_STR;
    line += value;
    return line;
}

} // namespace detail


/**
Sender of a message.
**/
class POSTINO_EXPORT from_header
{
public:

    static constexpr header_type TYPE = header_type::FROM;

    static result<from_header> from(address sender)
    {
        return from_header(std::move(sender));
    }

    /**
    Parsing the header value.

    @param value Single address.
    @return      Header, or `invalid_address` if the value is not exactly one address.
    **/
    static result<from_header> parse(const std::string& value)
    {
        auto sender = address::parse(value);
        if (!sender)
            return fail<from_header>(sender.error());
        return from_header(std::move(*sender));
    }

    const address& sender() const
    {
        return sender_;
    }

    header_type type() const
    {
        return TYPE;
    }

    std::string value() const
    {
        return sender_.format();
    }

    std::string format() const
    {
        return detail::header_line(TYPE, value());
    }

    friend bool operator==(const from_header&, const from_header&) = default;

    friend std::strong_ordering operator<=>(const from_header& lhs, const from_header& rhs)
    {
        return lhs.sender_ <=> rhs.sender_;
    }

private:

    explicit from_header(address sender)
        : sender_(std::move(sender))
    {
    }

    address sender_;
};


/**
Non empty, ordered list of recipients.

Lists compare lexicographically by address, a list being a prefix of another one sorts first.
**/
class POSTINO_EXPORT recipients_header
{
public:

    static constexpr header_type TYPE = header_type::TO;

    /**
    Creating the header from the addresses.

    @param recipients Addresses in the order to keep.
    @return           Header, or `empty_field` if there are no addresses.
    **/
    static result<recipients_header> from(std::vector<address> recipients)
    {
        if (recipients.empty())
            return fail<recipients_header>(error_code::empty_field, "No recipients.");
        return recipients_header(std::move(recipients));
    }

    /**
    Parsing the header value.

    @param value Comma separated addresses.
    @return      Header, or the error of `decode_addresses(const std::string&)`.
    **/
    static result<recipients_header> parse(const std::string& value)
    {
        auto recipients = decode_addresses(value);
        if (!recipients)
            return fail<recipients_header>(recipients.error());
        return from(std::move(*recipients));
    }

    const std::vector<address>& recipients() const
    {
        return recipients_;
    }

    header_type type() const
    {
        return TYPE;
    }

    /**
    Rendered addresses, one per line.
    **/
    std::string value() const
    {
        std::string out;
        for (auto addr = recipients_.begin(); addr != recipients_.end(); addr++)
        {
            if (addr != recipients_.begin())
                out += codec::END_OF_LINE;
            out += addr->format();
        }
        return out;
    }

    std::string format() const
    {
        return detail::header_line(TYPE, encode_addresses(recipients_));
    }

    friend bool operator==(const recipients_header&, const recipients_header&) = default;

    friend std::strong_ordering operator<=>(const recipients_header& lhs, const recipients_header& rhs)
    {
        return std::lexicographical_compare_three_way(lhs.recipients_.begin(), lhs.recipients_.end(), rhs.recipients_.begin(),
            rhs.recipients_.end());
    }

private:

    explicit recipients_header(std::vector<address> recipients)
        : recipients_(std::move(recipients))
    {
    }

    std::vector<address> recipients_;
};


/**
Subject, stored decoded.

A subject which is not ASCII goes on the wire as an encoded word.
**/
class POSTINO_EXPORT subject_header
{
public:

    static constexpr header_type TYPE = header_type::SUBJECT;

    /**
    Creating the header from the decoded subject.

    @param subject Subject text.
    @return        Header, `empty_field` for an empty or blank subject, `validation_error` if the subject holds a line break or starts
                   or ends with a blank.
    **/
    static result<subject_header> from(std::string subject)
    {
        const std::string_view trimmed = detail::trim_view(subject);
        if (trimmed.empty())
            return fail<subject_header>(error_code::empty_field, "Empty subject.");
        if (detail::contains_crlf_or_nul(subject))
            return fail<subject_header>(error_code::validation_error, "Subject holds a line break.");
        // header values are trimmed when read back
        if (trimmed.size() != subject.size())
            return fail<subject_header>(error_code::validation_error, "Subject starts or ends with a blank.");
        return subject_header(std::move(subject));
    }

    /**
    Parsing the header value, decoding it if it is an encoded word.

    @param value Subject as written on the wire.
    @return      Header, or `invalid_encoding` for a bad encoded word.
    **/
    static result<subject_header> parse(const std::string& value)
    {
        encoded_word word;
        auto subject = word.decode(value);
        if (!subject)
            return fail<subject_header>(subject.error());
        return from(std::move(*subject));
    }

    const std::string& subject() const
    {
        return subject_;
    }

    header_type type() const
    {
        return TYPE;
    }

    std::string value() const
    {
        return subject_;
    }

    std::string format() const
    {
        if (is_ascii(subject_))
            return detail::header_line(TYPE, subject_);

        encoded_word word;
        return detail::header_line(TYPE, word.encode(subject_));
    }

    friend bool operator==(const subject_header&, const subject_header&) = default;

    friend std::strong_ordering operator<=>(const subject_header&, const subject_header&) = default;

private:

    explicit subject_header(std::string subject)
        : subject_(std::move(subject))
    {
    }

    std::string subject_;
};


/**
Date of a message.
**/
class POSTINO_EXPORT date_header
{
public:

    static constexpr header_type TYPE = header_type::DATE;

    static result<date_header> from(date_time date)
    {
        return date_header(date);
    }

    /**
    Parsing the header value.

    @param value RFC 1123 date.
    @return      Header, or `invalid_date`.
    **/
    static result<date_header> parse(const std::string& value)
    {
        auto date = date_time::parse(value);
        if (!date)
            return fail<date_header>(date.error());
        return date_header(*date);
    }

    const date_time& date() const
    {
        return date_;
    }

    header_type type() const
    {
        return TYPE;
    }

    /**
    Date in the ISO 8601 form.
    **/
    std::string value() const
    {
        return date_.format_iso();
    }

    std::string format() const
    {
        return detail::header_line(TYPE, date_.format());
    }

    friend bool operator==(const date_header&, const date_header&) = default;

    friend std::strong_ordering operator<=>(const date_header&, const date_header&) = default;

private:

    explicit date_header(date_time date)
        : date_(date)
    {
    }

    date_time date_;
};


/**
Media types this codec knows of.
**/
enum class media_type_t {MULTIPART_ALTERNATIVE, TEXT_PLAIN, TEXT_HTML};


inline std::string_view media_type_name(media_type_t media_type)
{
    switch (media_type)
    {
        case media_type_t::MULTIPART_ALTERNATIVE: return "multipart/alternative";
        case media_type_t::TEXT_PLAIN: return "text/plain";
        case media_type_t::TEXT_HTML: return "text/html";
    }
    return "";
}


/**
Content type of a part: media type and charset.

The charset is empty for `multipart/alternative` and either `us-ascii` or `utf-8` for the text types.
**/
class POSTINO_EXPORT content_type_header
{
public:

    static constexpr header_type TYPE = header_type::CONTENT_TYPE;

    /**
    Boundary token between the parts of a multipart message.
    **/
    inline static const std::string BOUNDARY{"frontier"};

    /**
    Version line preceding the multipart content type.
    **/
    inline static const std::string MIME_VERSION_LINE{"MIME-Version: 1.0"};

    /**
    Transfer encoding line following a non ASCII content type.
    **/
    inline static const std::string TRANSFER_ENCODING_LINE{"Content-Transfer-Encoding: base64"};

    /**
    Creating the header from a media type and a charset.

    @param media_type Media type.
    @param charset    Charset, empty for the multipart type.
    @return           Header, or `invalid_content_type` for an illegal pairing.
    **/
    static result<content_type_header> from(media_type_t media_type, std::string charset);

    /**
    Creating the header from the media type and charset names.

    @param media_type Media type name, for example `text/plain`.
    @param charset    Charset, empty for the multipart type.
    @return           Header, or `invalid_content_type` for an unknown media type or an illegal pairing.
    **/
    static result<content_type_header> from(const std::string& media_type, std::string charset);

    /**
    Parsing the header value, for example `text/plain; charset="us-ascii"` or `multipart/alternative; boundary=frontier`.

    @param value Header value.
    @return      Header, `invalid_header` if the value cannot be read as a supported content type, `missing_boundary` if the multipart
                 boundary is absent or differs from `BOUNDARY`.
    **/
    static result<content_type_header> parse(const std::string& value);

    media_type_t media_type() const
    {
        return media_type_;
    }

    const std::string& charset() const
    {
        return charset_;
    }

    bool is_multipart() const
    {
        return media_type_ == media_type_t::MULTIPART_ALTERNATIVE;
    }

    /**
    Checking whether a body with this content type is transported as Base64.
    **/
    bool is_base64() const
    {
        return charset_ == codec::CHARSET_UTF8 || media_type_ == media_type_t::TEXT_HTML;
    }

    header_type type() const
    {
        return TYPE;
    }

    /**
    Media type, followed by the charset if there is one.
    **/
    std::string value() const
    {
        std::string out(media_type_name(media_type_));
        if (!charset_.empty())
            out += codec::SPACE_CHAR + charset_;
        return out;
    }

    /**
    Rendering the content type lines.

    @return Version and content type lines for the multipart type, otherwise the content type line followed by the transfer encoding
            line unless the charset is ASCII.
    **/
    std::string format() const;

    friend bool operator==(const content_type_header&, const content_type_header&) = default;

private:

    content_type_header(media_type_t media_type, std::string charset)
        : media_type_(media_type), charset_(std::move(charset))
    {
    }

    media_type_t media_type_;

    std::string charset_;
};


result<content_type_header> inline content_type_header::from(media_type_t media_type, std::string charset)
{
    if (media_type == media_type_t::MULTIPART_ALTERNATIVE)
    {
        if (!charset.empty())
            return fail<content_type_header>(error_code::invalid_content_type, "Charset `" + charset + "` given for the multipart type.");
    }
    else if (charset != codec::CHARSET_ASCII && charset != codec::CHARSET_UTF8)
        return fail<content_type_header>(error_code::invalid_content_type, "Bad charset `" + charset + "` for `" +
            std::string(media_type_name(media_type)) + "`.");
    return content_type_header(media_type, std::move(charset));
}


result<content_type_header> inline content_type_header::from(const std::string& media_type, std::string charset)
{
    for (auto type : {media_type_t::MULTIPART_ALTERNATIVE, media_type_t::TEXT_PLAIN, media_type_t::TEXT_HTML})
        if (media_type == media_type_name(type))
            return from(type, std::move(charset));
    return fail<content_type_header>(error_code::invalid_content_type, "Bad media type `" + media_type + "`.");
}


/*
See [rfc 2045, section 5.1].
*/
result<content_type_header> inline content_type_header::parse(const std::string& value)
{
    std::vector<std::string> tokens;
    boost::split(tokens, value, boost::is_any_of(std::string(1, codec::SEMICOLON_CHAR)));

    const std::string media_type = boost::to_lower_copy(boost::trim_copy(tokens.front()));
    std::optional<std::string> charset;
    std::optional<std::string> boundary;
    for (auto param = tokens.begin() + 1; param != tokens.end(); param++)
    {
        std::string param_text = boost::trim_copy(*param);
        if (param_text.empty())
            continue;
        auto equal_pos = param_text.find(codec::EQUAL_CHAR);
        if (equal_pos == std::string::npos)
            return fail<content_type_header>(error_code::invalid_header, "Bad content type parameter `" + param_text + "`.");

        const std::string name = boost::to_lower_copy(boost::trim_copy(param_text.substr(0, equal_pos)));
        std::string param_value = boost::trim_copy(param_text.substr(equal_pos + 1));
        if (param_value.size() >= 2 && param_value.front() == codec::QUOTE_CHAR && param_value.back() == codec::QUOTE_CHAR)
            param_value = param_value.substr(1, param_value.size() - 2);

        if (name == "charset")
            charset = boost::to_lower_copy(param_value);
        else if (name == "boundary")
            boundary = param_value;
    }

    auto header = from(media_type, charset.value_or(std::string()));
    if (!header)
        return fail<content_type_header>(error_code::invalid_header, "Bad content type `" + value + "`: " + header.error().message());
    if (header->is_multipart() && boundary.value_or(std::string()) != BOUNDARY)
        return fail<content_type_header>(error_code::missing_boundary, "Missing boundary `" + BOUNDARY + "` in `" + value + "`.");
    return header;
}


std::string inline content_type_header::format() const
{
    std::string line(header_type_name(TYPE));
    line += detail::HEADER_SEPARATOR_STR;
    line += media_type_name(media_type_);
    line += codec::SEMICOLON_CHAR;
    line += codec::SPACE_CHAR;
    if (is_multipart())
        return MIME_VERSION_LINE + codec::END_OF_LINE + line + "boundary=" + BOUNDARY;

    line += "charset=";
    line += codec::QUOTE_CHAR + charset_ + codec::QUOTE_CHAR;
    if (charset_ != codec::CHARSET_ASCII)
        line += codec::END_OF_LINE + TRANSFER_ENCODING_LINE;
    return line;
}


/**
Header of any recognized kind.
**/
using header = std::variant<from_header, recipients_header, subject_header, date_header, content_type_header>;


inline header_type type_of(const header& hdr)
{
    return std::visit([](const auto& h) { return h.type(); }, hdr);
}


inline std::string value_of(const header& hdr)
{
    return std::visit([](const auto& h) { return h.value(); }, hdr);
}


inline std::string format_header(const header& hdr)
{
    return std::visit([](const auto& h) { return h.format(); }, hdr);
}


/**
Parsing a header value into the header of the given kind.

@param type  Header kind.
@param value Header value, as written after the colon.
@return      Header, or the parsing error of the kind.
**/
inline result<header> parse_header(header_type type, const std::string& value)
{
    auto wrap = [](auto&& hdr) -> result<header>
    {
        if (!hdr)
            return fail<header>(hdr.error());
        return header(std::move(*hdr));
    };

    switch (type)
    {
        case header_type::FROM: return wrap(from_header::parse(value));
        case header_type::TO: return wrap(recipients_header::parse(value));
        case header_type::SUBJECT: return wrap(subject_header::parse(value));
        case header_type::DATE: return wrap(date_header::parse(value));
        case header_type::CONTENT_TYPE: return wrap(content_type_header::parse(value));
    }
    return fail<header>(error_code::invalid_header, "Unknown header kind.");
}


} // namespace postino


#ifdef _MSC_VER
#pragma warning(pop)
#endif
