/*

framer.hpp
----------

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
#include <optional>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <postino/codec/base64.hpp>
#include <postino/codec/codec.hpp>
#include <postino/detail/ascii.hpp>
#include <postino/detail/log.hpp>
#include <postino/detail/result.hpp>
#include <postino/export.hpp>
#include <postino/mime/headers.hpp>


namespace postino
{


/**
Options applied when reading a message text.
**/
struct message_parse_options_t
{
    /**
    Turning CRLF into LF before the text is framed.
    **/
    bool normalize_line_endings = true;
};


/**
Header line as found in the text: lower case name and trimmed value.
**/
struct POSTINO_EXPORT raw_header
{
    std::string name;

    std::string value;

    friend bool operator==(const raw_header&, const raw_header&) = default;
};


/**
Header lines and body of one part, as found in the text.

The first fragment carries the message headers too.
**/
struct POSTINO_EXPORT raw_fragment
{
    std::vector<raw_header> headers;

    std::string body;
};


/**
Recognized headers and decoded body of one part.
**/
struct POSTINO_EXPORT fragment
{
    std::vector<header> headers;

    std::string body;

    /**
    Content type of the fragment, the last one if there are several.
    **/
    std::optional<content_type_header> content_type() const
    {
        for (auto hdr = headers.rbegin(); hdr != headers.rend(); hdr++)
            if (const auto* ct = std::get_if<content_type_header>(&*hdr))
                return *ct;
        return std::nullopt;
    }
};


/**
Splitting a message text into fragments and joining rendered parts back into a message text.

A multipart body is made of the envelope followed by the parts, each one introduced by the `--frontier` line, the last one closed by
the `--frontier--` line.
**/
class POSTINO_EXPORT message_framer
{
public:

    /**
    Line introducing each part of a multipart body.
    **/
    inline static const std::string DELIMITER{codec::END_OF_LINE + "--" + content_type_header::BOUNDARY + codec::END_OF_LINE};

    /**
    Line closing a multipart body.
    **/
    inline static const std::string TERMINATOR{codec::END_OF_LINE + "--" + content_type_header::BOUNDARY + "--"};

    /**
    Empty line between a header block and the body.
    **/
    inline static const std::string BLANK_LINE{codec::END_OF_LINE + codec::END_OF_LINE};

    /**
    Body of the multipart envelope.
    **/
    inline static const std::string MULTIPART_PLACEHOLDER{"This is a message with multiple parts in MIME format."};

    explicit message_framer(message_parse_options_t options = message_parse_options_t{})
        : options_(options)
    {
    }

    /**
    Splitting a message text into raw fragments.

    The content type of the first part is either among the message headers or in its own block after them.

    @param text Message text.
    @return     Fragments in the order of the text, or a format error: `not_ascii` for an eight bit text, `missing_boundary` for a bad
                multipart framing, `format_error` for a bad header block or missing essential headers, or the parsing error of the
                content type.
    **/
    result<std::vector<raw_fragment>> split(std::string text) const;

    /**
    Splitting a message text into fragments of recognized headers and decoded bodies.

    Bodies are decoded from Base64 when the charset is UTF-8 or the media type is HTML. Unknown headers are dropped, a repeated header
    replaces the previous one.

    @param text Message text.
    @return     Fragments, or the error of `split(std::string)`, of a header parser, or of the Base64 decoder.
    **/
    result<std::vector<fragment>> decode(std::string text) const;

    /**
    Rendering a part from its header lines and its already encoded body.

    @param header_block Header lines.
    @param body         Body as it goes on the wire.
    @return             Part text.
    **/
    static std::string join_part(const std::string& header_block, const std::string& body)
    {
        return header_block + BLANK_LINE + body;
    }

    /**
    Rendering a message from the message header lines and the rendered parts.

    @param header_block Message header lines.
    @param parts        Rendered parts, a single one or the envelope followed by the alternatives.
    @return             Message text.
    **/
    static std::string join(const std::string& header_block, const std::vector<std::string>& parts)
    {
        std::string text = header_block + BLANK_LINE;
        if (parts.size() == 1)
            return text + parts.front();
        return text + boost::algorithm::join(parts, DELIMITER) + TERMINATOR;
    }

private:

    /**
    Parsing the header lines of a block.

    @param block   Header lines without the trailing empty line.
    @param headers Headers to append to.
    @return        Success, or `format_error` for a line without a colon or a folded line.
    **/
    static result_void parse_block(const std::string& block, std::vector<raw_header>& headers);

    static const std::string* find_header(const std::vector<raw_header>& headers, const std::string& name)
    {
        for (auto hdr = headers.rbegin(); hdr != headers.rend(); hdr++)
            if (hdr->name == name)
                return &hdr->value;
        return nullptr;
    }

    message_parse_options_t options_;
};


result_void inline message_framer::parse_block(const std::string& block, std::vector<raw_header>& headers)
{
    if (block.empty())
        return fail(error_code::format_error, "Empty header block.");

    std::vector<std::string> lines;
    boost::split(lines, block, boost::is_any_of(codec::END_OF_LINE));
    for (const auto& line : lines)
    {
        if (line.empty() || line.front() == codec::SPACE_CHAR || line.front() == '\t')
            return fail(error_code::format_error, "Bad or folded header line `" + line + "`.");

        auto colon_pos = line.find(codec::COLON_CHAR);
        if (colon_pos == std::string::npos)
            return fail(error_code::format_error, "Header line without colon `" + line + "`.");

        raw_header hdr{boost::to_lower_copy(boost::trim_copy(line.substr(0, colon_pos))), boost::trim_copy(line.substr(colon_pos + 1))};
        if (hdr.name.empty())
            return fail(error_code::format_error, "Header line without name `" + line + "`.");
        headers.push_back(std::move(hdr));
    }
    return ok();
}


result<std::vector<raw_fragment>> inline message_framer::split(std::string text) const
{
    auto reject = [](error_code code, const std::string& what)
    {
        POSTINO_DEBUG("message rejected: " + what);
        return fail<std::vector<raw_fragment>>(code, what);
    };

    if (!is_ascii(text))
        return reject(error_code::not_ascii, "Message text is not 7 bit.");
    if (options_.normalize_line_endings)
        boost::replace_all(text, "\r\n", codec::END_OF_LINE);

    auto head_end = text.find(BLANK_LINE);
    if (head_end == std::string::npos)
        return reject(error_code::format_error, "Missing empty line after the message headers.");

    raw_fragment first;
    if (auto parsed = parse_block(text.substr(0, head_end), first.headers); !parsed)
        return reject(parsed.error().code(), parsed.error().message());
    for (auto type : {header_type::FROM, header_type::TO, header_type::SUBJECT, header_type::DATE})
    {
        const std::string name = boost::to_lower_copy(std::string(header_type_name(type)));
        if (find_header(first.headers, name) == nullptr)
            return reject(error_code::format_error, "Missing header `" + std::string(header_type_name(type)) + "`.");
    }

    const std::string ct_name = boost::to_lower_copy(std::string(header_type_name(header_type::CONTENT_TYPE)));
    std::string rest = text.substr(head_end + BLANK_LINE.size());
    if (find_header(first.headers, ct_name) == nullptr)
    {
        auto part_end = rest.find(BLANK_LINE);
        if (part_end == std::string::npos)
            return reject(error_code::format_error, "Missing part headers.");
        if (auto parsed = parse_block(rest.substr(0, part_end), first.headers); !parsed)
            return reject(parsed.error().code(), parsed.error().message());
        rest.erase(0, part_end + BLANK_LINE.size());
    }

    const std::string* ct_value = find_header(first.headers, ct_name);
    if (ct_value == nullptr)
        return reject(error_code::format_error, "Missing content type.");
    auto ct = content_type_header::parse(*ct_value);
    if (!ct)
        return reject(ct.error().code(), ct.error().message());

    std::vector<raw_fragment> fragments;
    if (!ct->is_multipart())
    {
        first.body = std::move(rest);
        fragments.push_back(std::move(first));
        return fragments;
    }

    POSTINO_TRACE("multipart body, boundary " + content_type_header::BOUNDARY);
    auto term_pos = rest.find(TERMINATOR);
    if (term_pos == std::string::npos)
        return reject(error_code::missing_boundary, "Missing closing boundary.");
    if (rest.find_first_not_of(codec::LF_CHAR, term_pos + TERMINATOR.size()) != std::string::npos)
        return reject(error_code::format_error, "Text after the closing boundary.");
    rest.erase(term_pos);

    std::vector<std::string> chunks;
    boost::algorithm::iter_split(chunks, rest, boost::algorithm::first_finder(DELIMITER));
    if (chunks.size() < 2)
        return reject(error_code::missing_boundary, "No part after the multipart envelope.");

    first.body = std::move(chunks.front());
    fragments.push_back(std::move(first));
    for (auto chunk = chunks.begin() + 1; chunk != chunks.end(); chunk++)
    {
        auto block_end = chunk->find(BLANK_LINE);
        if (block_end == std::string::npos)
            return reject(error_code::format_error, "Missing empty line after the part headers.");

        raw_fragment part;
        if (auto parsed = parse_block(chunk->substr(0, block_end), part.headers); !parsed)
            return reject(parsed.error().code(), parsed.error().message());
        if (find_header(part.headers, ct_name) == nullptr)
            return reject(error_code::format_error, "Missing content type of a part.");
        part.body = chunk->substr(block_end + BLANK_LINE.size());
        fragments.push_back(std::move(part));
    }
    POSTINO_TRACE("multipart body split into " + std::to_string(fragments.size()) + " fragments");
    return fragments;
}


result<std::vector<fragment>> inline message_framer::decode(std::string text) const
{
    auto raw_fragments = split(std::move(text));
    if (!raw_fragments)
        return fail<std::vector<fragment>>(raw_fragments.error());

    std::vector<fragment> fragments;
    for (auto& raw : *raw_fragments)
    {
        fragment frag;
        for (const auto& raw_hdr : raw.headers)
        {
            auto type = header_type_from_name(raw_hdr.name);
            if (!type)
            {
                POSTINO_TRACE("header `" + raw_hdr.name + "` ignored");
                continue;
            }

            auto hdr = parse_header(*type, raw_hdr.value);
            if (!hdr)
            {
                POSTINO_DEBUG("header `" + raw_hdr.name + "` rejected: " + hdr.error().message());
                return fail<std::vector<fragment>>(hdr.error());
            }

            auto same_type = std::find_if(frag.headers.begin(), frag.headers.end(), [&type](const header& h) { return type_of(h) == *type; });
            if (same_type != frag.headers.end())
                *same_type = std::move(*hdr);
            else
                frag.headers.push_back(std::move(*hdr));
        }

        // split() guarantees a content type in every fragment
        const content_type_header ct = *frag.content_type();
        if (ct.is_base64())
        {
            POSTINO_TRACE("Base64 body of `" + ct.value() + "`");
            base64 b64;
            auto body = b64.decode(raw.body);
            if (!body)
                return fail<std::vector<fragment>>(body.error());
            frag.body = std::move(*body);
        }
        else
            frag.body = std::move(raw.body);
        fragments.push_back(std::move(frag));
    }
    return fragments;
}


} // namespace postino


#ifdef _MSC_VER
#pragma warning(pop)
#endif
