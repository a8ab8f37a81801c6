/*

encoded_word.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <boost/algorithm/string/predicate.hpp>
#include <postino/codec/codec.hpp>
#include <postino/codec/base64.hpp>
#include <postino/detail/log.hpp>
#include <postino/detail/result.hpp>
#include <postino/export.hpp>


namespace postino
{


/**
RFC 2047 encoded word codec.

Only the UTF-8 charset with the Base64 method is produced and recognized, so a word always reads `=?utf-8?B?<base64>?=`.
**/
class POSTINO_EXPORT encoded_word : public codec
{
public:

    /**
    Leading delimiter of an encoded word, charset and method included.
    **/
    inline static const std::string WORD_PREFIX{"=?utf-8?B?"};

    /**
    Trailing delimiter of an encoded word.
    **/
    inline static const std::string WORD_SUFFIX{"?="};

    /**
    Words are never split, the header is written on a single line.
    **/
    encoded_word()
        : codec(static_cast<std::string::size_type>(line_len_policy_t::NONE), static_cast<std::string::size_type>(line_len_policy_t::NONE))
    {
    }

    encoded_word(const encoded_word&) = delete;

    encoded_word(encoded_word&&) = delete;

    /**
    Default destructor.
    **/
    ~encoded_word() = default;

    void operator=(const encoded_word&) = delete;

    void operator=(encoded_word&&) = delete;

    /**
    Wrapping a UTF-8 text into an encoded word.

    @param text String to encode.
    @return     Encoded word.
    **/
    std::string encode(const std::string& text) const
    {
        base64 b64;
        return WORD_PREFIX + b64.encode_text(text) + WORD_SUFFIX;
    }

    /**
    Checking if a text is an encoded word as produced by `encode(const std::string&)`.

    @param text Text to check.
    @return     True if both delimiters are present, false if not.
    **/
    bool is_encoded(const std::string& text) const
    {
        return text.size() >= WORD_PREFIX.size() + WORD_SUFFIX.size() && boost::starts_with(text, WORD_PREFIX) &&
            boost::ends_with(text, WORD_SUFFIX);
    }

    /**
    Unwrapping an encoded word.

    Delimiters are matched case sensitive; a text lacking either of them is returned as it is.

    @param text String to decode.
    @return     Decoded string, or `invalid_encoding` if the payload of a recognized word is not Base64.
    **/
    result<std::string> decode(const std::string& text) const
    {
        if (!is_encoded(text))
            return text;

        const std::string payload = text.substr(WORD_PREFIX.size(), text.size() - WORD_PREFIX.size() - WORD_SUFFIX.size());
        base64 b64;
        auto dec = b64.decode(payload);
        if (!dec)
        {
            POSTINO_DEBUG("encoded word rejected: " + dec.error().message());
            return fail<std::string>(error_code::invalid_encoding, "Bad encoded word `" + text + "`.");
        }
        return dec;
    }
};


} // namespace postino


#ifdef _MSC_VER
#pragma warning(pop)
#endif
