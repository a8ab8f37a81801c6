/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <climits>
#include <string>
#include <postino/export.hpp>


namespace postino
{


/**
Base class for codecs, contains various constants and the line policies shared by the encoders.
**/
class POSTINO_EXPORT codec
{
public:

    /**
    Checking if a character is eight bit.

    @param ch Character to check.
    @return   True if eight bit, false if seven bit.
    **/
    static constexpr bool is_8bit_char(char ch)
    {
        return static_cast<unsigned char>(ch) > 127;
    }

    /**
    Carriage return character.
    **/
    static constexpr char CR_CHAR = '\r';

    /**
    Line feed character.
    **/
    static constexpr char LF_CHAR = '\n';

    /**
    Plus character.
    **/
    static constexpr char PLUS_CHAR = '+';

    /**
    Slash character.
    **/
    static constexpr char SLASH_CHAR = '/';

    /**
    Equal character.
    **/
    static constexpr char EQUAL_CHAR = '=';

    /**
    Space character.
    **/
    static constexpr char SPACE_CHAR = ' ';

    /**
    Colon character.
    **/
    static constexpr char COLON_CHAR = ':';

    /**
    Semicolon character.
    **/
    static constexpr char SEMICOLON_CHAR = ';';

    /**
    Quote character.
    **/
    static constexpr char QUOTE_CHAR = '"';

    /**
    Monkey character.
    **/
    static constexpr char MONKEY_CHAR = '@';

    /**
    Less than character.
    **/
    static constexpr char LESS_THAN_CHAR = '<';

    /**
    Greater than character.
    **/
    static constexpr char GREATER_THAN_CHAR = '>';

    /**
    Line terminator of the stored message format.
    **/
    inline static const std::string END_OF_LINE{"\n"};

    /**
    ASCII charset label.
    **/
    inline static const std::string CHARSET_ASCII{"us-ascii"};

    /**
    UTF-8 charset label.
    **/
    inline static const std::string CHARSET_UTF8{"utf-8"};

    /**
    Line length policy: the RFC 2045 limit for Base64 lines, or no splitting at all.
    **/
    enum class line_len_policy_t : std::string::size_type {RECOMMENDED = 76, NONE = UINT_MAX};

    /**
    Setting the encoder and decoder line policies.

    @param line1_policy First line policy to set.
    @param lines_policy Other lines policy than the first one to set.
    **/
    codec(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : line1_policy_(line1_policy), lines_policy_(lines_policy)
    {
    }

    codec(const codec&) = delete;

    codec(codec&&) = delete;

    /**
    Default destructor.
    **/
    virtual ~codec() = default;

    void operator=(const codec&) = delete;

    void operator=(codec&&) = delete;

protected:

    /**
    Policy applied for encoding of the first line.
    **/
    std::string::size_type line1_policy_;

    /**
    Policy applied for encoding of the lines other than first one.
    **/
    std::string::size_type lines_policy_;
};


} // namespace postino


#ifdef _MSC_VER
#pragma warning(pop)
#endif
