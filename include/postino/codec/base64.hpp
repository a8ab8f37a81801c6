/*

base64.hpp
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

#include <string>
#include <string_view>
#include <vector>
#include <boost/algorithm/string/join.hpp>
#include <postino/codec/codec.hpp>
#include <postino/detail/ascii.hpp>
#include <postino/detail/result.hpp>
#include <postino/export.hpp>


namespace postino
{


/**
Base64 codec.

Part bodies are transported on a single line unless a line policy is given.
**/
class POSTINO_EXPORT base64 : public codec
{
public:

    /**
    Base64 character set.
    **/
    inline static const std::string CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    Encoder without line splitting.
    **/
    base64()
        : base64(static_cast<std::string::size_type>(line_len_policy_t::NONE), static_cast<std::string::size_type>(line_len_policy_t::NONE))
    {
    }

    /**
    Setting the encoder line policies.

    Since Base64 encodes three characters into four, the split is made after each fourth character. The constructor sets line policies to be
    divisible by the number four.

    @param line1_policy First line policy to set.
    @param lines_policy Other lines policy than the first one to set.
    **/
    base64(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : codec(line1_policy, lines_policy)
    {
        line1_policy_ -= line1_policy_ % SEXTETS_NO;
        lines_policy_ -= lines_policy_ % SEXTETS_NO;
    }

    base64(const base64&) = delete;

    base64(base64&&) = delete;

    /**
    Default destructor.
    **/
    ~base64() = default;

    void operator=(const base64&) = delete;

    void operator=(base64&&) = delete;

    /**
    Encoding a string into vector of Base64 encoded lines by applying the line policy.

    @param text String to encode.
    @return     Vector of Base64 encoded lines, empty for an empty text.
    **/
    std::vector<std::string> encode(std::string_view text) const
    {
        std::vector<std::string> enc_text;
        unsigned char octets[OCTETS_NO];
        unsigned char sextets[SEXTETS_NO];
        int sextets_counter = 0;
        std::string line;
        std::string::size_type line_len = 0;
        std::string::size_type policy = line1_policy_;

        auto add_new_line = [&enc_text, &line_len, &policy, this](std::string& line)
        {
            enc_text.push_back(line);
            line.clear();
            line_len = 0;
            policy = lines_policy_;
        };

        for (std::string::size_type cur_char = 0; cur_char < text.length(); cur_char++)
        {
            octets[sextets_counter++] = static_cast<unsigned char>(text[cur_char]);
            if (sextets_counter == OCTETS_NO)
            {
                sextets[0] = (octets[0] & 0xfc) >> 2;
                sextets[1] = ((octets[0] & 0x03) << 4) + ((octets[1] & 0xf0) >> 4);
                sextets[2] = ((octets[1] & 0x0f) << 2) + ((octets[2] & 0xc0) >> 6);
                sextets[3] = octets[2] & 0x3f;

                for (int i = 0; i < SEXTETS_NO; i++)
                    line += CHARSET[sextets[i]];
                sextets_counter = 0;
                line_len += SEXTETS_NO;
            }

            if (line_len >= policy)
                add_new_line(line);
        }

        // encode remaining characters if any

        if (sextets_counter > 0)
        {
            if (line_len >= policy)
                add_new_line(line);

            for (int i = sextets_counter; i < OCTETS_NO; i++)
                octets[i] = '\0';

            sextets[0] = (octets[0] & 0xfc) >> 2;
            sextets[1] = ((octets[0] & 0x03) << 4) + ((octets[1] & 0xf0) >> 4);
            sextets[2] = ((octets[1] & 0x0f) << 2) + ((octets[2] & 0xc0) >> 6);
            sextets[3] = octets[2] & 0x3f;

            for (int i = 0; i < sextets_counter + 1; i++)
                line += CHARSET[sextets[i]];
            for (int i = sextets_counter; i < OCTETS_NO; i++)
                line += EQUAL_CHAR;
        }

        if (!line.empty())
            enc_text.push_back(line);

        return enc_text;
    }

    /**
    Encoding a string into Base64 text, lines joined by the line feed.

    @param text String to encode.
    @return     Encoded text.
    **/
    std::string encode_text(std::string_view text) const
    {
        return boost::algorithm::join(encode(text), END_OF_LINE);
    }

    /**
    Decoding a vector of Base64 encoded lines to string.

    Padding is optional at the end of the data; nothing but padding may follow it.

    @param text Vector of Base64 encoded lines.
    @return     Decoded string, or `invalid_encoding` for a bad character or a dangling sextet.
    **/
    result<std::string> decode(const std::vector<std::string>& text) const
    {
        std::string dec_text;
        unsigned char sextets[SEXTETS_NO];
        int count_4_chars = 0;
        bool padding = false;

        for (const auto& line : text)
        {
            for (char ch : line)
            {
                if (ch == CR_CHAR)
                    continue;
                if (ch == EQUAL_CHAR)
                {
                    padding = true;
                    continue;
                }
                if (padding)
                    return fail<std::string>(error_code::invalid_encoding, "Data after Base64 padding.");
                if (!is_allowed(ch))
                    return fail<std::string>(error_code::invalid_encoding, "Bad Base64 character `" + printable(ch) + "`.");

                sextets[count_4_chars++] = static_cast<unsigned char>(CHARSET.find(ch));
                if (count_4_chars == SEXTETS_NO)
                {
                    append_octets(dec_text, sextets, OCTETS_NO);
                    count_4_chars = 0;
                }
            }
        }

        // decode remaining characters if any

        if (count_4_chars == 1)
            return fail<std::string>(error_code::invalid_encoding, "Truncated Base64 data.");
        if (count_4_chars > 0)
        {
            for (int i = count_4_chars; i < SEXTETS_NO; i++)
                sextets[i] = 0;
            append_octets(dec_text, sextets, count_4_chars - 1);
        }

        return dec_text;
    }

    /**
    Decoding a Base64 text, possibly split into lines, to a string.

    @param text Base64 encoded text.
    @return     Decoded string.
    @see        `decode(const std::vector<std::string>&)`.
    **/
    result<std::string> decode(std::string_view text) const
    {
        std::vector<std::string> lines;
        std::string_view::size_type start = 0;
        while (start <= text.size())
        {
            auto eol = text.find(LF_CHAR, start);
            if (eol == std::string_view::npos)
            {
                lines.emplace_back(text.substr(start));
                break;
            }
            lines.emplace_back(text.substr(start, eol - start));
            start = eol + 1;
        }
        return decode(lines);
    }

private:

    /**
    Checking if the given character is in the base64 character set.

    @param ch Character to check.
    @return   True if it is, false if not.
    **/
    bool is_allowed(char ch) const
    {
        return detail::is_ascii_alnum(ch) || ch == PLUS_CHAR || ch == SLASH_CHAR;
    }

    static void append_octets(std::string& out, const unsigned char* sextets, int count)
    {
        unsigned char octets[OCTETS_NO];
        octets[0] = static_cast<unsigned char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4));
        octets[1] = static_cast<unsigned char>(((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2));
        octets[2] = static_cast<unsigned char>(((sextets[2] & 0x3) << 6) + sextets[3]);
        for (int i = 0; i < count; i++)
            out += static_cast<char>(octets[i]);
    }

    static std::string printable(char ch)
    {
        if (is_8bit_char(ch) || static_cast<unsigned char>(ch) < 32)
            return "\\x" + std::to_string(static_cast<unsigned>(static_cast<unsigned char>(ch)));
        return std::string(1, ch);
    }

    /**
    Number of six bit chunks.
    **/
    static constexpr unsigned short SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr unsigned short OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace postino


#ifdef _MSC_VER
#pragma warning(pop)
#endif
