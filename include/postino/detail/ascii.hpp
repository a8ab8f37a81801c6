#pragma once

#include <string>
#include <string_view>
#include <cctype>

namespace postino
{

/**
Checking if a text is seven bit clean.

@param text Text to check.
@return     True if every character is at most 0x7F, false otherwise.
**/
[[nodiscard]] inline bool is_ascii(std::string_view text) noexcept
{
    for (char ch : text)
        if (static_cast<unsigned char>(ch) > 0x7F)
            return false;
    return true;
}

namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
                return false;
        }
        return true;
    }

    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        auto is_space = [](unsigned char c) noexcept { return std::isspace(c) != 0; };

        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
        return sv;
    }

    [[nodiscard]] inline std::string trim_copy(std::string_view sv)
    {
        sv = trim_view(sv);
        return std::string(sv);
    }

    [[nodiscard]] inline bool contains_crlf_or_nul(std::string_view value) noexcept
    {
        for (char ch : value)
        {
            if (ch == '\r' || ch == '\n' || ch == '\0')
                return true;
        }
        return false;
    }

    [[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    [[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
    {
        return (c >= '0' && c <= '9');
    }

    [[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept
    {
        return is_ascii_alpha(c) || is_ascii_digit(c);
    }

    // Printable US-ASCII plus space and tab.
    [[nodiscard]] constexpr bool is_printable_or_wsp(char c) noexcept
    {
        return c == '\t' || (c >= 32 && c <= 126);
    }

    // Display names are rendered verbatim (optionally between quotes), so they
    // must not contain the characters that delimit them.
    [[nodiscard]] inline bool is_valid_display_name(std::string_view name) noexcept
    {
        for (char ch : name)
        {
            if (!is_printable_or_wsp(ch))
                return false;
            if (ch == '"' || ch == '<' || ch == '>')
                return false;
        }
        return true;
    }
}
}
