/*

address.hpp
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

#include <cctype>
#include <compare>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include <postino/codec/codec.hpp>
#include <postino/detail/ascii.hpp>
#include <postino/detail/log.hpp>
#include <postino/detail/regex.hpp>
#include <postino/detail/result.hpp>
#include <postino/export.hpp>


namespace postino
{


/**
Mail address made of an optional display name, the local part and the domain.

Equality and ordering consider the local part and the domain only.
**/
class POSTINO_EXPORT address
{
public:

    /**
    Separator of the addresses in a list.
    **/
    static constexpr char ADDRESS_SEPARATOR = ',';

    /**
    Separator used when rendering a list of addresses.
    **/
    inline static const std::string LIST_SEPARATOR{", "};

    /**
    Creating an address from its three parts.

    @param display_name Display name, possibly empty.
    @param local        Local part, it must satisfy `is_valid_address_part(const std::string&)`.
    @param domain       Domain, it must satisfy `is_valid_address_part(const std::string&)`.
    @return             Address, or `invalid_address` for a bad local part, domain or display name.
    **/
    static result<address> from(std::string display_name, std::string local, std::string domain);

    /**
    Creating an address from the list of its parts in the order display name, local part, domain.

    @param parts Three address parts.
    @return      Address, `validation_error` if the list does not hold three parts.
    **/
    static result<address> from(const std::vector<std::string>& parts);

    /**
    Parsing the text of exactly one address.

    @param text Address text, as rendered by `format()`.
    @return     Address, or `invalid_address` if the text is malformed or holds more than one address.
    **/
    static result<address> parse(const std::string& text);

    const std::string& display_name() const
    {
        return display_name_;
    }

    const std::string& local() const
    {
        return local_;
    }

    const std::string& domain() const
    {
        return domain_;
    }

    /**
    Address without the display name.

    @return Text `local@domain`.
    **/
    std::string addr_spec() const
    {
        return local_ + codec::MONKEY_CHAR + domain_;
    }

    /**
    Rendering the address.

    Without the display name the address is `local@domain`, otherwise `display <local@domain>` with the display name quoted when it holds
    at least two word separations or a comma.

    @return Rendered address.
    **/
    std::string format() const;

    friend bool operator==(const address& lhs, const address& rhs)
    {
        return lhs.local_ == rhs.local_ && lhs.domain_ == rhs.domain_;
    }

    friend std::strong_ordering operator<=>(const address& lhs, const address& rhs)
    {
        return std::tie(lhs.local_, lhs.domain_) <=> std::tie(rhs.local_, rhs.domain_);
    }

private:

    address(std::string display_name, std::string local, std::string domain)
        : display_name_(std::move(display_name)), local_(std::move(local)), domain_(std::move(domain))
    {
    }

    std::string display_name_;

    std::string local_;

    std::string domain_;
};


/**
Checking a local part or a domain against the address token grammar.

@param part Text to check.
@return     True if the text is a non empty sequence of letters, digits and ``.!$%&'*+/=?^_`{|}~-``.
**/
inline bool is_valid_address_part(const std::string& part)
{
    static const detail::regex ADDRESS_PART_REGEX{R"([A-Za-z0-9.!$%&'*+/=?^_`{|}~-]+)"};
    return !part.empty() && is_ascii(part) && detail::regex_match(part, ADDRESS_PART_REGEX);
}


/**
Parsing a comma separated list of addresses.

Each address is either `local@domain` or an optional display name, possibly quoted, followed by `<local@domain>`.

@param text Address list.
@return     Addresses in the order of the text, or `invalid_address` for an empty list, an empty element, an unterminated quote or angle
            bracket, a display name without an address, or a bad address part.
**/
inline result<std::vector<address>> decode_addresses(const std::string& text);


/**
Rendering a list of addresses separated by a comma and a space.

@param addresses Addresses to render.
@return          Address list.
**/
inline std::string encode_addresses(const std::vector<address>& addresses);


result<address> inline address::from(std::string display_name, std::string local, std::string domain)
{
    if (!is_valid_address_part(local))
        return fail<address>(error_code::invalid_address, "Bad local part `" + local + "`.");
    if (!is_valid_address_part(domain))
        return fail<address>(error_code::invalid_address, "Bad domain `" + domain + "`.");
    if (!detail::is_valid_display_name(display_name))
        return fail<address>(error_code::invalid_address, "Bad display name `" + display_name + "`.");
    return address(std::move(display_name), std::move(local), std::move(domain));
}


result<address> inline address::from(const std::vector<std::string>& parts)
{
    if (parts.size() != 3)
        return fail<address>(error_code::validation_error, "Address needs three parts, " + std::to_string(parts.size()) + " given.");
    return from(parts[0], parts[1], parts[2]);
}


result<address> inline address::parse(const std::string& text)
{
    auto addresses = decode_addresses(text);
    if (!addresses)
        return fail<address>(addresses.error());
    if (addresses->size() != 1)
        return fail<address>(error_code::invalid_address, "Single address expected in `" + text + "`.");
    return std::move(addresses->front());
}


std::string inline address::format() const
{
    if (display_name_.empty())
        return addr_spec();

    // a space followed by a non space, not at the end, separates two words
    std::string::size_type separations = 0;
    for (std::string::size_type i = 0; i < display_name_.size(); i++)
        if (display_name_[i] == codec::SPACE_CHAR && i + 1 < display_name_.size() && display_name_[i + 1] != codec::SPACE_CHAR)
            separations++;

    std::string out;
    if (separations >= 2 || display_name_.find(ADDRESS_SEPARATOR) != std::string::npos)
        out = codec::QUOTE_CHAR + display_name_ + codec::QUOTE_CHAR;
    else
        out = display_name_;
    out += codec::SPACE_CHAR;
    out += codec::LESS_THAN_CHAR + addr_spec() + codec::GREATER_THAN_CHAR;
    return out;
}


namespace detail
{

/*
Splitting `local@domain` and validating both parts.
*/
inline result<address> make_address(const std::string& display_name, const std::string& addr_spec)
{
    auto monkey_pos = addr_spec.find(codec::MONKEY_CHAR);
    if (monkey_pos == std::string::npos)
        return fail<address>(error_code::invalid_address, "Missing `@` in address `" + addr_spec + "`.");
    return address::from(display_name, addr_spec.substr(0, monkey_pos), addr_spec.substr(monkey_pos + 1));
}


/*
Word collected before a bracket or a separator: a bare address when it has no blanks.
*/
inline result<address> make_bare_address(const std::string& token)
{
    std::string addr_spec = trim_copy(token);
    for (char ch : addr_spec)
        if (std::isspace(static_cast<unsigned char>(ch)))
            return fail<address>(error_code::invalid_address, "Display name without address `" + addr_spec + "`.");
    return make_address(std::string(), addr_spec);
}

} // namespace detail


/*
States:
- begin: before an address, blanks skipped
- token: first word, a bare address or the start of a display name
- name: unquoted display name with blanks
- qname: quoted display name
- qname_end: after the closing quote, expecting the angle bracket
- addr_br: address between angle brackets
- addr_br_end: after the closing angle bracket, expecting a separator
*/
result<std::vector<address>> inline decode_addresses(const std::string& text)
{
    enum class state_t {BEGIN, TOKEN, NAME, QNAME, QNAME_END, ADDR_BR, ADDR_BR_END};

    auto syntax_error = [&text](const std::string& what, std::size_t pos)
    {
        POSTINO_DEBUG("address list rejected: " + what);
        return fail<std::vector<address>>(error_code::invalid_address, what + " at position " + std::to_string(pos) + " of `" + text + "`.");
    };

    if (!is_ascii(text))
        return fail<std::vector<address>>(error_code::invalid_address, "Address list is not ASCII `" + text + "`.");

    std::vector<address> addresses;
    state_t state = state_t::BEGIN;
    std::string token;
    std::string display_name;
    bool separator_found = false;

    std::size_t char_pos = 0;
    for (auto ch = text.begin(); ch != text.end(); ch++, char_pos++)
    {
        switch (state)
        {
            case state_t::BEGIN:
            {
                if (std::isspace(static_cast<unsigned char>(*ch)))
                    ;
                else if (*ch == codec::QUOTE_CHAR)
                    state = state_t::QNAME;
                else if (*ch == codec::LESS_THAN_CHAR)
                {
                    display_name.clear();
                    state = state_t::ADDR_BR;
                }
                else if (*ch == address::ADDRESS_SEPARATOR)
                    return syntax_error("Empty address", char_pos);
                else if (*ch == codec::GREATER_THAN_CHAR)
                    return syntax_error("Unexpected `>`", char_pos);
                else
                {
                    token += *ch;
                    state = state_t::TOKEN;
                }
                break;
            }

            case state_t::TOKEN:
            case state_t::NAME:
            {
                if (*ch == address::ADDRESS_SEPARATOR)
                {
                    auto addr = detail::make_bare_address(token);
                    if (!addr)
                        return syntax_error(addr.error().message(), char_pos);
                    addresses.push_back(std::move(*addr));
                    token.clear();
                    separator_found = true;
                    state = state_t::BEGIN;
                }
                else if (*ch == codec::LESS_THAN_CHAR)
                {
                    display_name = detail::trim_copy(token);
                    token.clear();
                    state = state_t::ADDR_BR;
                }
                else if (*ch == codec::QUOTE_CHAR || *ch == codec::GREATER_THAN_CHAR)
                    return syntax_error("Unexpected `" + std::string(1, *ch) + "`", char_pos);
                else
                {
                    if (std::isspace(static_cast<unsigned char>(*ch)))
                        state = state_t::NAME;
                    token += *ch;
                }
                break;
            }

            case state_t::QNAME:
            {
                if (*ch == codec::QUOTE_CHAR)
                {
                    display_name = token;
                    token.clear();
                    state = state_t::QNAME_END;
                }
                else
                    token += *ch;
                break;
            }

            case state_t::QNAME_END:
            {
                if (std::isspace(static_cast<unsigned char>(*ch)))
                    ;
                else if (*ch == codec::LESS_THAN_CHAR)
                    state = state_t::ADDR_BR;
                else
                    return syntax_error("Display name without address", char_pos);
                break;
            }

            case state_t::ADDR_BR:
            {
                if (*ch == codec::GREATER_THAN_CHAR)
                {
                    auto addr = detail::make_address(display_name, token);
                    if (!addr)
                        return syntax_error(addr.error().message(), char_pos);
                    addresses.push_back(std::move(*addr));
                    token.clear();
                    display_name.clear();
                    state = state_t::ADDR_BR_END;
                }
                else if (*ch == codec::LESS_THAN_CHAR)
                    return syntax_error("Nested `<`", char_pos);
                else
                    token += *ch;
                break;
            }

            case state_t::ADDR_BR_END:
            {
                if (std::isspace(static_cast<unsigned char>(*ch)))
                    ;
                else if (*ch == address::ADDRESS_SEPARATOR)
                {
                    separator_found = true;
                    state = state_t::BEGIN;
                }
                else
                    return syntax_error("Unexpected `" + std::string(1, *ch) + "` after address", char_pos);
                break;
            }
        }
    }

    switch (state)
    {
        case state_t::BEGIN:
            if (separator_found)
                return syntax_error("Empty address", char_pos);
            return syntax_error("Empty address list", char_pos);

        case state_t::TOKEN:
        case state_t::NAME:
        {
            auto addr = detail::make_bare_address(token);
            if (!addr)
                return syntax_error(addr.error().message(), char_pos);
            addresses.push_back(std::move(*addr));
            break;
        }

        case state_t::QNAME:
            return syntax_error("Unterminated quote", char_pos);

        case state_t::QNAME_END:
            return syntax_error("Display name without address", char_pos);

        case state_t::ADDR_BR:
            return syntax_error("Unterminated `<`", char_pos);

        case state_t::ADDR_BR_END:
            break;
    }

    return addresses;
}


std::string inline encode_addresses(const std::vector<address>& addresses)
{
    std::string out;
    for (auto addr = addresses.begin(); addr != addresses.end(); addr++)
    {
        if (addr != addresses.begin())
            out += address::LIST_SEPARATOR;
        out += addr->format();
    }
    return out;
}


} // namespace postino


#ifdef _MSC_VER
#pragma warning(pop)
#endif
