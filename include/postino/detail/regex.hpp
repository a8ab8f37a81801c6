#pragma once

#include <string>
#include <postino/config.hpp>

#if POSTINO_USE_STD_REGEX
#include <regex>
#else
#include <boost/regex.hpp>
#endif

namespace postino::detail
{
#if POSTINO_USE_STD_REGEX
using regex = std::regex;

inline bool regex_match(const std::string& input, const regex& pattern)
{
    return std::regex_match(input, pattern);
}
#else
using regex = boost::regex;

inline bool regex_match(const std::string& input, const regex& pattern)
{
    return boost::regex_match(input, pattern);
}
#endif
} // namespace postino::detail
