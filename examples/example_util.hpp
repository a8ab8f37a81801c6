#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <postino/detail/result.hpp>

inline void print_error(const postino::error& err)
{
    std::cerr << "Error: " << postino::error_code_to_string(err.code()) << " - " << err.message() << "\n";
    std::cerr << "Kind: " << (err.is_format_error() ? "format" : err.is_validation_error() ? "validation" : "null input") << "\n";
}

inline std::vector<std::string> read_lines(std::istream& in)
{
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }
    return lines;
}
