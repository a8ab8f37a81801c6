/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions are thrown by the codec - all errors are returned via result<T>.

*/

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <cstdint>
#include <utility>
#include <type_traits>

namespace postino
{

/// Error categories for postino operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Format errors (100-199): malformed text
    format_error = 100,
    invalid_address = 101,
    invalid_header = 102,
    invalid_date = 103,
    invalid_encoding = 104,
    missing_boundary = 105,
    not_ascii = 106,

    // Validation errors (200-299): well-formed but structurally illegal values
    validation_error = 200,
    missing_header = 201,
    empty_field = 202,
    invalid_content_type = 203,
    invalid_part_layout = 204,
    index_out_of_range = 205,

    // Absent arguments (300-399)
    null_input = 300,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::format_error: return "Format error";
        case error_code::invalid_address: return "Invalid address";
        case error_code::invalid_header: return "Invalid header";
        case error_code::invalid_date: return "Invalid date";
        case error_code::invalid_encoding: return "Invalid encoding";
        case error_code::missing_boundary: return "Missing boundary";
        case error_code::not_ascii: return "Not 7-bit text";
        case error_code::validation_error: return "Validation error";
        case error_code::missing_header: return "Missing essential header";
        case error_code::empty_field: return "Empty required field";
        case error_code::invalid_content_type: return "Invalid content type";
        case error_code::invalid_part_layout: return "Invalid part layout";
        case error_code::index_out_of_range: return "Index out of range";
        case error_code::null_input: return "Required input absent";
    }
    return "Unknown error";
}

/// Error type with code and message
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code) noexcept
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[" + std::to_string(static_cast<int>(code_)) + "] ";
        out += error_code_to_string(code_);
        if (!message_.empty() && message_ != error_code_to_string(code_))
        {
            out += ": ";
            out += message_;
        }
        return out;
    }

    /// Check if this is a specific error
    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

    /// Malformed address, header, date or boundary text
    [[nodiscard]] bool is_format_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 100 && c < 200;
    }

    /// Missing essential header, empty field, illegal pairing
    [[nodiscard]] bool is_validation_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 200 && c < 300;
    }

    [[nodiscard]] bool is_null_input() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 300 && c < 400;
    }

private:
    error_code code_;
    std::string message_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

} // namespace postino
