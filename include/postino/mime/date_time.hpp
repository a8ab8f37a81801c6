/*

date_time.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <array>
#include <charconv>
#include <chrono>
#include <compare>
#include <cstdlib>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <postino/detail/ascii.hpp>
#include <postino/detail/log.hpp>
#include <postino/detail/result.hpp>
#include <postino/export.hpp>


namespace postino
{


/**
Instant in time together with the fixed UTC offset it is written with.

The offset is kept as given, rendering never normalizes to UTC.
**/
class POSTINO_EXPORT date_time
{
public:

    /**
    Largest offset accepted in either direction.
    **/
    static constexpr std::chrono::minutes MAX_OFFSET{18 * 60};

    /**
    Range of the local year, written with four digits.
    **/
    static constexpr std::chrono::year MIN_YEAR{0};

    static constexpr std::chrono::year MAX_YEAR{9999};

    /**
    Creating a date from the instant and the offset.

    @param instant UTC instant.
    @param offset  Offset from UTC.
    @return        Date, or `invalid_date` if the offset is beyond eighteen hours or the local year is out of `MIN_YEAR`..`MAX_YEAR`.
    **/
    static result<date_time> from(std::chrono::sys_seconds instant, std::chrono::minutes offset);

    /**
    Creating a date from the wall clock time read at the given offset.

    @param local  Local time.
    @param offset Offset from UTC of the local time.
    @return       Date, or `invalid_date` if the offset is beyond eighteen hours or the year is out of `MIN_YEAR`..`MAX_YEAR`.
    **/
    static result<date_time> from(std::chrono::local_seconds local, std::chrono::minutes offset);

    /**
    Parsing the RFC 1123 form, for example `Thu, 3 Dec 2020 00:00:00 +0100`.

    Day of week is optional, seconds are optional, the zone is either `+HHMM`/`-HHMM` or `GMT`. Names are case insensitive.

    @param text Date text.
    @return     Date, or `invalid_date` if the text does not have the expected shape or a field is out of range.
    **/
    static result<date_time> parse(std::string_view text);

    std::chrono::sys_seconds instant() const
    {
        return instant_;
    }

    std::chrono::minutes offset() const
    {
        return offset_;
    }

    /**
    Wall clock time at the date's own offset.
    **/
    std::chrono::local_seconds local_time() const
    {
        return std::chrono::local_seconds{instant_.time_since_epoch() + offset_};
    }

    /**
    Rendering in the RFC 1123 form, day of month not padded and `GMT` for the zero offset.

    @return Date text.
    **/
    std::string format() const;

    /**
    Rendering in the ISO 8601 form with the offset, for example `2020-12-03T00:00:00+01:00`, `Z` for the zero offset.

    @return Date text.
    **/
    std::string format_iso() const;

    friend bool operator==(const date_time& lhs, const date_time& rhs)
    {
        return lhs.instant_ == rhs.instant_ && lhs.offset_ == rhs.offset_;
    }

    friend std::strong_ordering operator<=>(const date_time& lhs, const date_time& rhs)
    {
        if (auto cmp = lhs.instant_.time_since_epoch().count() <=> rhs.instant_.time_since_epoch().count(); cmp != 0)
            return cmp;
        return lhs.offset_.count() <=> rhs.offset_.count();
    }

private:

    date_time(std::chrono::sys_seconds instant, std::chrono::minutes offset)
        : instant_(instant), offset_(offset)
    {
    }

    std::chrono::sys_seconds instant_;

    std::chrono::minutes offset_;
};


namespace detail
{

inline constexpr std::array<std::string_view, 7> WEEKDAY_NAMES{"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};

inline constexpr std::array<std::string_view, 12> MONTH_NAMES{"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

inline constexpr std::string_view GMT_ZONE{"GMT"};

/*
Index of the three letter name in the table, or the table size when absent.
*/
template<std::size_t N>
std::size_t find_name(const std::array<std::string_view, N>& names, std::string_view name)
{
    for (std::size_t i = 0; i < N; i++)
        if (iequals_ascii(names[i], name))
            return i;
    return N;
}

} // namespace detail


result<date_time> inline date_time::from(std::chrono::sys_seconds instant, std::chrono::minutes offset)
{
    if (std::chrono::abs(offset) > MAX_OFFSET)
        return fail<date_time>(error_code::invalid_date, "Offset of " + std::to_string(offset.count()) + " minutes is out of range.");

    const std::chrono::year local_year = std::chrono::year_month_day{std::chrono::floor<std::chrono::days>(instant + offset)}.year();
    if (local_year < MIN_YEAR || local_year > MAX_YEAR)
        return fail<date_time>(error_code::invalid_date, "Year " + std::to_string(static_cast<int>(local_year)) + " is out of range.");
    return date_time(instant, offset);
}


result<date_time> inline date_time::from(std::chrono::local_seconds local, std::chrono::minutes offset)
{
    return from(std::chrono::sys_seconds{local.time_since_epoch() - offset}, offset);
}


/*
See [rfc 1123, section 5.2.14] and [rfc 5322, section 3.3].
*/
result<date_time> inline date_time::parse(std::string_view text)
{
    using namespace std::chrono;

    const std::string original(text);
    auto reject = [&original](const std::string& what)
    {
        POSTINO_DEBUG("date rejected: " + what);
        return fail<date_time>(error_code::invalid_date, what + " in date `" + original + "`.");
    };

    std::string_view sv = detail::trim_view(text);

    auto consume_blanks = [](std::string_view& in) -> bool
    {
        std::size_t n = 0;
        while (n < in.size() && (in[n] == ' ' || in[n] == '\t'))
            ++n;
        in.remove_prefix(n);
        return n > 0;
    };

    auto consume_char = [](std::string_view& in, char expected) -> bool
    {
        if (!in.empty() && in.front() == expected)
        {
            in.remove_prefix(1);
            return true;
        }
        return false;
    };

    auto parse_int = [](std::string_view& in, std::size_t min_digits, std::size_t max_digits, int& out) -> bool
    {
        std::size_t digits = 0;
        while (digits < in.size() && digits < max_digits && detail::is_ascii_digit(in[digits]))
            ++digits;
        if (digits < min_digits)
            return false;
        auto res = std::from_chars(in.data(), in.data() + digits, out);
        if (res.ec != std::errc{})
            return false;
        in.remove_prefix(digits);
        return true;
    };

    auto take_name = [](std::string_view& in) -> std::string_view
    {
        std::size_t n = 0;
        while (n < in.size() && detail::is_ascii_alpha(in[n]))
            ++n;
        std::string_view name = in.substr(0, n);
        in.remove_prefix(n);
        return name;
    };

    // optional day of week
    std::size_t weekday_index = detail::WEEKDAY_NAMES.size();
    if (!sv.empty() && detail::is_ascii_alpha(sv.front()))
    {
        std::string_view name = take_name(sv);
        weekday_index = detail::find_name(detail::WEEKDAY_NAMES, name);
        if (weekday_index == detail::WEEKDAY_NAMES.size())
            return reject("Bad day of week `" + std::string(name) + "`");
        if (!consume_char(sv, ','))
            return reject("Missing comma after day of week");
        consume_blanks(sv);
    }

    int day_no = 0;
    if (!parse_int(sv, 1, 2, day_no) || !consume_blanks(sv))
        return reject("Bad day of month");

    std::string_view month_name = take_name(sv);
    std::size_t month_index = detail::find_name(detail::MONTH_NAMES, month_name);
    if (month_index == detail::MONTH_NAMES.size() || !consume_blanks(sv))
        return reject("Bad month `" + std::string(month_name) + "`");

    int year_no = 0;
    if (!parse_int(sv, 4, 4, year_no) || !consume_blanks(sv))
        return reject("Bad year");

    int hour_no = 0, minute_no = 0, second_no = 0;
    if (!parse_int(sv, 2, 2, hour_no) || !consume_char(sv, ':') || !parse_int(sv, 2, 2, minute_no))
        return reject("Bad time of day");
    if (consume_char(sv, ':') && !parse_int(sv, 2, 2, second_no))
        return reject("Bad seconds");
    if (!consume_blanks(sv))
        return reject("Missing zone");

    int offset_minutes = 0;
    if (detail::iequals_ascii(sv, detail::GMT_ZONE))
        sv.remove_prefix(sv.size());
    else
    {
        const char sign = sv.empty() ? '\0' : sv.front();
        if (sign != '+' && sign != '-')
            return reject("Bad zone");
        sv.remove_prefix(1);
        int zone_hours = 0, zone_minutes = 0;
        if (!parse_int(sv, 2, 2, zone_hours) || !parse_int(sv, 2, 2, zone_minutes))
            return reject("Bad zone");
        if (zone_minutes > 59)
            return reject("Zone minutes out of range");
        offset_minutes = (sign == '+' ? 1 : -1) * (zone_hours * 60 + zone_minutes);
    }
    if (!sv.empty())
        return reject("Trailing text");

    year_month_day ymd{year{year_no}, month{static_cast<unsigned>(month_index + 1)}, day{static_cast<unsigned>(day_no)}};
    if (!ymd.ok())
        return reject("Day out of range");
    if (hour_no > 23 || minute_no > 59 || second_no > 59)
        return reject("Time of day out of range");

    const local_days local_day{ymd};
    if (weekday_index != detail::WEEKDAY_NAMES.size() && weekday{local_day}.c_encoding() != weekday_index)
        return reject("Day of week does not match");

    const local_seconds local = local_day + hours{hour_no} + minutes{minute_no} + seconds{second_no};
    auto date = from(local, minutes{offset_minutes});
    if (!date)
        return reject(date.error().message());
    return date;
}


std::string inline date_time::format() const
{
    using namespace std::chrono;

    const local_seconds local = local_time();
    const local_days local_day = floor<days>(local);
    const year_month_day ymd{local_day};
    const hh_mm_ss<seconds> tod{local - local_day};

    std::string out = std::format("{}, {} {} {:04} {:02}:{:02}:{:02} ",
        detail::WEEKDAY_NAMES[weekday{local_day}.c_encoding()], static_cast<unsigned>(ymd.day()),
        detail::MONTH_NAMES[static_cast<unsigned>(ymd.month()) - 1], static_cast<int>(ymd.year()),
        tod.hours().count(), tod.minutes().count(), tod.seconds().count());

    if (offset_.count() == 0)
        out += detail::GMT_ZONE;
    else
    {
        const long total = std::labs(static_cast<long>(offset_.count()));
        std::format_to(std::back_inserter(out), "{}{:02}{:02}", offset_.count() < 0 ? '-' : '+', total / 60, total % 60);
    }
    return out;
}


std::string inline date_time::format_iso() const
{
    using namespace std::chrono;

    const local_seconds local = local_time();
    const local_days local_day = floor<days>(local);
    const year_month_day ymd{local_day};
    const hh_mm_ss<seconds> tod{local - local_day};

    std::string out = std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
        static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
        tod.hours().count(), tod.minutes().count(), tod.seconds().count());

    if (offset_.count() == 0)
        out += 'Z';
    else
    {
        const long total = std::labs(static_cast<long>(offset_.count()));
        std::format_to(std::back_inserter(out), "{}{:02}:{:02}", offset_.count() < 0 ? '-' : '+', total / 60, total % 60);
    }
    return out;
}


} // namespace postino


#ifdef _MSC_VER
#pragma warning(pop)
#endif
