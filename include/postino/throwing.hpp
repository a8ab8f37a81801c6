/*

throwing.hpp
------------

Exception bridge for callers which would rather catch than inspect
postino::result values.

*/

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <postino/config.hpp>
#include <postino/detail/result.hpp>

namespace postino
{

#if !POSTINO_THROWING_ENABLED
#error "POSTINO_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

/**
Error of a codec operation, thrown by `unwrap`.

The description is the one of `error::to_string()`, prefixed by the context when given.
**/
class exception : public std::runtime_error
{
public:
    explicit exception(postino::error err, std::string_view context = {})
        : std::runtime_error(describe(err, context)), error_(std::move(err))
    {
    }

    [[nodiscard]] const postino::error& error() const noexcept { return error_; }

    [[nodiscard]] error_code code() const noexcept { return error_.code(); }

private:
    static std::string describe(const postino::error& err, std::string_view context)
    {
        if (context.empty())
            return err.to_string();
        return std::string(context) + ": " + err.to_string();
    }

    postino::error error_;
};

/**
Taking the value out of a result.

@param r       Result to unwrap.
@param context Text prefixed to the exception description, for example the name of the field being parsed.
@return        The value.
@throw         postino::exception Result holds an error.
**/
template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r, std::string_view context = {})
{
    if (!r)
        throw exception(std::move(r.error()), context);
    return std::move(*r);
}

inline void unwrap(result_void&& r, std::string_view context = {})
{
    if (!r)
        throw exception(std::move(r.error()), context);
}

} // namespace postino
