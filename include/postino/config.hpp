/*

config.hpp
----------

Global build configuration for postino.

Define POSTINO_NO_EXCEPTIONS to disable the exception-based wrappers.
Define POSTINO_USE_STD_REGEX to use std::regex instead of Boost.Regex.

*/

#pragma once

#if defined(POSTINO_NO_EXCEPTIONS)
#define POSTINO_THROWING_ENABLED 0
#else
#define POSTINO_THROWING_ENABLED 1
#endif

#if !defined(POSTINO_USE_STD_REGEX)
#define POSTINO_USE_STD_REGEX 0
#endif
