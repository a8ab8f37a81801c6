#pragma once

// Header-only: classes get default visibility, there is no import side. Define POSTINO_EXPORT beforehand to override.

#ifndef POSTINO_EXPORT
#  if defined(__GNUC__) && __GNUC__ >= 4
#    define POSTINO_EXPORT __attribute__((visibility("default")))
#  else
#    define POSTINO_EXPORT
#  endif
#endif
