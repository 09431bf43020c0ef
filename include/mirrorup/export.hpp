#ifndef MIRRORUP_EXPORT_HPP
#define MIRRORUP_EXPORT_HPP

// clang-format off
#ifdef MIRRORUP_STATIC
// As a static library: no symbol import/export.
#  define MIRRORUP_API
#else
// As a shared library: export symbols on build, import symbols on use.
#  ifdef MIRRORUP_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define MIRRORUP_API __declspec(dllexport)
#    else
#         define MIRRORUP_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define MIRRORUP_API __declspec(dllimport)
#    else
#         define MIRRORUP_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif
// clang-format on

#endif
