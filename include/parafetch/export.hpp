#ifndef PARAFETCH_EXPORT_HPP
#define PARAFETCH_EXPORT_HPP

// clang-format off
#ifdef PARAFETCH_STATIC
// As a static library: no symbol import/export.
#  define PARAFETCH_API
#else
// As a shared library: export symbols on build, import symbols on use.
#  ifdef PARAFETCH_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define PARAFETCH_API __declspec(dllexport)
#    else
#         define PARAFETCH_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define PARAFETCH_API __declspec(dllimport)
#    else
#         define PARAFETCH_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif
// clang-format on

#endif
