#ifndef PODLOADER_EXPORT_HPP
#define PODLOADER_EXPORT_HPP

#ifdef PODLOADER_STATIC
// As a static library: no symbol import/export.
#  define PODLOADER_API
#else
 // As a shared library: export symbols on build, import symbols on use.
#  ifdef PODLOADER_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define PODLOADER_API __declspec(dllexport)
#    else
#         define PODLOADER_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define PODLOADER_API __declspec(dllimport)
#    else
#         define PODLOADER_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif

#endif
