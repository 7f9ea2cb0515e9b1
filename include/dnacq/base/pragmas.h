#pragma once

#define Z_DNACQ_PRAGMA(PRAGMA) _Pragma(#PRAGMA)

// clang-cl defines _MSC_VER but does not understand MSVC warning numbers
#if defined(_MSC_VER) && !defined(__clang__)
#define DNACQ_MSVC_WARNING(...) Z_DNACQ_PRAGMA(warning(__VA_ARGS__))
#else
#define DNACQ_MSVC_WARNING(...)
#endif
