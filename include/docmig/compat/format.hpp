/**
 * @file format.hpp
 * @brief std::format when the standard library has it, fmt otherwise
 *
 * docmig passes compat::format_string through its logging helpers, so the
 * standard library must expose std::format_string (P2508, reported as
 * __cpp_lib_format 202106). libstdc++ before GCC 13 does not; fmt is used
 * there instead.
 *
 *   auto s = docmig::compat::format("job {} settled", job_id);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 202106L
    #define DOCMIG_HAS_STD_FORMAT 1
#else
    #define DOCMIG_HAS_STD_FORMAT 0
#endif

#if DOCMIG_HAS_STD_FORMAT
    #include <format>
    namespace docmig::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace docmig::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
