#pragma once

// fmt::formatter specializations for dnacq types. Expanding these requires <fmt/format.h>, which
// <dnacq/base/fmt.h> provides.

// Formats a Type by handing the trailing expression, written in terms of `val`, to the formatter of Base.
#define Z_DNACQ_FORMAT_VIA(Type, Base, ...)                                                                            \
    template<typename Char>                                                                                            \
    struct fmt::formatter<Type, Char, void> : fmt::formatter<Base, Char, void>                                         \
    {                                                                                                                  \
        template<typename FormatContext>                                                                               \
        auto format(const Type& val, FormatContext& ctx) const -> decltype(ctx.out())                                  \
        {                                                                                                              \
            return fmt::formatter<Base, Char, void>::format(__VA_ARGS__, ctx);                                         \
        }                                                                                                              \
    }

#define DNACQ_FORMAT_AS(Type, Base) Z_DNACQ_FORMAT_VIA(Type, Base, static_cast<Base>(val))
#define DNACQ_FORMAT_WITH_TO_STRING(Type) Z_DNACQ_FORMAT_VIA(Type, std::string, val.to_string())
// Type is an enumeration with a to_string_literal(Type) overload found by argument dependent lookup.
#define DNACQ_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(Type)                                                            \
    Z_DNACQ_FORMAT_VIA(Type, ::dnacq::StringLiteral, to_string_literal(val))
