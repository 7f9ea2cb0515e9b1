#pragma once

#include <dnacq/base/fmt.h>
#include <dnacq/base/stringview.h>

#include <iterator>
#include <string>
#include <type_traits>
#include <vector>

namespace dnacq::Strings::details
{
    void append_internal(std::string& into, char c);
    void append_internal(std::string& into, const char* v);
    void append_internal(std::string& into, const std::string& s);
    void append_internal(std::string& into, StringView s);

    // anything with a to_string(std::string&) member, such as Path or ElapsedTimer
    template<class T, class = decltype(std::declval<const T&>().to_string(std::declval<std::string&>()))>
    void append_internal(std::string& into, const T& t)
    {
        t.to_string(into);
    }

    template<class T, class = void, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, char>, int> = 0>
    void append_internal(std::string& into, const T& t)
    {
        fmt::format_to(std::back_inserter(into), "{}", t);
    }
}

namespace dnacq::Strings
{
    template<class... Args>
    std::string& append(std::string& into, const Args&... args)
    {
        (details::append_internal(into, args), ...);
        return into;
    }

    template<class... Args>
    [[nodiscard]] std::string concat(const Args&... args)
    {
        std::string result;
        Strings::append(result, args...);
        return result;
    }

    // Appends transformer(element) for each element of elements, separated by delimiter.
    template<class Container, class Transformer>
    [[nodiscard]] std::string join(StringLiteral delimiter, const Container& elements, Transformer transformer)
    {
        std::string result;
        bool first = true;
        for (const auto& element : elements)
        {
            if (!first)
            {
                result.append(delimiter.data(), delimiter.size());
            }

            first = false;
            Strings::append(result, transformer(element));
        }

        return result;
    }

    template<class Container>
    [[nodiscard]] std::string join(StringLiteral delimiter, const Container& elements)
    {
        return join(delimiter, elements, [](const auto& element) -> const auto& { return element; });
    }

    bool case_insensitive_ascii_equals(StringView left, StringView right) noexcept;

    [[nodiscard]] std::string ascii_to_lowercase(StringView s);

    // Whitespace is ' ', '\t', '\r' and '\n'.
    [[nodiscard]] StringView trim(StringView sv);
    [[nodiscard]] StringView trim_end(StringView sv);

    // Splits on delimiter, dropping empty tokens: "|a||b|" -> ["a", "b"]
    [[nodiscard]] std::vector<std::string> split(StringView s, const char delimiter);

    // Splits on '\n' after normalizing "\r\n", keeping empty lines in the middle but not a trailing empty line.
    [[nodiscard]] std::vector<std::string> split_lines(StringView s);

    // Both return s.end() when nothing is found.
    const char* find_first_of(StringView s, StringView candidates);
    const char* search(StringView haystack, StringView needle);
}
