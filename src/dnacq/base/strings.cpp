#include <dnacq/base/strings.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

namespace dnacq::Strings::details
{
    void append_internal(std::string& into, char c) { into.push_back(c); }
    void append_internal(std::string& into, const char* v) { into.append(v); }
    void append_internal(std::string& into, const std::string& s) { into.append(s); }
    void append_internal(std::string& into, StringView s) { into.append(s.data(), s.size()); }
}

namespace
{
    char ascii_lower(char c) noexcept { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }

    bool is_whitespace(char c) noexcept { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

    const char* trimmed_end(dnacq::StringView sv)
    {
        return std::find_if_not(sv.rbegin(), sv.rend(), is_whitespace).base();
    }
}

namespace dnacq::Strings
{
    bool case_insensitive_ascii_equals(StringView left, StringView right) noexcept
    {
        return left.size() == right.size() &&
               std::equal(left.begin(), left.end(), right.begin(), [](char l, char r) {
                   return ascii_lower(l) == ascii_lower(r);
               });
    }

    std::string ascii_to_lowercase(StringView s)
    {
        std::string result(s.data(), s.size());
        for (char& c : result)
        {
            c = ascii_lower(c);
        }

        return result;
    }

    StringView trim(StringView sv)
    {
        const char* last = trimmed_end(sv);
        return StringView(std::find_if_not(sv.begin(), last, is_whitespace), last);
    }

    StringView trim_end(StringView sv) { return StringView(sv.begin(), trimmed_end(sv)); }

    std::vector<std::string> split(StringView s, const char delimiter)
    {
        std::vector<std::string> tokens;
        const char* token_start = s.begin();
        for (const char* it = s.begin();; ++it)
        {
            if (it == s.end() || *it == delimiter)
            {
                if (it != token_start)
                {
                    tokens.emplace_back(token_start, it);
                }

                if (it == s.end())
                {
                    return tokens;
                }

                token_start = it + 1;
            }
        }
    }

    std::vector<std::string> split_lines(StringView s)
    {
        std::vector<std::string> lines;
        const char* first = s.begin();
        while (first != s.end())
        {
            const char* newline = std::find(first, s.end(), '\n');
            const char* line_end = newline;
            if (line_end != first && line_end[-1] == '\r')
            {
                --line_end;
            }

            lines.emplace_back(first, line_end);
            if (newline == s.end())
            {
                break;
            }

            first = newline + 1;
        }

        return lines;
    }

    const char* find_first_of(StringView s, StringView candidates)
    {
        return std::find_first_of(s.begin(), s.end(), candidates.begin(), candidates.end());
    }

    const char* search(StringView haystack, StringView needle)
    {
        return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end());
    }
}
