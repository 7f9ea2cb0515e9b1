#pragma once

#include <dnacq/base/fwd/stringview.h>

#include <dnacq/base/fmt.h>

#include <stddef.h>
#include <string.h>

#include <iterator>
#include <limits>
#include <string>

namespace dnacq
{
    // Non-owning, not necessarily null terminated view of characters.
    struct StringView
    {
        constexpr StringView() = default;
        StringView(const std::string& s) noexcept : m_ptr(s.data()), m_size(s.size()) { }
        StringView(const char* ptr) noexcept : m_ptr(ptr), m_size(::strlen(ptr)) { }
        constexpr StringView(const char* ptr, size_t size) noexcept : m_ptr(ptr), m_size(size) { }
        constexpr StringView(const char* first, const char* last) noexcept
            : m_ptr(first), m_size(static_cast<size_t>(last - first))
        {
        }

        constexpr const char* data() const noexcept { return m_ptr; }
        constexpr size_t size() const noexcept { return m_size; }
        constexpr bool empty() const noexcept { return m_size == 0; }
        constexpr char operator[](size_t pos) const noexcept { return m_ptr[pos]; }

        constexpr const char* begin() const noexcept { return m_ptr; }
        constexpr const char* end() const noexcept { return m_ptr + m_size; }
        std::reverse_iterator<const char*> rbegin() const noexcept { return std::reverse_iterator<const char*>(end()); }
        std::reverse_iterator<const char*> rend() const noexcept { return std::reverse_iterator<const char*>(begin()); }

        bool starts_with(StringView prefix) const noexcept;
        bool contains(StringView needle) const noexcept;
        bool contains(char needle) const noexcept;

        // Clamped like std::string_view::substr, but never throws.
        constexpr StringView substr(size_t pos, size_t count = std::numeric_limits<size_t>::max()) const noexcept
        {
            if (pos > m_size)
            {
                return StringView();
            }

            const size_t available = m_size - pos;
            return StringView(m_ptr + pos, count < available ? count : available);
        }

        std::string to_string() const { return std::string(m_ptr, m_size); }
        void to_string(std::string& out) const { out.append(m_ptr, m_size); }
        explicit operator std::string() const { return to_string(); }

    private:
        const char* m_ptr = nullptr;
        size_t m_size = 0;
    };

    // Free functions rather than hidden friends so that types converting to StringView, like Path, compare too.
    bool operator==(StringView lhs, StringView rhs) noexcept;
    bool operator!=(StringView lhs, StringView rhs) noexcept;
    bool operator<(StringView lhs, StringView rhs) noexcept;

    // A view whose data() is followed by a '\0', suitable for C APIs.
    struct ZStringView : StringView
    {
        constexpr ZStringView() : StringView("", size_t{}) { }
        ZStringView(const std::string& s) : StringView(s) { }
        ZStringView(const char* ptr) noexcept : StringView(ptr) { }
        constexpr ZStringView(const char* ptr, size_t size) noexcept : StringView(ptr, size) { }

        constexpr const char* c_str() const noexcept { return data(); }

        // a prefix of a null terminated string is not null terminated
        void substr(size_t pos, size_t count) const = delete;
    };

    // A ZStringView of a string literal, usable in constant expressions.
    struct StringLiteral : ZStringView
    {
        template<int N>
        constexpr StringLiteral(const char (&str)[N]) : ZStringView(str, N - 1)
        {
        }
    };
}

template<class Char>
struct fmt::formatter<dnacq::StringView, Char, void> : fmt::formatter<fmt::basic_string_view<char>, Char, void>
{
    template<class FormatContext>
    auto format(dnacq::StringView sv, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return fmt::formatter<fmt::basic_string_view<char>, Char, void>::format({sv.data(), sv.size()}, ctx);
    }
};

DNACQ_FORMAT_AS(dnacq::ZStringView, dnacq::StringView);
DNACQ_FORMAT_AS(dnacq::StringLiteral, dnacq::StringView);
