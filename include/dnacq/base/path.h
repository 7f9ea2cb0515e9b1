#pragma once

#include <dnacq/base/fwd/files.h>

#include <dnacq/base/stringview.h>

#include <string>
#include <utility>

namespace dnacq
{
    // A filesystem path held as the native narrow string. Only lexical operations; nothing here touches the disk.
    struct Path
    {
        Path() = default;
        Path(const StringView sv);
        Path(const std::string& s);
        Path(std::string&& s);
        Path(const char* s);

        const std::string& native() const& noexcept { return m_str; }
        std::string&& native() && noexcept { return std::move(m_str); }
        operator StringView() const noexcept { return m_str; }
        const char* c_str() const noexcept { return m_str.c_str(); }
        bool empty() const noexcept { return m_str.empty(); }

        // An absolute right hand side replaces the path.
        Path operator/(StringView sv) const&;
        Path operator/(StringView sv) &&;
        Path& operator/=(StringView sv);

        // Plain concatenation, no separator.
        Path operator+(StringView sv) const&;
        Path operator+(StringView sv) &&;
        Path& operator+=(StringView sv);

        void replace_filename(StringView sv);

        StringView parent_path() const;
        StringView filename() const;
        StringView extension() const;

        bool is_absolute() const;

        std::string to_string() const { return m_str; }
        void to_string(std::string& into) const { into.append(m_str); }

    private:
        std::string m_str;
    };
}

DNACQ_FORMAT_AS(dnacq::Path, dnacq::StringView);
