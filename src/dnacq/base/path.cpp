#include <dnacq/base/path.h>

#include <algorithm>

namespace
{
    using namespace dnacq;

    bool is_separator(char c) noexcept { return c == '/'; }

    // Offset of the first character after the last separator.
    size_t filename_offset(const std::string& s) noexcept
    {
        const auto separator = std::find_if(s.rbegin(), s.rend(), is_separator);
        return static_cast<size_t>(s.rend() - separator);
    }
}

namespace dnacq
{
    Path::Path(const StringView sv) : m_str(sv.data(), sv.size()) { }
    Path::Path(const std::string& s) : m_str(s) { }
    Path::Path(std::string&& s) : m_str(std::move(s)) { }
    Path::Path(const char* s) : m_str(s) { }

    Path Path::operator/(StringView sv) const&
    {
        Path result = *this;
        return std::move(result) / sv;
    }

    Path Path::operator/(StringView sv) &&
    {
        *this /= sv;
        return std::move(*this);
    }

    Path Path::operator+(StringView sv) const&
    {
        Path result = *this;
        return std::move(result) + sv;
    }

    Path Path::operator+(StringView sv) &&
    {
        *this += sv;
        return std::move(*this);
    }

    Path& Path::operator/=(StringView sv)
    {
        if (m_str.empty() || Path(sv).is_absolute())
        {
            m_str.assign(sv.data(), sv.size());
        }
        else
        {
            if (!is_separator(m_str.back()))
            {
                m_str.append(DNACQ_PREFERRED_SEPARATOR);
            }

            m_str.append(sv.data(), sv.size());
        }

        return *this;
    }

    Path& Path::operator+=(StringView sv)
    {
        m_str.append(sv.data(), sv.size());
        return *this;
    }

    void Path::replace_filename(StringView sv)
    {
        // sv may point into m_str
        m_str.replace(filename_offset(m_str), std::string::npos, sv.data(), sv.size());
    }

    StringView Path::parent_path() const
    {
        auto length = filename_offset(m_str);
        // keep a lone root separator
        while (length > 1 && is_separator(m_str[length - 1]))
        {
            --length;
        }

        return StringView{m_str.data(), length};
    }

    StringView Path::filename() const { return StringView{m_str}.substr(filename_offset(m_str)); }

    StringView Path::extension() const
    {
        const auto name = filename();
        if (name == "." || name == "..")
        {
            return {};
        }

        for (size_t idx = name.size(); idx > 1; --idx)
        {
            if (name[idx - 1] == '.')
            {
                return name.substr(idx - 1);
            }
        }

        return {};
    }

    bool Path::is_absolute() const { return !m_str.empty() && is_separator(m_str[0]); }
}
