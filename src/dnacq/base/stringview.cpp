#include <dnacq/base/strings.h>
#include <dnacq/base/stringview.h>

#include <string.h>

#include <algorithm>

namespace dnacq
{
    bool StringView::starts_with(StringView prefix) const noexcept
    {
        return prefix.size() <= m_size && std::equal(prefix.begin(), prefix.end(), m_ptr);
    }

    bool StringView::contains(StringView needle) const noexcept { return Strings::search(*this, needle) != end(); }

    bool StringView::contains(char needle) const noexcept { return std::find(begin(), end(), needle) != end(); }

    bool operator==(StringView lhs, StringView rhs) noexcept
    {
        // memcmp may not be handed a null pointer, even for zero bytes
        return lhs.size() == rhs.size() && (lhs.empty() || ::memcmp(lhs.data(), rhs.data(), lhs.size()) == 0);
    }

    bool operator!=(StringView lhs, StringView rhs) noexcept { return !(lhs == rhs); }

    bool operator<(StringView lhs, StringView rhs) noexcept
    {
        return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
    }
}
