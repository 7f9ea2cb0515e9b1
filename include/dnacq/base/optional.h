#pragma once

#include <dnacq/base/fwd/optional.h>

#include <dnacq/base/checks.h>
#include <dnacq/base/lineinfo.h>

#include <new>
#include <type_traits>
#include <utility>

namespace dnacq
{
    struct NullOpt
    {
        explicit constexpr NullOpt(int) { }
    };

    const static constexpr NullOpt nullopt{0};

    // Owning optional value. Unlike std::optional, there is no operator* or value(); callers go through get(),
    // value_or(), or value_or_exit() so that every access names what happens when the value is absent.
    template<class T>
    struct Optional
    {
        static_assert(!std::is_reference_v<T>, "Optional does not hold references");

        constexpr Optional() noexcept : m_is_present(false), m_inactive() { }

        // Constructors are intentionally implicit
        constexpr Optional(NullOpt) noexcept : m_is_present(false), m_inactive() { }

        template<class U,
                 std::enable_if_t<!std::is_same_v<std::decay_t<U>, Optional> &&
                                      !std::is_same_v<std::decay_t<U>, NullOpt> && std::is_constructible_v<T, U>,
                                  int> = 0>
        constexpr Optional(U&& t) noexcept(std::is_nothrow_constructible_v<T, U>)
            : m_is_present(true), m_t(std::forward<U>(t))
        {
        }

        Optional(const Optional& other) : m_is_present(false), m_inactive()
        {
            if (other.m_is_present)
            {
                emplace(other.m_t);
            }
        }

        Optional(Optional&& other) noexcept(std::is_nothrow_move_constructible_v<T>) : m_is_present(false), m_inactive()
        {
            if (other.m_is_present)
            {
                emplace(std::move(other.m_t));
            }
        }

        Optional& operator=(const Optional& other)
        {
            if (this != &other)
            {
                assign_from(other.m_is_present, other.m_t);
            }

            return *this;
        }

        Optional& operator=(Optional&& other) noexcept // enforces termination
        {
            if (this != &other)
            {
                assign_from(other.m_is_present, std::move(other.m_t));
            }

            return *this;
        }

        ~Optional() { clear(); }

        constexpr bool has_value() const noexcept { return m_is_present; }
        constexpr explicit operator bool() const noexcept { return m_is_present; }

        const T* get() const& noexcept { return m_is_present ? &m_t : nullptr; }
        T* get() & noexcept { return m_is_present ? &m_t : nullptr; }
        const T* get() const&& = delete;
        T* get() && = delete;

        template<class... Args>
        T& emplace(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args...>)
        {
            clear();
            ::new (&m_t) T(std::forward<Args>(args)...);
            m_is_present = true;
            return m_t;
        }

        void clear() noexcept
        {
            if (m_is_present)
            {
                m_is_present = false;
                m_t.~T();
            }
        }

        T&& value_or_exit(const LineInfo& line_info) && noexcept
        {
            Checks::check_exit(line_info, m_is_present, "Value was null");
            return std::move(m_t);
        }

        T& value_or_exit(const LineInfo& line_info) & noexcept
        {
            Checks::check_exit(line_info, m_is_present, "Value was null");
            return m_t;
        }

        const T& value_or_exit(const LineInfo& line_info) const& noexcept
        {
            Checks::check_exit(line_info, m_is_present, "Value was null");
            return m_t;
        }

        template<class U>
        T value_or(U&& default_value) const&
        {
            return m_is_present ? m_t : static_cast<T>(std::forward<U>(default_value));
        }

        template<class U>
        T value_or(U&& default_value) &&
        {
            return m_is_present ? std::move(m_t) : static_cast<T>(std::forward<U>(default_value));
        }

        template<class F>
        using map_t = decltype(std::declval<F&>()(std::declval<const T&>()));

        template<class F>
        Optional<map_t<F>> map(F f) const&
        {
            if (m_is_present)
            {
                return f(m_t);
            }
            return nullopt;
        }

        friend bool operator==(const Optional& lhs, const Optional& rhs)
        {
            if (lhs.m_is_present && rhs.m_is_present)
            {
                return lhs.m_t == rhs.m_t;
            }

            return lhs.m_is_present == rhs.m_is_present;
        }
        friend bool operator!=(const Optional& lhs, const Optional& rhs) { return !(lhs == rhs); }

    private:
        template<class Fwd>
        void assign_from(bool other_is_present, Fwd&& other_value)
        {
            if (!other_is_present)
            {
                clear();
            }
            else if (m_is_present)
            {
                m_t = std::forward<Fwd>(other_value);
            }
            else
            {
                emplace(std::forward<Fwd>(other_value));
            }
        }

        bool m_is_present;
        union
        {
            char m_inactive;
            T m_t;
        };
    };

    template<class T, class U>
    auto operator==(const Optional<T>& lhs, const U& rhs) -> decltype(*lhs.get() == rhs)
    {
        return lhs.has_value() && *lhs.get() == rhs;
    }
    template<class T, class U>
    auto operator!=(const Optional<T>& lhs, const U& rhs) -> decltype(*lhs.get() != rhs)
    {
        return !lhs.has_value() || *lhs.get() != rhs;
    }
}
