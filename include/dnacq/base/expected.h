#pragma once

#include <dnacq/base/fwd/expected.h>

#include <dnacq/base/checks.h>
#include <dnacq/base/lineinfo.h>
#include <dnacq/base/messages.h>

#include <new>
#include <type_traits>
#include <utility>

namespace dnacq
{
    // The value of an ExpectedT<Unit, E> that only reports success or failure.
    struct Unit
    {
    };

    struct ExpectedLeftTag
    {
    };
    struct ExpectedRightTag
    {
    };
    inline constexpr ExpectedLeftTag expected_left_tag;
    inline constexpr ExpectedRightTag expected_right_tag;

    // Holds either a T or an Error. Both single argument constructors are implicit so functions can return either one
    // directly; when T and Error are the same type only the tagged constructors are usable.
    template<class T, class Error>
    struct ExpectedT
    {
        static_assert(!std::is_reference_v<T>, "ExpectedT does not hold references");

        template<class U,
                 std::enable_if_t<std::is_convertible_v<U, T> && !std::is_same_v<std::decay_t<U>, Error>, int> = 0>
        ExpectedT(U&& value) : ExpectedT(std::forward<U>(value), expected_left_tag)
        {
        }

        template<class U,
                 std::enable_if_t<std::is_convertible_v<U, Error> && !std::is_same_v<std::decay_t<U>, T>, int> = 0,
                 int = 1>
        ExpectedT(U&& error) : ExpectedT(std::forward<U>(error), expected_right_tag)
        {
        }

        template<class U>
        ExpectedT(U&& value, ExpectedLeftTag) : m_t(std::forward<U>(value)), m_has_value(true)
        {
        }

        template<class U>
        ExpectedT(U&& error, ExpectedRightTag) : m_error(std::forward<U>(error)), m_has_value(false)
        {
        }

        ExpectedT(const ExpectedT& other) : m_has_value(other.m_has_value) { construct_from(other); }

        ExpectedT(ExpectedT&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                              std::is_nothrow_move_constructible_v<Error>)
            : m_has_value(other.m_has_value)
        {
            construct_from(std::move(other));
        }

        // no copy assignment: a throwing copy would leave neither member alive
        ExpectedT& operator=(const ExpectedT&) = delete;

        ExpectedT& operator=(ExpectedT&& other) noexcept
        {
            if (this != &other)
            {
                destroy();
                m_has_value = other.m_has_value;
                construct_from(std::move(other));
            }

            return *this;
        }

        ~ExpectedT() { destroy(); }

        explicit constexpr operator bool() const noexcept { return m_has_value; }
        constexpr bool has_value() const noexcept { return m_has_value; }

        const T* get() const noexcept { return m_has_value ? &m_t : nullptr; }
        T* get() noexcept { return m_has_value ? &m_t : nullptr; }

        // Prints the error and exits the process if there is no value.
        T& value_or_exit(const LineInfo& line_info) &
        {
            exit_if_error(line_info);
            return m_t;
        }

        const T& value_or_exit(const LineInfo& line_info) const&
        {
            exit_if_error(line_info);
            return m_t;
        }

        T&& value_or_exit(const LineInfo& line_info) &&
        {
            exit_if_error(line_info);
            return std::move(m_t);
        }

        Error& error() & noexcept
        {
            check_holds_error();
            return m_error;
        }

        const Error& error() const& noexcept
        {
            check_holds_error();
            return m_error;
        }

        Error&& error() && noexcept
        {
            check_holds_error();
            return std::move(m_error);
        }

        // ExpectedT<decltype(f(value)), Error>; the error is carried over unchanged.
        template<class F>
        auto map(F f) const& -> ExpectedT<decltype(f(std::declval<const T&>())), Error>
        {
            if (m_has_value)
            {
                return {f(m_t), expected_left_tag};
            }

            return {m_error, expected_right_tag};
        }

        template<class F>
        auto map(F f) && -> ExpectedT<decltype(f(std::declval<T>())), Error>
        {
            if (m_has_value)
            {
                return {f(std::move(m_t)), expected_left_tag};
            }

            return {std::move(m_error), expected_right_tag};
        }

    private:
        template<class Other>
        void construct_from(Other&& other)
        {
            if (m_has_value)
            {
                ::new (&m_t) T(std::forward<Other>(other).m_t);
            }
            else
            {
                ::new (&m_error) Error(std::forward<Other>(other).m_error);
            }
        }

        void destroy() noexcept
        {
            if (m_has_value)
            {
                m_t.~T();
            }
            else
            {
                m_error.~Error();
            }
        }

        void exit_if_error(const LineInfo& line_info) const
        {
            if (!m_has_value)
            {
                Checks::msg_exit_with_message(line_info, m_error);
            }
        }

        void check_holds_error() const noexcept
        {
            if (m_has_value)
            {
                Checks::unreachable(DNACQ_LINE_INFO);
            }
        }

        union
        {
            T m_t;
            Error m_error;
        };

        bool m_has_value;
    };
}
