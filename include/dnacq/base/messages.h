#pragma once

#include <dnacq/base/fwd/messages.h>

#include <dnacq/base/fmt.h>
#include <dnacq/base/stringview.h>

#include <string>
#include <type_traits>
#include <utility>

// Every user visible string is a catalog entry declared in message-data.inc.h. A message's placeholders are part of
// its type, so msg::format(msgFoo, msg::path = p) only compiles when msgFoo takes exactly {path}.
#define DNACQ_DECL_MSG_TEMPLATE class... MessageTags, class... MessageTypes
#define DNACQ_DECL_MSG_ARGS                                                                                            \
    ::dnacq::msg::MessageT<MessageTags...> _message_token,                                                             \
        ::dnacq::msg::TagArg<::dnacq::msg::detail::NonDeducedT<MessageTags>, MessageTypes>... _message_args
#define DNACQ_EXPAND_MSG_ARGS _message_token, _message_args...

namespace dnacq::msg
{
    template<class... Tags>
    struct MessageT
    {
        const size_t index;
    };

    template<class Tag, class Type>
    struct TagArg
    {
        std::conditional_t<std::is_same<Type, StringView>::value, StringView, const Type&> value;

        auto arg() const { return fmt::arg(Tag::name.c_str(), value); }
    };

    // Arguments convertible to StringView are captured as views so literals and std::strings format the same way.
    template<class Type>
    using StringViewable = std::conditional_t<std::is_constructible<StringView, Type>::value, StringView, Type>;

    namespace detail
    {
        template<class T>
        struct NonDeduced
        {
            using type = T;
        };

        template<class T>
        using NonDeducedT = typename NonDeduced<T>::type;

        template<class... Tags>
        MessageT<Tags...> make_message_base(Tags...);

        void format_message_to(LocalizedString& into, size_t index, fmt::format_args args);

        template<class... NamedArgs>
        void format_named_to(LocalizedString& into, size_t index, const NamedArgs&... named)
        {
            format_message_to(into, index, fmt::make_format_args(named...));
        }
    }

    template<DNACQ_DECL_MSG_TEMPLATE>
    void format_to(LocalizedString& into, DNACQ_DECL_MSG_ARGS)
    {
        detail::format_named_to(into, _message_token.index, _message_args.arg()...);
    }
}

namespace dnacq
{
    // Text for the user. It is either produced from the catalog by msg::format or wraps text that never was a catalog
    // entry (installer output, operating system error strings) through from_raw.
    struct LocalizedString
    {
        LocalizedString() = default;

        template<class Str, std::enable_if_t<std::is_same<Str, std::string>::value, int> = 0>
        static LocalizedString from_raw(Str&& s) noexcept
        {
            LocalizedString result;
            result.m_data = std::move(s);
            return result;
        }
        static LocalizedString from_raw(StringView s);

        operator StringView() const noexcept { return m_data; }
        const std::string& data() const noexcept { return m_data; }
        const std::string& to_string() const noexcept { return m_data; }
        std::string extract_data() { return std::exchange(m_data, std::string{}); }
        bool empty() const noexcept { return m_data.empty(); }
        void clear() noexcept { m_data.clear(); }

        LocalizedString& append_raw(char c) &;
        LocalizedString& append_raw(StringView s) &;
        LocalizedString& append(const LocalizedString& s) &;
        // two spaces per level
        LocalizedString& append_indent(size_t indent = 1) &;
        template<DNACQ_DECL_MSG_TEMPLATE>
        LocalizedString& append(DNACQ_DECL_MSG_ARGS) &
        {
            msg::format_to(*this, DNACQ_EXPAND_MSG_ARGS);
            return *this;
        }

        LocalizedString&& append_raw(char c) && { return std::move(append_raw(c)); }
        LocalizedString&& append_raw(StringView s) && { return std::move(append_raw(s)); }
        LocalizedString&& append(const LocalizedString& s) && { return std::move(append(s)); }
        LocalizedString&& append_indent(size_t indent = 1) && { return std::move(append_indent(indent)); }
        template<DNACQ_DECL_MSG_TEMPLATE>
        LocalizedString&& append(DNACQ_DECL_MSG_ARGS) &&
        {
            return std::move(append(DNACQ_EXPAND_MSG_ARGS));
        }

        friend bool operator==(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
        {
            return lhs.m_data == rhs.m_data;
        }
        friend bool operator!=(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
        {
            return lhs.m_data != rhs.m_data;
        }

    private:
        std::string m_data;
    };

    // $NAME, or %NAME% on Windows
    LocalizedString format_environment_variable(StringView variable_name);

    inline constexpr StringLiteral ErrorPrefix = "error: ";
    inline constexpr StringLiteral InternalErrorPrefix = "internal error: ";
    inline constexpr StringLiteral WarningPrefix = "warning: ";
    LocalizedString internal_error_prefix();
}

DNACQ_FORMAT_AS(dnacq::LocalizedString, dnacq::StringView);

namespace dnacq::msg
{
    template<DNACQ_DECL_MSG_TEMPLATE>
    LocalizedString format(DNACQ_DECL_MSG_ARGS)
    {
        LocalizedString result;
        format_to(result, DNACQ_EXPAND_MSG_ARGS);
        return result;
    }

    // Writes to standard output.
    void println(const LocalizedString& s);

    // The remaining functions write to standard error, with the prefix colored when it is a terminal.
    [[nodiscard]] LocalizedString format_error(const LocalizedString& s);
    template<DNACQ_DECL_MSG_TEMPLATE>
    [[nodiscard]] LocalizedString format_error(DNACQ_DECL_MSG_ARGS)
    {
        return format_error(msg::format(DNACQ_EXPAND_MSG_ARGS));
    }
    void println_error(const LocalizedString& s);
    template<DNACQ_DECL_MSG_TEMPLATE>
    void println_error(DNACQ_DECL_MSG_ARGS)
    {
        println_error(msg::format(DNACQ_EXPAND_MSG_ARGS));
    }

    [[nodiscard]] LocalizedString format_warning(const LocalizedString& s);
    void println_warning(const LocalizedString& s);
    template<DNACQ_DECL_MSG_TEMPLATE>
    void println_warning(DNACQ_DECL_MSG_ARGS)
    {
        println_warning(msg::format(DNACQ_EXPAND_MSG_ARGS));
    }

#define DECLARE_MSG_ARG(NAME, EXAMPLE)                                                                                 \
    static constexpr struct NAME##_t                                                                                   \
    {                                                                                                                  \
        static constexpr StringLiteral name = #NAME;                                                                   \
        template<class T>                                                                                              \
        TagArg<NAME##_t, StringViewable<T>> operator=(const T& t) const noexcept                                       \
        {                                                                                                              \
            return TagArg<NAME##_t, StringViewable<T>>{t};                                                             \
        }                                                                                                              \
    } NAME = {};

#include <dnacq/base/message-args.inc.h>

#undef DECLARE_MSG_ARG
}

namespace dnacq
{
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...)                                                                      \
    extern const decltype(::dnacq::msg::detail::make_message_base ARGS) msg##NAME;

#include <dnacq/base/message-data.inc.h>
#undef DECLARE_MESSAGE
}
