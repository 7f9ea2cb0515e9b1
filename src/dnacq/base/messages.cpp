#include <dnacq/base/checks.h>
#include <dnacq/base/messages.h>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <iterator>

namespace dnacq
{
    LocalizedString LocalizedString::from_raw(StringView s) { return from_raw(s.to_string()); }

    LocalizedString& LocalizedString::append_raw(char c) &
    {
        m_data.push_back(c);
        return *this;
    }

    LocalizedString& LocalizedString::append_raw(StringView s) &
    {
        m_data.append(s.data(), s.size());
        return *this;
    }

    LocalizedString& LocalizedString::append(const LocalizedString& s) &
    {
        m_data += s.m_data;
        return *this;
    }

    LocalizedString& LocalizedString::append_indent(size_t indent) &
    {
        m_data.append(2 * indent, ' ');
        return *this;
    }

    LocalizedString format_environment_variable(StringView variable_name)
    {
        return LocalizedString::from_raw(fmt::format("${}", variable_name));
    }

    LocalizedString internal_error_prefix() { return LocalizedString::from_raw(InternalErrorPrefix); }

    namespace
    {
        struct CatalogEntry
        {
            StringLiteral name;
            StringLiteral text;
        };

        constexpr CatalogEntry catalog[] = {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) {#NAME, __VA_ARGS__},
#include <dnacq/base/message-data.inc.h>
#undef DECLARE_MESSAGE
        };

        enum class CatalogIndex : size_t
        {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) NAME,
#include <dnacq/base/message-data.inc.h>
#undef DECLARE_MESSAGE
        };
    }

#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...)                                                                      \
    const decltype(::dnacq::msg::detail::make_message_base ARGS) msg##NAME{static_cast<size_t>(CatalogIndex::NAME)};
#include <dnacq/base/message-data.inc.h>
#undef DECLARE_MESSAGE
}

namespace dnacq::msg::detail
{
    void format_message_to(LocalizedString& into, size_t index, fmt::format_args args)
    {
        if (index >= std::size(catalog))
        {
            Checks::unreachable(DNACQ_LINE_INFO);
        }

        const auto& entry = catalog[index];
        std::string formatted;
        try
        {
            formatted = fmt::vformat(fmt::string_view{entry.text.data(), entry.text.size()}, args);
        }
        catch (const fmt::format_error& e)
        {
            // a catalog entry that does not match its declared arguments is a programming error
            write_unlocalized_text_to_stderr(
                Color::error,
                fmt::format("{}message {} could not be formatted ({}): {}\n", InternalErrorPrefix, entry.name, e.what(),
                            entry.text));
            Checks::exit_fail(DNACQ_LINE_INFO);
        }

        into.append_raw(formatted);
    }
}

namespace dnacq::msg
{
    namespace
    {
        void write_fully(int fd, const char* data, size_t size)
        {
            while (size != 0)
            {
                const auto written = ::write(fd, data, size);
                if (written < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }

                    // nowhere left to report this
                    ::fprintf(stderr, "[DEBUG] write to fd %d failed with errno %d\n", fd, errno);
                    std::abort();
                }

                data += written;
                size -= static_cast<size_t>(written);
            }
        }

        void write_colored(int fd, bool is_terminal, Color c, StringView sv)
        {
            if (sv.empty())
            {
                return;
            }

            const bool colored = is_terminal && c != Color::none;
            if (colored)
            {
                const char set_color[] = {'\033', '[', '9', static_cast<char>(c), 'm'};
                write_fully(fd, set_color, sizeof(set_color));
            }

            write_fully(fd, sv.data(), sv.size());

            if (colored)
            {
                static constexpr char reset_color[] = {'\033', '[', '0', 'm'};
                write_fully(fd, reset_color, sizeof(reset_color));
            }
        }

        void println_prefixed(Color c, StringView label, const LocalizedString& s)
        {
            write_unlocalized_text_to_stderr(c, label);
            write_unlocalized_text_to_stderr(Color::none, ": ");
            write_unlocalized_text_to_stderr(Color::none, s);
            write_unlocalized_text_to_stderr(Color::none, "\n");
        }
    }

    void write_unlocalized_text_to_stdout(Color c, StringView sv)
    {
        static const bool stdout_is_terminal = ::isatty(STDOUT_FILENO) != 0;
        write_colored(STDOUT_FILENO, stdout_is_terminal, c, sv);
    }

    void write_unlocalized_text_to_stderr(Color c, StringView sv)
    {
        static const bool stderr_is_terminal = ::isatty(STDERR_FILENO) != 0;
        write_colored(STDERR_FILENO, stderr_is_terminal, c, sv);
    }

    void println(const LocalizedString& s)
    {
        write_unlocalized_text_to_stdout(Color::none, s);
        write_unlocalized_text_to_stdout(Color::none, "\n");
    }

    LocalizedString format_error(const LocalizedString& s) { return LocalizedString::from_raw(ErrorPrefix).append(s); }
    void println_error(const LocalizedString& s) { println_prefixed(Color::error, "error", s); }

    LocalizedString format_warning(const LocalizedString& s)
    {
        return LocalizedString::from_raw(WarningPrefix).append(s);
    }
    void println_warning(const LocalizedString& s) { println_prefixed(Color::warning, "warning", s); }
}
