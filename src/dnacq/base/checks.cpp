#include <dnacq/base/checks.h>
#include <dnacq/base/messages.h>
#include <dnacq/base/system.debug.h>

#include <stdio.h>
#include <stdlib.h>

#include <atomic>

namespace dnacq
{
    std::string LineInfo::to_string() const { return fmt::format("{}({})", file_name, line_number); }

    namespace
    {
        void print_internal_error(const LineInfo& line_info, const LocalizedString& message)
        {
            auto text = internal_error_prefix();
            text.append_raw(fmt::format("{}: ", line_info)).append(message).append_raw('\n');
            msg::write_unlocalized_text_to_stderr(Color::error, text);
        }
    }

    void Checks::final_cleanup_and_exit(const int exit_code)
    {
        // a second entry means cleanup itself tried to exit
        static std::atomic<bool> exiting{false};
        if (exiting.exchange(true))
        {
            std::abort();
        }

        on_final_cleanup_and_exit();
        ::fflush(nullptr);
        std::exit(exit_code);
    }

    void Checks::exit_with_code(const LineInfo& line_info, const int exit_code)
    {
        Debug::println("exiting with code ", exit_code, " at ", line_info.to_string());
        final_cleanup_and_exit(exit_code);
    }

    void Checks::exit_fail(const LineInfo& line_info) { exit_with_code(line_info, EXIT_FAILURE); }

    void Checks::exit_success(const LineInfo& line_info) { exit_with_code(line_info, EXIT_SUCCESS); }

    void Checks::unreachable(const LineInfo& line_info)
    {
        print_internal_error(line_info, msg::format(msgChecksUnreachableCode));
#ifndef NDEBUG
        std::abort();
#else
        final_cleanup_and_exit(EXIT_FAILURE);
#endif
    }

    void Checks::check_exit(const LineInfo& line_info, bool expression)
    {
        if (!expression)
        {
            print_internal_error(line_info, msg::format(msgChecksFailedCheck));
            exit_fail(line_info);
        }
    }

    void Checks::check_exit(const LineInfo& line_info, bool expression, StringView error_message)
    {
        if (!expression)
        {
            print_internal_error(line_info, LocalizedString::from_raw(error_message));
            exit_fail(line_info);
        }
    }

    void Checks::msg_exit_with_message(const LineInfo& line_info, const LocalizedString& error_message)
    {
        msg::write_unlocalized_text_to_stderr(Color::error, error_message);
        msg::write_unlocalized_text_to_stderr(Color::none, "\n");
        exit_fail(line_info);
    }

    void Checks::msg_exit_with_error(const LineInfo& line_info, const LocalizedString& message)
    {
        msg::println_error(message);
        exit_fail(line_info);
    }
}
