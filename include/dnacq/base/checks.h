#pragma once

#include <dnacq/base/lineinfo.h>
#include <dnacq/base/messages.h>
#include <dnacq/base/stringview.h>

// Process termination. Everything that ends the process goes through final_cleanup_and_exit so that observers get a
// chance to flush.
namespace dnacq::Checks
{
    // Link seam: the dnacq executable and the test runner each define it.
    void on_final_cleanup_and_exit();

    [[noreturn]] void final_cleanup_and_exit(const int exit_code);

    [[noreturn]] void exit_with_code(const LineInfo& line_info, const int exit_code);
    [[noreturn]] void exit_fail(const LineInfo& line_info);
    [[noreturn]] void exit_success(const LineInfo& line_info);

    // A broken internal invariant. Aborts in debug builds.
    [[noreturn]] void unreachable(const LineInfo& line_info);

    // Exits with EXIT_FAILURE after printing an "internal error" naming line_info.
    void check_exit(const LineInfo& line_info, bool expression);
    void check_exit(const LineInfo& line_info, bool expression, StringView error_message);

    // Prints error_message as is.
    [[noreturn]] void msg_exit_with_message(const LineInfo& line_info, const LocalizedString& error_message);

    // Prints "error: " followed by message.
    [[noreturn]] void msg_exit_with_error(const LineInfo& line_info, const LocalizedString& message);
    template<DNACQ_DECL_MSG_TEMPLATE>
    [[noreturn]] void msg_exit_with_error(const LineInfo& line_info, DNACQ_DECL_MSG_ARGS)
    {
        msg_exit_with_error(line_info, msg::format(DNACQ_EXPAND_MSG_ARGS));
    }
}
