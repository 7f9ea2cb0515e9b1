#pragma once

#include <dnacq/base/fwd/system.process.h>

#include <dnacq/base/expected.h>
#include <dnacq/base/optional.h>
#include <dnacq/base/path.h>
#include <dnacq/base/stringview.h>

#include <string>
#include <vector>

namespace dnacq
{
    void append_shell_escaped(std::string& target, StringView content);

    struct Command
    {
        Command() = default;
        explicit Command(StringView s) { string_arg(s); }

        Command& string_arg(StringView s) &;
        Command& raw_arg(StringView s) &;

        Command&& string_arg(StringView s) && { return std::move(string_arg(s)); };
        Command&& raw_arg(StringView s) && { return std::move(raw_arg(s)); }

        std::string&& extract() && { return std::move(buf); }
        StringView command_line() const { return buf; }
        const char* c_str() const { return buf.c_str(); }

        void clear() { buf.clear(); }
        bool empty() const { return buf.empty(); }

    private:
        std::string buf;
    };

    struct ExitCodeAndOutput
    {
        ExitCodeIntegral exit_code;
        std::string output;
    };

    struct ExitCodeAndSplitOutput
    {
        ExitCodeIntegral exit_code;
        std::string standard_output;
        std::string standard_error;
    };

    struct RedirectedProcessLaunchSettings
    {
        // whether to echo all read content to the debug log
        EchoInDebug echo_in_debug = EchoInDebug::Hide;
    };

    // Runs cmd through the shell with stdin connected to the null device. Stdout and stderr are merged.
    ExpectedL<ExitCodeAndOutput> cmd_execute_and_capture_output(const Command& cmd,
                                                                const RedirectedProcessLaunchSettings& settings);

    // As above, but stdout and stderr are collected separately.
    ExpectedL<ExitCodeAndSplitOutput> cmd_execute_and_capture_split_output(
        const Command& cmd, const RedirectedProcessLaunchSettings& settings);
}
