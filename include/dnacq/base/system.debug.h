#pragma once

#include <dnacq/base/fwd/messages.h>

#include <dnacq/base/lineinfo.h>
#include <dnacq/base/strings.h>

#include <atomic>

namespace dnacq::Debug
{
    extern std::atomic<bool> g_debugging;

    // Debug output goes to stderr so that it never mixes into the paths dnacq prints on stdout.
    template<class... Args>
    void print(const Args&... args)
    {
        if (g_debugging) msg::write_unlocalized_text_to_stderr(Color::none, Strings::concat("[DEBUG] ", args...));
    }
    template<class... Args>
    void println(const Args&... args)
    {
        if (g_debugging)
            msg::write_unlocalized_text_to_stderr(Color::none, Strings::concat("[DEBUG] ", args..., '\n'));
    }
}
