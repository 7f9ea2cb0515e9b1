#include <dnacq-test/util.h>

#include <dnacq/base/system.h>
#include <dnacq/base/system.process.h>

namespace dnacq::Test
{
    const Path& base_temporary_directory() noexcept
    {
        static const Path base = "/tmp/dnacq-test";
        return base;
    }

    Path make_clean_temporary_directory(StringView name)
    {
        auto dir = base_temporary_directory() / Strings::concat(name, '-', get_process_id());
        real_filesystem.remove_all(dir, DNACQ_LINE_INFO);
        real_filesystem.create_directories(dir, DNACQ_LINE_INFO);
        return dir;
    }

    void write_executable_script(const Path& script_path, StringView body)
    {
        real_filesystem.write_contents_and_dirs(script_path, Strings::concat("#!/bin/sh\n", body), DNACQ_LINE_INFO);
        auto chmod = cmd_execute_and_capture_output(Command{"chmod"}.string_arg("+x").string_arg(script_path),
                                                    RedirectedProcessLaunchSettings{});
        auto result = chmod.get();
        REQUIRE(result);
        REQUIRE(result->exit_code == 0);
    }
}
