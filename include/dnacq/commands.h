#pragma once

#include <dnacq/base/fwd/files.h>

#include <dnacq/base/stringview.h>

#include <dnacq/dnacqcmdarguments.h>

namespace dnacq
{
    using BasicCommandFn = void (*)(const DnacqCmdArguments& args, const Filesystem& fs);

    struct CommandRegistration
    {
        const CommandMetadata& metadata;
        BasicCommandFn function;
    };

    // nullptr if name is not a command
    const CommandRegistration* find_command(StringView name);

    std::string get_zero_args_usage();
    void print_full_command_list();
}
