#pragma once

#include <dnacq/base/fwd/files.h>

#include <dnacq/dnacqcmdarguments.h>

namespace dnacq
{
    extern const CommandMetadata CommandAcquireMetadata;
    void command_acquire_and_exit(const DnacqCmdArguments& args, const Filesystem& fs);
}
