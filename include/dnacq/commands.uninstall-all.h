#pragma once

#include <dnacq/base/fwd/files.h>

#include <dnacq/dnacqcmdarguments.h>

namespace dnacq
{
    extern const CommandMetadata CommandUninstallAllMetadata;
    void command_uninstall_all_and_exit(const DnacqCmdArguments& args, const Filesystem& fs);
}
