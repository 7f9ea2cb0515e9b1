#pragma once

namespace dnacq
{
    enum class EchoInDebug
    {
        Show,
        Hide
    };

    struct Command;
    struct ExitCodeAndOutput;
    struct ExitCodeAndSplitOutput;

    // The integral type the operating system uses to represent exit codes.
    using ExitCodeIntegral = int;
}
