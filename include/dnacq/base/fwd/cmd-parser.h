#pragma once

namespace dnacq
{
    struct CmdParser;
}
