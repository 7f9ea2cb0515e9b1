#pragma once

namespace dnacq
{
    struct MessageLineSegment;
    struct MessageLine;
    struct MessageSink;
}
