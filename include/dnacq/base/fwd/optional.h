#pragma once

namespace dnacq
{
    struct NullOpt;

    template<class T>
    struct Optional;
}
