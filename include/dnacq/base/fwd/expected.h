#pragma once

#include <dnacq/base/fwd/messages.h>

namespace dnacq
{
    struct Unit;
    struct ExpectedLeftTag;
    struct ExpectedRightTag;

    template<class T, class Error>
    struct ExpectedT;

    template<class T>
    using ExpectedL = ExpectedT<T, LocalizedString>;
}
