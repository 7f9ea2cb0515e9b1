#pragma once

#include <dnacq/base/fwd/stringview.h>

namespace dnacq
{
    // The values complete an ANSI "ESC [ 9 x m" bright foreground sequence.
    enum class Color : char
    {
        none = 0,
        success = '2',
        error = '1',
        warning = '3',
    };

    struct LocalizedString;
    struct MessageSink;

    namespace msg
    {
        template<class... Tags>
        struct MessageT;

        template<class Tag, class Type>
        struct TagArg;

        void write_unlocalized_text_to_stdout(Color c, StringView sv);
        void write_unlocalized_text_to_stderr(Color c, StringView sv);
    }
}
