#pragma once

namespace dnacq
{
    struct StringView;
    struct ZStringView;
    struct StringLiteral;
}
