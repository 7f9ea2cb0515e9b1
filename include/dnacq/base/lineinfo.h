#pragma once

#include <dnacq/base/fmt.h>

#include <string>

namespace dnacq
{
    struct LineInfo
    {
        int line_number;
        const char* file_name;
        const char* function_name;

        std::string to_string() const;
    };
}

#define DNACQ_LINE_INFO                                                                                                \
    dnacq::LineInfo { __LINE__, __FILE__, __func__ }

DNACQ_FORMAT_WITH_TO_STRING(dnacq::LineInfo);
