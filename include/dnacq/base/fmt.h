#pragma once

#include <dnacq/base/fwd/fmt.h>

#include <dnacq/base/pragmas.h>

// C6240, C6294 and C6326 are code analysis findings inside fmt's own headers.
DNACQ_MSVC_WARNING(push)
DNACQ_MSVC_WARNING(disable : 6240 6294 6326)
#include <fmt/format.h>
DNACQ_MSVC_WARNING(pop)
