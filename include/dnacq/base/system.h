#pragma once

#include <dnacq/base/fwd/expected.h>
#include <dnacq/base/fwd/messages.h>
#include <dnacq/base/fwd/optional.h>
#include <dnacq/base/fwd/stringview.h>

#include <dnacq/base/expected.h>
#include <dnacq/base/optional.h>
#include <dnacq/base/path.h>

#include <string>

namespace dnacq
{
    Optional<std::string> get_environment_variable(ZStringView varname) noexcept;
    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept;

    // $XDG_CACHE_HOME, else $HOME/.cache. %LOCALAPPDATA%, else %USERPROFILE%\AppData\Local on Windows.
    // Computed once.
    const ExpectedL<Path>& get_platform_cache_root() noexcept;

    long get_process_id();

    LocalizedString format_system_error_message(StringLiteral api_name, int error_value);
}
