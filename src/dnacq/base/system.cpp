#include <dnacq/base/checks.h>
#include <dnacq/base/messages.h>
#include <dnacq/base/system.debug.h>
#include <dnacq/base/system.h>

#include <dnacq/contractual-constants.h>

#include <stdlib.h>
#include <unistd.h>

#include <initializer_list>
#include <system_error>

namespace
{
    using namespace dnacq;

    // nullopt when the variable is unset or empty; an error when it is set to a relative path.
    ExpectedL<Optional<Path>> absolute_path_from_environment(StringLiteral variable)
    {
        auto value = get_environment_variable(variable);
        if (!value.has_value() || value.get()->empty())
        {
            return Optional<Path>{};
        }

        Path result = std::move(*value.get());
        if (!result.is_absolute())
        {
            return msg::format(
                msgEnvVarMustBeAbsolutePath, msg::path = result, msg::env_var = format_environment_variable(variable));
        }

        return Optional<Path>{std::move(result)};
    }

    ExpectedL<Path> compute_platform_cache_root()
    {
        constexpr StringLiteral cache_variable = EnvironmentVariableXdgCacheHome;
        constexpr StringLiteral home_variable = EnvironmentVariableHome;
        constexpr StringLiteral home_suffix = ".cache";

        for (auto&& candidate : {cache_variable, home_variable})
        {
            auto maybe_path = absolute_path_from_environment(candidate);
            auto path = maybe_path.get();
            if (!path)
            {
                return std::move(maybe_path).error();
            }

            if (auto found = path->get())
            {
                if (candidate == home_variable)
                {
                    return *found / home_suffix;
                }

                return std::move(*found);
            }
        }

        return msg::format(msgUnableToReadEnvironmentVariable,
                           msg::env_var = format_environment_variable(home_variable));
    }
}

namespace dnacq
{
    Optional<std::string> get_environment_variable(ZStringView varname) noexcept
    {
        if (const char* value = ::getenv(varname.c_str()))
        {
            return std::string(value);
        }

        return nullopt;
    }

    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept
    {
        const int rc = value.has_value() ? ::setenv(varname.c_str(), value.get()->c_str(), 1)
                                         : ::unsetenv(varname.c_str());
        Checks::check_exit(DNACQ_LINE_INFO, rc == 0);
    }

    const ExpectedL<Path>& get_platform_cache_root() noexcept
    {
        static const ExpectedL<Path> s_cache_root = compute_platform_cache_root();
        return s_cache_root;
    }

    long get_process_id() { return ::getpid(); }

    LocalizedString format_system_error_message(StringLiteral api_name, int error_value)
    {
        return msg::format(msgSystemApiErrorMessage,
                           msg::system_api = api_name,
                           msg::exit_code = error_value,
                           msg::error_msg = std::system_category().message(error_value));
    }
}

namespace dnacq::Debug
{
    std::atomic<bool> g_debugging(false);
}
