#include <dnacq/base/files.h>
#include <dnacq/base/strings.h>
#include <dnacq/base/system.debug.h>
#include <dnacq/base/system.h>

#include <dnacq/acquisitioninvoker.h>
#include <dnacq/contractual-constants.h>
#include <dnacq/dnacqcmdarguments.h>

namespace
{
    using namespace dnacq;

    void from_env(const std::function<Optional<std::string>(ZStringView)>& f,
                  ZStringView var,
                  Optional<std::string>& dst)
    {
        if (dst) return;

        dst = f(var);
    }

    bool is_truthy(StringView value)
    {
        return value == "1" || Strings::case_insensitive_ascii_equals(value, "true") ||
               Strings::case_insensitive_ascii_equals(value, "on");
    }
}

namespace dnacq
{
    LocalizedString CommandMetadata::get_example_text() const
    {
        return LocalizedString::from_raw(example);
    }

    LocalizedString usage_for_command(const CommandMetadata& command_metadata)
    {
        LocalizedString result;
        result.append(msgSynopsisHeader);
        result.append_raw(' ');
        result.append(command_metadata.synopsis);
        result.append_raw('\n');
        result.append(msgExamplesHeader);
        result.append_raw('\n');
        result.append_indent().append_raw(command_metadata.example);
        result.append_raw('\n');
        return result;
    }

    DnacqCmdArguments::DnacqCmdArguments(CmdParser&& parser_) : parser(std::move(parser_)) { }

    DnacqCmdArguments DnacqCmdArguments::create_from_command_line(int argc, const char* const* const argv)
    {
        auto arguments = convert_argc_argv_to_arguments(argc, argv);
        return create_from_arg_sequence(arguments.data(), arguments.data() + arguments.size());
    }

    DnacqCmdArguments DnacqCmdArguments::create_from_arg_sequence(const std::string* arg_first,
                                                                  const std::string* arg_last)
    {
        DnacqCmdArguments args{CmdParser{std::vector<std::string>(arg_first, arg_last)}};
        args.parser.parse_switch(SwitchDebug, args.debug, msg::format(msgHelpDebugSwitch));
        args.parser.parse_option(
            SwitchInstallRoot,
            args.install_root_dir,
            msg::format(msgHelpInstallRootOption,
                        msg::env_var = format_environment_variable(EnvironmentVariableDnacqInstallRoot)));
        args.parser.parse_option(
            SwitchInstallScript,
            args.install_script,
            msg::format(msgHelpInstallScriptOption,
                        msg::env_var = format_environment_variable(EnvironmentVariableDnacqInstallScript)));
        args.parser.parse_option(
            SwitchRuntime,
            args.runtime,
            msg::format(msgHelpRuntimeOption,
                        msg::env_var = format_environment_variable(EnvironmentVariableDnacqRuntime)));
        args.parser.parse_option(
            SwitchArchitecture,
            args.architecture,
            msg::format(msgHelpArchitectureOption,
                        msg::env_var = format_environment_variable(EnvironmentVariableDnacqArchitecture)));
        args.parser.parse_option(
            SwitchLogFile,
            args.log_file,
            msg::format(msgHelpLogFileOption,
                        msg::env_var = format_environment_variable(EnvironmentVariableDnacqLogFile)));

        auto maybe_command = args.parser.extract_first_command_like_arg_lowercase();
        if (auto command = maybe_command.get())
        {
            args.command = std::move(*command);
        }

        return args;
    }

    ParsedArguments DnacqCmdArguments::parse_arguments(const CommandMetadata& command_metadata) const
    {
        ParsedArguments output;
        auto cmd_parser = this->parser;
        if (command_metadata.maximum_arity == 0)
        {
            cmd_parser.enforce_no_remaining_args(command);
        }
        else
        {
            Checks::check_exit(DNACQ_LINE_INFO,
                               command_metadata.minimum_arity == 1 && command_metadata.maximum_arity == 1);
            output.command_arguments.push_back(cmd_parser.consume_only_remaining_arg(command));
        }

        cmd_parser.exit_with_errors(usage_for_command(command_metadata));
        return output;
    }

    void DnacqCmdArguments::imbue_from_environment() { imbue_from_environment_impl(&dnacq::get_environment_variable); }

    void DnacqCmdArguments::imbue_from_fake_environment(const std::map<StringLiteral, std::string, std::less<>>& env)
    {
        imbue_from_environment_impl([&env](ZStringView var) -> Optional<std::string> {
            auto it = env.find(var);
            if (it == env.end())
            {
                return nullopt;
            }
            else
            {
                return it->second;
            }
        });
    }

    void DnacqCmdArguments::imbue_from_environment_impl(std::function<Optional<std::string>(ZStringView)> get_env)
    {
        from_env(get_env, EnvironmentVariableDnacqInstallRoot, install_root_dir);
        from_env(get_env, EnvironmentVariableDnacqInstallScript, install_script);
        from_env(get_env, EnvironmentVariableDnacqRuntime, runtime);
        from_env(get_env, EnvironmentVariableDnacqArchitecture, architecture);
        from_env(get_env, EnvironmentVariableDnacqLogFile, log_file);
        if (!debug)
        {
            auto debug_env = get_env(EnvironmentVariableDnacqDebug);
            if (auto value = debug_env.get())
            {
                debug = is_truthy(*value);
            }
        }
    }

    ExpectedL<Path> DnacqCmdArguments::resolve_install_root(const Filesystem& fs) const
    {
        if (auto root = install_root_dir.get())
        {
            Path candidate(*root);
            if (candidate.is_absolute())
            {
                return candidate;
            }

            std::error_code ec;
            auto cwd = fs.current_path(ec);
            if (ec)
            {
                return format_filesystem_call_error(ec, "current_path", {});
            }

            return cwd / candidate;
        }

        return get_platform_cache_root().map([](const Path& cache_root) { return cache_root / FileDnacq; });
    }

    InstallerSettings DnacqCmdArguments::resolve_installer_settings(const Path& install_root) const
    {
        InstallerSettings settings;
        if (auto script = install_script.get())
        {
            settings.install_script = Path(*script);
        }
        else
        {
            settings.install_script = install_root / FileScripts / FileInstallScript;
        }

        settings.runtime = runtime.value_or(DefaultRuntime.to_string());
        settings.architecture = architecture;
        Debug::println("installer script: ", settings.install_script, ", runtime: ", settings.runtime);
        return settings;
    }

    Optional<Path> DnacqCmdArguments::resolve_log_file() const
    {
        return log_file.map([](const std::string& file) { return Path(file); });
    }
}
