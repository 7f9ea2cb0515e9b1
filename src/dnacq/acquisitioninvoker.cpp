#include <dnacq/base/files.h>
#include <dnacq/base/strings.h>
#include <dnacq/base/system.debug.h>
#include <dnacq/base/system.process.h>

#include <dnacq/acquisitioninvoker.h>
#include <dnacq/contractual-constants.h>
#include <dnacq/eventstream.h>

namespace dnacq
{
    ScriptAcquisitionInvoker::ScriptAcquisitionInvoker(const ReadOnlyFilesystem& fs,
                                                       EventStream& events,
                                                       InstallerSettings settings)
        : m_fs(fs), m_events(events), m_settings(std::move(settings))
    {
    }

    Command ScriptAcquisitionInvoker::make_install_command(const InstallContext& context) const
    {
        Command cmd{m_settings.install_script};
        cmd.string_arg(InstallerSwitchInstallDir)
            .string_arg(context.installation_directory)
            .string_arg(InstallerSwitchRuntime)
            .string_arg(m_settings.runtime)
            .string_arg(InstallerSwitchVersion)
            .string_arg(context.version);
        if (auto architecture = m_settings.architecture.get())
        {
            cmd.string_arg(InstallerSwitchArchitecture).string_arg(*architecture);
        }

        return cmd;
    }

    ExpectedT<Unit, AcquisitionError> ScriptAcquisitionInvoker::install_dotnet(const InstallContext& context)
    {
        if (!m_fs.is_regular_file(m_settings.install_script))
        {
            auto message = msg::format(msgInstallScriptNotFound, msg::path = m_settings.install_script);
            m_events.post(AcquisitionEvent::unexpected_error(context.version, message));
            return AcquisitionError::unexpected_error(std::move(message));
        }

        const auto cmd = make_install_command(context);
        RedirectedProcessLaunchSettings settings;
        settings.echo_in_debug = EchoInDebug::Show;
        auto maybe_output = cmd_execute_and_capture_split_output(cmd, settings);
        auto output = maybe_output.get();
        if (!output)
        {
            auto message = msg::format(msgInstallerLaunchFailed, msg::command_line = cmd.command_line());
            message.append_raw('\n').append(maybe_output.error());
            m_events.post(AcquisitionEvent::unexpected_error(context.version, message));
            return AcquisitionError::unexpected_error(std::move(message));
        }

        if (output->exit_code != 0)
        {
            auto message = msg::format(msgInstallerExitedWithCode, msg::exit_code = output->exit_code);
            auto diagnostics = Strings::concat(Strings::trim_end(output->standard_error),
                                               output->standard_error.empty() ? "" : "\n",
                                               Strings::trim_end(output->standard_output));
            if (!Strings::trim(diagnostics).empty())
            {
                message.append_raw('\n').append_raw(Strings::trim(diagnostics));
            }

            m_events.post(AcquisitionEvent::install_error(context.version, message));
            return AcquisitionError::install_process_error(output->exit_code, std::move(message));
        }

        if (!output->standard_error.empty())
        {
            m_events.post(AcquisitionEvent::script_error(context.version, output->standard_error));
            return AcquisitionError::install_script_error(LocalizedString::from_raw(output->standard_error));
        }

        m_events.post(AcquisitionEvent::completed(context.version, context.dotnet_path));
        return Unit{};
    }
}
