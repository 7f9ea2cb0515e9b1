#pragma once

#include <dnacq/base/fwd/files.h>
#include <dnacq/base/fwd/system.process.h>

#include <dnacq/fwd/acquisition.h>

#include <dnacq/base/expected.h>
#include <dnacq/base/optional.h>
#include <dnacq/base/path.h>

#include <dnacq/acquisitionerror.h>

#include <string>

namespace dnacq
{
    struct InstallContext
    {
        Path installation_directory;
        std::string version;
        // where the runtime's executable will be once the install succeeds
        Path dotnet_path;
    };

    struct InstallerSettings
    {
        Path install_script;
        std::string runtime;
        Optional<std::string> architecture;
    };

    // Runs one install. Implementations post exactly one terminal event to the event stream per call.
    struct IAcquisitionInvoker
    {
        virtual ExpectedT<Unit, AcquisitionError> install_dotnet(const InstallContext& context) = 0;

        virtual ~IAcquisitionInvoker() = default;
    };

    // Launches the platform install script. Success requires a zero exit code and nothing written to stderr.
    struct ScriptAcquisitionInvoker final : IAcquisitionInvoker
    {
        ScriptAcquisitionInvoker(const ReadOnlyFilesystem& fs, EventStream& events, InstallerSettings settings);

        virtual ExpectedT<Unit, AcquisitionError> install_dotnet(const InstallContext& context) override;

        Command make_install_command(const InstallContext& context) const;

    private:
        const ReadOnlyFilesystem& m_fs;
        EventStream& m_events;
        InstallerSettings m_settings;
    };
}
