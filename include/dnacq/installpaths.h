#pragma once

#include <dnacq/base/path.h>

#include <dnacq/contractual-constants.h>

namespace dnacq
{
    // Everything dnacq persists lives below one install root:
    //   <root>/.dotnet         the installation directory shared by every acquired version
    //   <root>/install.lock    versions whose install completed, separated by '|'
    //   <root>/install.begin   present while an install is in progress or after one was interrupted
    struct InstallPaths
    {
        explicit InstallPaths(Path root) : m_root(std::move(root)) { }

        const Path& root() const { return m_root; }
        Path installation_directory() const { return m_root / FileDotDotnet; }
        Path lock_file() const { return m_root / FileInstallLock; }
        Path begin_marker() const { return m_root / FileInstallBegin; }
        Path dotnet_executable() const { return installation_directory() / FileDotnetExecutable; }

    private:
        Path m_root;
    };
}
