#pragma once

#include <dnacq/base/stringview.h>

namespace dnacq
{
    // Names that are visible to users or other programs and therefore must not change.

    // Layout under the install root
    inline constexpr StringLiteral FileDotDotnet = ".dotnet";
    inline constexpr StringLiteral FileInstallLock = "install.lock";
    inline constexpr StringLiteral FileInstallBegin = "install.begin";
    inline constexpr StringLiteral FileScripts = "scripts";
    inline constexpr StringLiteral FileDotnetExecutable = "dotnet";
    inline constexpr StringLiteral FileInstallScript = "dotnet-install.sh";
    inline constexpr StringLiteral FileDnacq = "dnacq";

    // Separator between versions in install.lock
    inline constexpr char InstallLockSeparator = '|';
    inline constexpr StringLiteral InstallLockSeparatorText = "|";

    inline constexpr StringLiteral DefaultRuntime = "dotnet";

    // Installer script parameters
    inline constexpr StringLiteral InstallerSwitchInstallDir = "-InstallDir";
    inline constexpr StringLiteral InstallerSwitchRuntime = "-Runtime";
    inline constexpr StringLiteral InstallerSwitchVersion = "-Version";
    inline constexpr StringLiteral InstallerSwitchArchitecture = "-Architecture";

    // Commands
    inline constexpr StringLiteral CommandAcquire = "acquire";
    inline constexpr StringLiteral CommandUninstallAll = "uninstall-all";
    inline constexpr StringLiteral CommandHelp = "help";

    // Command line switches
    inline constexpr StringLiteral SwitchInstallRoot = "install-root";
    inline constexpr StringLiteral SwitchInstallScript = "install-script";
    inline constexpr StringLiteral SwitchRuntime = "runtime";
    inline constexpr StringLiteral SwitchArchitecture = "architecture";
    inline constexpr StringLiteral SwitchLogFile = "log-file";
    inline constexpr StringLiteral SwitchDebug = "debug";

    // Environment variables
    inline constexpr StringLiteral EnvironmentVariableDnacqInstallRoot = "DNACQ_INSTALL_ROOT";
    inline constexpr StringLiteral EnvironmentVariableDnacqInstallScript = "DNACQ_INSTALL_SCRIPT";
    inline constexpr StringLiteral EnvironmentVariableDnacqRuntime = "DNACQ_RUNTIME";
    inline constexpr StringLiteral EnvironmentVariableDnacqArchitecture = "DNACQ_ARCHITECTURE";
    inline constexpr StringLiteral EnvironmentVariableDnacqLogFile = "DNACQ_LOG_FILE";
    inline constexpr StringLiteral EnvironmentVariableDnacqDebug = "DNACQ_DEBUG";
    inline constexpr StringLiteral EnvironmentVariableHome = "HOME";
    inline constexpr StringLiteral EnvironmentVariableXdgCacheHome = "XDG_CACHE_HOME";
}
