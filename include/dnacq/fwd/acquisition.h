#pragma once

namespace dnacq
{
    enum class AcquisitionErrorKind
    {
        UsageError,
        InstallProcessError,
        InstallScriptError,
        UnexpectedError,
    };

    enum class AcquisitionEventKind
    {
        Started,
        Completed,
        InstallError,
        ScriptError,
        UnexpectedError,
    };

    struct AcquisitionError;
    struct AcquisitionEvent;
    struct IEventStreamObserver;
    struct EventStream;
    struct InstallPaths;
    struct InstallContext;
    struct InstallerSettings;
    struct IAcquisitionInvoker;
    struct InstallStateStore;
    struct AcquisitionCoordinator;
}
