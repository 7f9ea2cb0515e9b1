DECLARE_MESSAGE(AcquisitionConcurrentStart,
                (msg::version),
                "Printed when an acquisition starts while another one is still running",
                "Starting a concurrent acquisition of .NET {version}")
DECLARE_MESSAGE(AcquisitionDone, (), "Printed in green after an acquisition completes", "Done!")
DECLARE_MESSAGE(AcquisitionDownloading,
                (msg::value),
                "{value} is a comma separated list of versions, for example: 3.1.0, 8.0.100",
                "Downloading .NET version(s) {value} ...")
DECLARE_MESSAGE(AcquisitionErrorHeader, (), "Printed in red before the details of a failed acquisition", "Error!")
DECLARE_MESSAGE(AcquisitionExecutablePath,
                (msg::version, msg::path),
                "",
                ".NET executable for version {version} is located at {path}")
DECLARE_MESSAGE(AcquisitionFailed, (msg::version), "", "Failed to download .NET {version}:")
DECLARE_MESSAGE(AcquisitionStillDownloading,
                (msg::value),
                "{value} is a comma separated list of quoted versions, for example: '3.1.0', '8.0.100'",
                "Still downloading .NET version(s) {value} ...")
DECLARE_MESSAGE(ChecksFailedCheck, (), "", "dnacq has crashed; no additional details are available.")
DECLARE_MESSAGE(ChecksUnreachableCode, (), "", "unreachable code was reached")
DECLARE_MESSAGE(Commands, (), "Printed just before a list of commands", "Commands")
DECLARE_MESSAGE(DnacqHasCrashed,
                (),
                "Printed before the details of an unhandled exception",
                "dnacq has crashed. The following details describe the crash:")
DECLARE_MESSAGE(DnacqInvalidCommand, (msg::command_name), "", "invalid command: {command_name}")
DECLARE_MESSAGE(DnacqUsage,
                (),
                "",
                "usage: dnacq <command> [--switches] [--options=values] [arguments]\n"
                "Run 'dnacq help' for a list of commands and options.")
DECLARE_MESSAGE(EnvVarMustBeAbsolutePath, (msg::path, msg::env_var), "", "{env_var} ({path}) was not an absolute path")
DECLARE_MESSAGE(ExamplesHeader, (), "Printed before a list of example command lines", "Examples:")
DECLARE_MESSAGE(FailedToDeleteDueToFile,
                (msg::value, msg::path, msg::error_msg),
                "{value} is the parent path of {path} we tried to delete",
                "failed to remove_all({value}) due to {path}: {error_msg}")
DECLARE_MESSAGE(HelpAcquireCommand,
                (),
                "",
                "Installs the requested .NET runtime version if needed and prints the path to its dotnet executable")
DECLARE_MESSAGE(HelpArchitectureOption,
                (msg::env_var),
                "",
                "Architecture passed to the install script (default: the script's choice). Also read from {env_var}")
DECLARE_MESSAGE(HelpDebugSwitch, (), "", "Prints diagnostic information to standard error")
DECLARE_MESSAGE(HelpHelpCommand, (), "", "Displays this help text")
DECLARE_MESSAGE(HelpInstallRootOption,
                (msg::env_var),
                "",
                "Directory holding installed runtimes and install state. Also read from {env_var}")
DECLARE_MESSAGE(HelpInstallScriptOption,
                (msg::env_var),
                "",
                "Path to the dotnet-install script (default: <install-root>/scripts/dotnet-install.sh). Also read from "
                "{env_var}")
DECLARE_MESSAGE(HelpLogFileOption,
                (msg::env_var),
                "",
                "Appends a record of every acquisition event to this file. Also read from {env_var}")
DECLARE_MESSAGE(HelpRuntimeOption,
                (msg::env_var),
                "",
                "Runtime passed to the install script (default: dotnet). Also read from {env_var}")
DECLARE_MESSAGE(HelpUninstallAllCommand,
                (),
                "",
                "Removes every installed runtime along with the install state under the install root")
DECLARE_MESSAGE(InstallerExitedWithCode,
                (msg::exit_code),
                "Followed by the output of the install script",
                "the install script exited with code {exit_code}:")
DECLARE_MESSAGE(InstallerLaunchFailed, (msg::command_line), "", "failed to launch the install script: {command_line}")
DECLARE_MESSAGE(InstallScriptNotFound, (msg::path), "", "the install script {path} does not exist")
DECLARE_MESSAGE(NonOneRemainingArgs,
                (msg::command_name),
                "",
                "the command '{command_name}' requires exactly one argument")
DECLARE_MESSAGE(NonZeroRemainingArgs,
                (msg::command_name),
                "",
                "the command '{command_name}' does not accept any additional arguments")
DECLARE_MESSAGE(OptionRequiresANonDashesValue,
                (msg::option, msg::actual, msg::value),
                "{value} is the value the user typed, {actual} is {option} with its leading dashes. Full example: the "
                "option 'log-file' requires a value; if you intended to set 'log-file' to '--log', use the equals "
                "form instead: --log-file=--log",
                "the option '{option}' requires a value; if you intended to set '{option}' to '{value}', use the "
                "equals form instead: {actual}={value}")
DECLARE_MESSAGE(OptionRequiresAValue, (msg::option), "", "the option '{option}' requires a value")
DECLARE_MESSAGE(Options, (), "Printed just before a list of options for a command", "Options")
DECLARE_MESSAGE(OptionUsedMultipleTimes, (msg::option), "", "the option '{option}' was specified multiple times")
DECLARE_MESSAGE(RecoveringInterruptedInstall,
                (msg::version, msg::path),
                "",
                "an earlier installation of .NET {version} was interrupted; removing {path} and reinstalling")
DECLARE_MESSAGE(RecoveringMissingInstallationDirectory,
                (msg::path),
                "",
                "installed runtimes are recorded but {path} is missing; resetting the install state")
DECLARE_MESSAGE(SwitchUsedMultipleTimes, (msg::option), "", "the switch '{option}' was specified multiple times")
DECLARE_MESSAGE(SynopsisHeader, (), "Printed before a description of what a command does", "Synopsis:")
DECLARE_MESSAGE(SystemApiErrorMessage,
                (msg::system_api, msg::exit_code, msg::error_msg),
                "",
                "calling {system_api} failed with {exit_code} ({error_msg})")
DECLARE_MESSAGE(UnableToReadEnvironmentVariable, (msg::env_var), "", "unable to read {env_var}")
DECLARE_MESSAGE(UnexpectedArgument,
                (msg::option),
                "Argument is literally what the user passed on the command line.",
                "unexpected argument: {option}")
DECLARE_MESSAGE(UnexpectedOption,
                (msg::option),
                "Option is a command line option like --option=value",
                "unexpected option: {option}")
DECLARE_MESSAGE(UnexpectedSwitch,
                (msg::option),
                "Switch is a command line switch like --switch",
                "unexpected switch: {option}")
DECLARE_MESSAGE(UninstalledAll, (msg::path), "", "removed every installed runtime under {path}")
DECLARE_MESSAGE(VersionInvalidCharacters,
                (msg::version),
                "",
                "'{version}' is not a valid version: versions may not contain '|' or line breaks")
DECLARE_MESSAGE(VersionLatestNotSupported,
                (),
                "",
                "'latest' is not supported; request a specific version such as 8.0.100")
DECLARE_MESSAGE(VersionRequired, (), "", "a version is required")
