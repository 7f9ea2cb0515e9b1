#include <dnacq/base/files.h>
#include <dnacq/base/strings.h>

#include <dnacq/acquisitionhost.h>
#include <dnacq/commands.acquire.h>

namespace
{
    using namespace dnacq;

    AcquisitionResult acquire_version(const DnacqCmdArguments& args,
                                      const Filesystem& fs,
                                      const Path& install_root,
                                      StringView version)
    {
        AcquisitionHost host(args, fs, install_root);
        return host.coordinator().acquire_and_wait(version);
    }
}

namespace dnacq
{
    const CommandMetadata CommandAcquireMetadata{
        "acquire",
        msgHelpAcquireCommand,
        "dnacq acquire 8.0.100",
        1,
        1,
    };

    void command_acquire_and_exit(const DnacqCmdArguments& args, const Filesystem& fs)
    {
        const auto parsed = args.parse_arguments(CommandAcquireMetadata);
        const auto& version = parsed.command_arguments[0];
        if (Strings::case_insensitive_ascii_equals(version, "latest"))
        {
            msg::println_error(msgVersionLatestNotSupported);
            Checks::exit_fail(DNACQ_LINE_INFO);
        }

        const auto install_root = args.resolve_install_root(fs).value_or_exit(DNACQ_LINE_INFO);
        const auto result = acquire_version(args, fs, install_root, version);
        if (auto path = result.get())
        {
            msg::write_unlocalized_text_to_stdout(Color::none, Strings::concat(*path, '\n'));
            Checks::exit_success(DNACQ_LINE_INFO);
        }

        msg::println_error(result.error().message);
        Checks::exit_fail(DNACQ_LINE_INFO);
    }
}
