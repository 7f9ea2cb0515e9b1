#include <dnacq/base/checks.h>
#include <dnacq/base/chrono.h>
#include <dnacq/base/files.h>
#include <dnacq/base/strings.h>
#include <dnacq/base/system.debug.h>
#include <dnacq/base/system.h>

#include <dnacq/commands.h>
#include <dnacq/contractual-constants.h>
#include <dnacq/dnacqcmdarguments.h>

#include <locale.h>
#include <stdlib.h>

#include <exception>

using namespace dnacq;

namespace
{
    ElapsedTimer g_total_time;

    [[noreturn]] void exit_with_usage(const LocalizedString& preamble)
    {
        if (!preamble.empty())
        {
            msg::write_unlocalized_text_to_stderr(Color::error, preamble);
        }

        msg::write_unlocalized_text_to_stderr(Color::none, get_zero_args_usage());
        Checks::exit_fail(DNACQ_LINE_INFO);
    }

    void run_command(const Filesystem& fs, const DnacqCmdArguments& args)
    {
        const auto& name = args.get_command();
        if (name.empty())
        {
            exit_with_usage(LocalizedString{});
        }

        const auto command = find_command(name);
        if (!command)
        {
            exit_with_usage(LocalizedString::from_raw(ErrorPrefix)
                                .append(msgDnacqInvalidCommand, msg::command_name = name)
                                .append_raw('\n'));
        }

        Debug::println("running command ", command->metadata.name);
        command->function(args, fs);
    }

    [[noreturn]] void exit_with_crash_report(StringView what)
    {
        fflush(stdout);
        msg::write_unlocalized_text_to_stderr(Color::error,
                                              LocalizedString::from_raw(ErrorPrefix)
                                                  .append(msgDnacqHasCrashed)
                                                  .append_raw("\nEXCEPTION=")
                                                  .append_raw(what)
                                                  .append_raw('\n'));
        fflush(stderr);
        Checks::exit_fail(DNACQ_LINE_INFO);
    }
}

namespace dnacq::Checks
{
    void on_final_cleanup_and_exit()
    {
        Debug::println("exiting after ", g_total_time);
    }
}

int main(const int argc, const char* const* const argv)
{
    if (argc == 0) std::abort();

    // Installer output is passed through untouched, so prefer a UTF-8 locale when one exists.
    for (const char* utf8_locale : {"C.UTF-8", "POSIX.UTF-8", "en_US.UTF-8"})
    {
        if (::setlocale(LC_ALL, utf8_locale)) break;
    }

    DnacqCmdArguments args = DnacqCmdArguments::create_from_command_line(argc, argv);
    args.imbue_from_environment();
    Debug::g_debugging = args.debug;
    Debug::println("install root from command line or environment: ", args.install_root_dir.value_or("(default)"));

    try
    {
        run_command(real_filesystem, args);
        Checks::exit_fail(DNACQ_LINE_INFO);
    }
    catch (std::exception& e)
    {
        exit_with_crash_report(e.what());
    }
    catch (...)
    {
        exit_with_crash_report("unknown error(...)");
    }
}
