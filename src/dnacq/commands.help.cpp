#include <dnacq/base/checks.h>
#include <dnacq/base/message_sinks.h>
#include <dnacq/base/messages.h>

#include <dnacq/commands.h>
#include <dnacq/commands.help.h>

namespace dnacq
{
    const CommandMetadata CommandHelpMetadata{
        "help",
        msgHelpHelpCommand,
        "dnacq help",
        0,
        0,
    };

    void command_help_and_exit(const DnacqCmdArguments& args, const Filesystem&)
    {
        (void)args.parse_arguments(CommandHelpMetadata);
        msg::write_unlocalized_text_to_stdout(Color::none, get_zero_args_usage());
        print_full_command_list();
        LocalizedString options;
        args.append_options_table(options);
        stdout_sink.println(options);
        Checks::exit_success(DNACQ_LINE_INFO);
    }
}
