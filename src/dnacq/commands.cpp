#include <dnacq/base/cmd-parser.h>
#include <dnacq/base/messages.h>

#include <dnacq/commands.acquire.h>
#include <dnacq/commands.h>
#include <dnacq/commands.help.h>
#include <dnacq/commands.uninstall-all.h>

namespace
{
    using namespace dnacq;

    const CommandRegistration registrations[] = {
        {CommandAcquireMetadata, command_acquire_and_exit},
        {CommandUninstallAllMetadata, command_uninstall_all_and_exit},
        {CommandHelpMetadata, command_help_and_exit},
    };
}

namespace dnacq
{
    const CommandRegistration* find_command(StringView name)
    {
        for (auto&& registration : registrations)
        {
            if (registration.metadata.name == name)
            {
                return &registration;
            }
        }

        return nullptr;
    }

    std::string get_zero_args_usage()
    {
        auto usage = msg::format(msgDnacqUsage);
        usage.append_raw('\n');
        return usage.extract_data();
    }

    void print_full_command_list()
    {
        HelpTableFormatter table;
        table.header(msg::format(msgCommands));
        for (auto&& registration : registrations)
        {
            table.format(registration.metadata.example, msg::format(registration.metadata.synopsis));
        }

        msg::println(LocalizedString::from_raw(table.m_str));
    }
}
