#pragma once

#include <dnacq/base/fwd/files.h>

#include <dnacq/fwd/acquisition.h>

#include <dnacq/base/cmd-parser.h>
#include <dnacq/base/expected.h>
#include <dnacq/base/messages.h>
#include <dnacq/base/optional.h>
#include <dnacq/base/path.h>
#include <dnacq/base/stringview.h>

#include <dnacq/acquisitioninvoker.h>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace dnacq
{
    struct ParsedArguments
    {
        std::vector<std::string> command_arguments;
    };

    struct CommandMetadata
    {
        StringLiteral name;
        msg::MessageT<> synopsis;
        StringLiteral example;

        size_t minimum_arity;
        size_t maximum_arity;

        LocalizedString get_example_text() const;
    };

    LocalizedString usage_for_command(const CommandMetadata& command_metadata);

    struct DnacqCmdArguments
    {
        static DnacqCmdArguments create_from_command_line(int argc, const char* const* const argv);
        static DnacqCmdArguments create_from_arg_sequence(const std::string* arg_first, const std::string* arg_last);

        // Parses the command's own arguments. Prints the errors and the command's usage and exits on failure.
        ParsedArguments parse_arguments(const CommandMetadata& command_metadata) const;

        void imbue_from_environment();
        void imbue_from_fake_environment(const std::map<StringLiteral, std::string, std::less<>>& env);

        const std::string& get_command() const noexcept { return command; }
        void append_options_table(LocalizedString& target) const { parser.append_options_table(target); }

        // Command line first, then environment; defaults are applied by the resolve functions below.
        Optional<std::string> install_root_dir;
        Optional<std::string> install_script;
        Optional<std::string> runtime;
        Optional<std::string> architecture;
        Optional<std::string> log_file;
        bool debug = false;

        // --install-root, else DNACQ_INSTALL_ROOT, else <user cache dir>/dnacq
        ExpectedL<Path> resolve_install_root(const Filesystem& fs) const;
        // --install-script, else DNACQ_INSTALL_SCRIPT, else <install_root>/scripts/dotnet-install.sh
        InstallerSettings resolve_installer_settings(const Path& install_root) const;
        Optional<Path> resolve_log_file() const;

    private:
        explicit DnacqCmdArguments(CmdParser&& parser_);

        void imbue_from_environment_impl(std::function<Optional<std::string>(ZStringView)> get_env);

        CmdParser parser;
        std::string command;
    };
}
