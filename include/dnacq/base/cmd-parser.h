#pragma once

#include <dnacq/base/fwd/cmd-parser.h>

#include <dnacq/base/messages.h>
#include <dnacq/base/optional.h>
#include <dnacq/base/stringview.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace dnacq
{
    // Builds the two column text used by `dnacq help`. Lines are wrapped at 100 columns.
    struct HelpTableFormatter
    {
        void format(StringView col1, StringView col2);
        void example(StringView example_text);
        // Appends "name:"
        void header(StringView name);
        void blank();
        void text(StringView text, int indent = 0);

        std::string m_str;
    };

    // Drops argv[0].
    std::vector<std::string> convert_argc_argv_to_arguments(int argc, const char* const* const argv);

    // Consumes command line arguments piece by piece. Parse failures are collected rather than reported immediately
    // so that every problem can be shown at once by exit_with_errors.
    struct CmdParser
    {
        CmdParser() = default;
        explicit CmdParser(std::vector<std::string> inputs);

        // Accepts --name and --no-name, case insensitively. A second occurrence is an error; the last one wins.
        bool parse_switch(StringView switch_name, bool& value);
        bool parse_switch(StringView switch_name, bool& value, const LocalizedString& help_text);

        // Accepts --name=value and --name value. The value keeps its casing. In the second form the value may not
        // start with "--".
        bool parse_option(StringView option_name, Optional<std::string>& value);
        bool parse_option(StringView option_name, Optional<std::string>& value, const LocalizedString& help_text);

        // The first unconsumed argument that is not a switch, lowercased. --help, -h and -? become "help".
        Optional<std::string> extract_first_command_like_arg_lowercase();

        std::vector<std::string> get_remaining_args() const;

        void enforce_no_remaining_args(StringView command_name);

        // Returns an empty string and records errors unless exactly one argument remains and no switches do.
        std::string consume_only_remaining_arg(StringView command_name);

        const std::vector<LocalizedString>& get_errors() const { return errors; }

        void append_options_table(LocalizedString&) const;

        // Does nothing when no errors were recorded. Otherwise prints them followed by the usage text and exits.
        void exit_with_errors(LocalizedString example);

    private:
        struct Argument
        {
            // Arguments exactly as the user supplied them.
            std::string original;
            // Used for matching names, never for display.
            std::string lowercase;
            bool consumed = false;
        };

        bool reject_leftover_switches();
        void reject_leftover_arguments(size_t first);

        std::vector<Argument> arguments;
        std::vector<LocalizedString> errors;
        std::map<std::string, LocalizedString> options_table;
    };
}
