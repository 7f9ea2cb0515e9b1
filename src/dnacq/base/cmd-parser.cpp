#include <dnacq/base/checks.h>
#include <dnacq/base/cmd-parser.h>
#include <dnacq/base/message_sinks.h>
#include <dnacq/base/strings.h>

#include <algorithm>

namespace
{
    using namespace dnacq;

    constexpr size_t help_line_width = 100;
    constexpr size_t help_col1_indent = 2;
    constexpr size_t help_col1_width = 22;
    constexpr size_t help_col2_start = help_col1_indent + help_col1_width + 1;

    bool is_help_break(char ch) { return ch == ' ' || ch == '\n'; }

    // Strips a leading "--" from the view; returns false when it is not there.
    bool strip_dashes(StringView& arg)
    {
        if (!arg.starts_with("--"))
        {
            return false;
        }

        arg = arg.substr(2);
        return true;
    }

    // Matches --name (value = true) and --no-name (value = false).
    bool match_switch(StringView arg, StringView switch_name, bool& value)
    {
        if (!strip_dashes(arg))
        {
            return false;
        }

        bool enabled = true;
        if (arg.starts_with("no-"))
        {
            enabled = false;
            arg = arg.substr(3);
        }

        if (arg != switch_name)
        {
            return false;
        }

        value = enabled;
        return true;
    }

    enum class OptionMatch
    {
        None,
        Inline,
        NextArgument
    };

    // On Inline, value_offset is where the value begins; it is the same in the lowercased and original text.
    OptionMatch match_option(StringView arg, StringView option_name, size_t& value_offset)
    {
        if (!strip_dashes(arg) || !arg.starts_with(option_name))
        {
            return OptionMatch::None;
        }

        const auto rest = arg.substr(option_name.size());
        if (rest.empty())
        {
            return OptionMatch::NextArgument;
        }

        if (rest[0] != '=')
        {
            return OptionMatch::None;
        }

        value_offset = 2 + option_name.size() + 1;
        return OptionMatch::Inline;
    }
}

namespace dnacq
{
    void HelpTableFormatter::format(StringView col1, StringView col2)
    {
        m_str.append(help_col1_indent, ' ');
        m_str.append(col1.data(), col1.size());
        if (col1.size() <= help_col1_width)
        {
            m_str.append(help_col2_start - help_col1_indent - col1.size(), ' ');
        }
        else
        {
            m_str.push_back('\n');
            m_str.append(help_col2_start, ' ');
        }

        text(col2, static_cast<int>(help_col2_start));
        m_str.push_back('\n');
    }

    void HelpTableFormatter::example(StringView example_text)
    {
        Strings::append(m_str, example_text, '\n');
    }

    void HelpTableFormatter::header(StringView name) { Strings::append(m_str, name, ":\n"); }

    void HelpTableFormatter::blank() { m_str.push_back('\n'); }

    // Greedy word wrap. Width is counted in bytes.
    void HelpTableFormatter::text(StringView text, int indent)
    {
        const auto width = help_line_width - static_cast<size_t>(indent);
        auto line_first = text.begin();
        const auto last = text.end();
        auto candidate = std::find_if(line_first, last, is_help_break);
        while (candidate != last)
        {
            const auto next = std::find_if(candidate + 1, last, is_help_break);
            const bool too_long = static_cast<size_t>(next - line_first) > width;
            if (*candidate == '\n' || too_long)
            {
                m_str.append(line_first, candidate);
                m_str.push_back('\n');
                m_str.append(static_cast<size_t>(indent), ' ');
                line_first = candidate + 1;
            }

            candidate = next;
        }

        m_str.append(line_first, last);
    }

    std::vector<std::string> convert_argc_argv_to_arguments(int argc, const char* const* const argv)
    {
        if (argc <= 1)
        {
            return {};
        }

        return std::vector<std::string>(argv + 1, argv + argc);
    }

    CmdParser::CmdParser(std::vector<std::string> inputs)
    {
        arguments.reserve(inputs.size());
        for (auto&& input : inputs)
        {
            Argument arg;
            arg.lowercase = Strings::ascii_to_lowercase(input);
            arg.original = std::move(input);
            arguments.push_back(std::move(arg));
        }
    }

    bool CmdParser::parse_switch(StringView switch_name, bool& value)
    {
        bool seen = false;
        bool reported = false;
        for (auto&& arg : arguments)
        {
            if (arg.consumed || !match_switch(arg.lowercase, switch_name, value))
            {
                continue;
            }

            arg.consumed = true;
            if (seen && !reported)
            {
                errors.push_back(msg::format_error(msgSwitchUsedMultipleTimes, msg::option = switch_name));
                reported = true;
            }

            seen = true;
        }

        return seen;
    }

    bool CmdParser::parse_switch(StringView switch_name, bool& value, const LocalizedString& help_text)
    {
        options_table.emplace(Strings::concat("--", switch_name), help_text);
        return parse_switch(switch_name, value);
    }

    bool CmdParser::parse_option(StringView option_name, Optional<std::string>& value)
    {
        Optional<std::string> last_value;
        bool reported = false;
        for (size_t idx = 0; idx < arguments.size(); ++idx)
        {
            auto& arg = arguments[idx];
            if (arg.consumed)
            {
                continue;
            }

            size_t value_offset = 0;
            const auto match = match_option(arg.lowercase, option_name, value_offset);
            if (match == OptionMatch::None)
            {
                continue;
            }

            if (last_value.has_value() && !reported)
            {
                errors.push_back(msg::format_error(msgOptionUsedMultipleTimes, msg::option = option_name));
                reported = true;
            }

            arg.consumed = true;
            if (match == OptionMatch::Inline)
            {
                last_value = arg.original.substr(value_offset);
                continue;
            }

            if (idx + 1 == arguments.size() || arguments[idx + 1].consumed)
            {
                errors.push_back(msg::format_error(msgOptionRequiresAValue, msg::option = option_name));
                continue;
            }

            auto& next = arguments[idx + 1];
            ++idx;
            if (StringView{next.original}.starts_with("--"))
            {
                errors.push_back(msg::format_error(msgOptionRequiresANonDashesValue,
                                                   msg::option = option_name,
                                                   msg::actual = arg.original,
                                                   msg::value = next.original));
                continue;
            }

            next.consumed = true;
            last_value = next.original;
        }

        if (auto found = last_value.get())
        {
            value.emplace(std::move(*found));
            return true;
        }

        return false;
    }

    bool CmdParser::parse_option(StringView option_name, Optional<std::string>& value, const LocalizedString& help_text)
    {
        options_table.emplace(Strings::concat("--", option_name, "=..."), help_text);
        return parse_option(option_name, value);
    }

    Optional<std::string> CmdParser::extract_first_command_like_arg_lowercase()
    {
        const auto candidate = std::find_if(arguments.begin(), arguments.end(), [](const Argument& arg) {
            return !arg.consumed && (arg.lowercase == "--help" || !StringView{arg.lowercase}.starts_with("--"));
        });

        if (candidate == arguments.end())
        {
            return nullopt;
        }

        candidate->consumed = true;
        if (candidate->lowercase == "--help" || candidate->lowercase == "-h" || candidate->lowercase == "-?")
        {
            return std::string("help");
        }

        return candidate->lowercase;
    }

    std::vector<std::string> CmdParser::get_remaining_args() const
    {
        std::vector<std::string> results;
        for (auto&& arg : arguments)
        {
            if (!arg.consumed)
            {
                results.push_back(arg.original);
            }
        }

        return results;
    }

    bool CmdParser::reject_leftover_switches()
    {
        bool any = false;
        for (auto&& arg : arguments)
        {
            if (arg.consumed || !StringView{arg.original}.starts_with("--"))
            {
                continue;
            }

            arg.consumed = true;
            any = true;
            if (StringView{arg.original}.contains('='))
            {
                errors.push_back(msg::format_error(msgUnexpectedOption, msg::option = arg.original));
            }
            else
            {
                errors.push_back(msg::format_error(msgUnexpectedSwitch, msg::option = arg.original));
            }
        }

        return any;
    }

    void CmdParser::reject_leftover_arguments(size_t first)
    {
        for (size_t idx = first; idx < arguments.size(); ++idx)
        {
            auto& arg = arguments[idx];
            if (!arg.consumed)
            {
                arg.consumed = true;
                errors.push_back(msg::format_error(msgUnexpectedArgument, msg::option = arg.original));
            }
        }
    }

    void CmdParser::enforce_no_remaining_args(StringView command_name)
    {
        (void)reject_leftover_switches();
        const auto first_leftover =
            std::find_if(arguments.begin(), arguments.end(), [](const Argument& arg) { return !arg.consumed; });
        if (first_leftover != arguments.end())
        {
            errors.push_back(msg::format_error(msgNonZeroRemainingArgs, msg::command_name = command_name));
            reject_leftover_arguments(static_cast<size_t>(first_leftover - arguments.begin()));
        }
    }

    std::string CmdParser::consume_only_remaining_arg(StringView command_name)
    {
        const bool had_switches = reject_leftover_switches();
        std::vector<size_t> leftovers;
        for (size_t idx = 0; idx < arguments.size(); ++idx)
        {
            if (!arguments[idx].consumed)
            {
                leftovers.push_back(idx);
            }
        }

        if (leftovers.size() != 1)
        {
            errors.push_back(msg::format_error(msgNonOneRemainingArgs, msg::command_name = command_name));
            if (!leftovers.empty())
            {
                arguments[leftovers[0]].consumed = true;
                reject_leftover_arguments(leftovers[0] + 1);
            }

            return std::string{};
        }

        auto& selected = arguments[leftovers[0]];
        selected.consumed = true;
        if (had_switches)
        {
            return std::string{};
        }

        return selected.original;
    }

    void CmdParser::append_options_table(LocalizedString& results) const
    {
        HelpTableFormatter table;
        table.header(msg::format(msgOptions));
        for (auto&& entry : options_table)
        {
            table.format(entry.first, entry.second);
        }

        results.append_raw(table.m_str);
    }

    void CmdParser::exit_with_errors(LocalizedString example)
    {
        if (errors.empty())
        {
            return;
        }

        for (auto&& error : errors)
        {
            stderr_sink.println(Color::error, error);
        }

        example.append_raw('\n');
        append_options_table(example);
        stderr_sink.println(example);
        Checks::exit_with_code(DNACQ_LINE_INFO, 1);
    }
}
