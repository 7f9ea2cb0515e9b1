#include <dnacq-test/util.h>

#include <dnacq/base/cmd-parser.h>

#include <string>
#include <vector>

using namespace dnacq;

namespace
{
    bool any_error_mentions(const CmdParser& parser, StringView needle)
    {
        for (auto&& error : parser.get_errors())
        {
            if (Strings::search(error, needle) != StringView{error}.end())
            {
                return true;
            }
        }

        return false;
    }
}

TEST_CASE ("help table formatter aligns the second column", "[cmd_parser]")
{
    HelpTableFormatter uut;
    uut.header("Options");
    uut.format("--debug", "Prints diagnostic information");
    uut.format("--a-really-long-option-name=...", "shorty");
    uut.blank();
    uut.example("dnacq acquire 8.0.100");
    uut.text("this is some text");

    const std::string expected = "Options:\n"
                                 "  --debug                Prints diagnostic information\n"
                                 "  --a-really-long-option-name=...\n"
                                 "                         shorty\n"
                                 "\n"
                                 "dnacq acquire 8.0.100\n"
                                 "this is some text";
    CHECK(uut.m_str == expected);
}

TEST_CASE ("help table formatter wraps long text", "[cmd_parser]")
{
    HelpTableFormatter uut;
    uut.text("aaaa bbbb cccc", 0);
    CHECK(uut.m_str == "aaaa bbbb cccc");

    HelpTableFormatter wrapped;
    std::string long_text(60, 'x');
    long_text.push_back(' ');
    long_text.append(60, 'y');
    wrapped.text(long_text, 4);
    CHECK(wrapped.m_str == std::string(60, 'x') + "\n    " + std::string(60, 'y'));
}

TEST_CASE ("arguments can be converted from argc/argv", "[cmd_parser]")
{
    const char* argv[] = {"dnacq", "acquire", "8.0.100"};
    CHECK(convert_argc_argv_to_arguments(3, argv) == std::vector<std::string>{"acquire", "8.0.100"});
}

TEST_CASE ("switches", "[cmd_parser]")
{
    {
        CmdParser uut{std::vector<std::string>{"--debug", "acquire"}};
        bool debug = false;
        CHECK(uut.parse_switch("debug", debug));
        CHECK(debug);
        CHECK(uut.get_errors().empty());
        CHECK(uut.get_remaining_args() == std::vector<std::string>{"acquire"});
    }

    {
        CmdParser uut{std::vector<std::string>{"--no-debug"}};
        bool debug = true;
        CHECK(uut.parse_switch("debug", debug));
        CHECK_FALSE(debug);
    }

    {
        CmdParser uut{std::vector<std::string>{"--DEBUG", "--debug"}};
        bool debug = false;
        CHECK(uut.parse_switch("debug", debug));
        CHECK(debug);
        REQUIRE(uut.get_errors().size() == 1);
        CHECK(any_error_mentions(uut, "debug"));
    }

    {
        CmdParser uut{std::vector<std::string>{"--debugging"}};
        bool debug = false;
        CHECK_FALSE(uut.parse_switch("debug", debug));
        CHECK_FALSE(debug);
    }
}

TEST_CASE ("options", "[cmd_parser]")
{
    {
        CmdParser uut{std::vector<std::string>{"--install-root=/Some/Root", "acquire"}};
        Optional<std::string> root;
        CHECK(uut.parse_option("install-root", root));
        CHECK(root == "/Some/Root");
        CHECK(uut.get_errors().empty());
    }

    {
        CmdParser uut{std::vector<std::string>{"--install-root", "/some/root", "acquire"}};
        Optional<std::string> root;
        CHECK(uut.parse_option("install-root", root));
        CHECK(root == "/some/root");
        CHECK(uut.get_remaining_args() == std::vector<std::string>{"acquire"});
    }

    {
        CmdParser uut{std::vector<std::string>{"--install-root=a", "--install-root=b"}};
        Optional<std::string> root;
        CHECK(uut.parse_option("install-root", root));
        CHECK(root == "b");
        REQUIRE(uut.get_errors().size() == 1);
    }

    {
        CmdParser uut{std::vector<std::string>{"--install-root"}};
        Optional<std::string> root;
        CHECK_FALSE(uut.parse_option("install-root", root));
        CHECK_FALSE(root.has_value());
        REQUIRE(uut.get_errors().size() == 1);
        CHECK(any_error_mentions(uut, "install-root"));
    }

    {
        CmdParser uut{std::vector<std::string>{"--log-file", "--debug"}};
        Optional<std::string> log_file;
        CHECK_FALSE(uut.parse_option("log-file", log_file));
        REQUIRE(uut.get_errors().size() == 1);
        CHECK(any_error_mentions(uut, "--log-file=--debug"));
    }

    {
        CmdParser uut{std::vector<std::string>{"--log-file=--debug"}};
        Optional<std::string> log_file;
        CHECK(uut.parse_option("log-file", log_file));
        CHECK(log_file == "--debug");
        CHECK(uut.get_errors().empty());
    }
}

TEST_CASE ("command-like arguments", "[cmd_parser]")
{
    {
        CmdParser uut{std::vector<std::string>{"--unknown", "ACQUIRE", "8.0.100"}};
        auto command = uut.extract_first_command_like_arg_lowercase();
        CHECK(command == "acquire");
        CHECK(uut.get_remaining_args() == std::vector<std::string>{"--unknown", "8.0.100"});
    }

    for (auto&& help : {"--help", "-h", "-?"})
    {
        CmdParser uut{std::vector<std::string>{help}};
        CHECK(uut.extract_first_command_like_arg_lowercase() == "help");
    }

    {
        CmdParser uut{std::vector<std::string>{"--debug"}};
        CHECK_FALSE(uut.extract_first_command_like_arg_lowercase().has_value());
    }
}

TEST_CASE ("remaining argument enforcement", "[cmd_parser]")
{
    {
        CmdParser uut{std::vector<std::string>{}};
        uut.enforce_no_remaining_args("uninstall-all");
        CHECK(uut.get_errors().empty());
    }

    {
        CmdParser uut{std::vector<std::string>{"extra", "--bogus"}};
        uut.enforce_no_remaining_args("uninstall-all");
        REQUIRE(uut.get_errors().size() == 3);
        CHECK(any_error_mentions(uut, "--bogus"));
        CHECK(any_error_mentions(uut, "uninstall-all"));
        CHECK(any_error_mentions(uut, "extra"));
    }

    {
        CmdParser uut{std::vector<std::string>{"8.0.100"}};
        CHECK(uut.consume_only_remaining_arg("acquire") == "8.0.100");
        CHECK(uut.get_errors().empty());
    }

    {
        CmdParser uut{std::vector<std::string>{}};
        CHECK(uut.consume_only_remaining_arg("acquire") == "");
        REQUIRE(uut.get_errors().size() == 1);
        CHECK(any_error_mentions(uut, "acquire"));
    }

    {
        CmdParser uut{std::vector<std::string>{"3.1.0", "8.0.100"}};
        CHECK(uut.consume_only_remaining_arg("acquire") == "");
        REQUIRE(uut.get_errors().size() == 2);
        CHECK(any_error_mentions(uut, "8.0.100"));
    }

    {
        CmdParser uut{std::vector<std::string>{"8.0.100", "--version=3"}};
        CHECK(uut.consume_only_remaining_arg("acquire") == "");
        REQUIRE(uut.get_errors().size() == 1);
        CHECK(any_error_mentions(uut, "--version=3"));
    }
}

TEST_CASE ("options table lists registered help", "[cmd_parser]")
{
    CmdParser uut{std::vector<std::string>{}};
    bool debug = false;
    Optional<std::string> root;
    uut.parse_switch("debug", debug, LocalizedString::from_raw("debug help"));
    uut.parse_option("install-root", root, LocalizedString::from_raw("root help"));

    LocalizedString table;
    uut.append_options_table(table);
    CHECK(table.data() == "Options:\n"
                          "  --debug                debug help\n"
                          "  --install-root=...     root help\n");
}
