#include <dnacq-test/util.h>

#include <dnacq/base/strings.h>

#include <string>
#include <vector>

using namespace dnacq;

TEST_CASE ("split by char", "[strings]")
{
    using Strings::split;
    using result_t = std::vector<std::string>;
    REQUIRE(split("", '|').empty());
    REQUIRE(split("||||", '|').empty());
    REQUIRE(split("|3.1.0||8.0.100|", '|') == result_t{"3.1.0", "8.0.100"});
    REQUIRE(split("3.1.0|8.0.100", '|') == result_t{"3.1.0", "8.0.100"});
    REQUIRE(split("no delimiters", '|') == result_t{"no delimiters"});
}

TEST_CASE ("split_lines", "[strings]")
{
    using Strings::split_lines;
    using result_t = std::vector<std::string>;
    REQUIRE(split_lines("").empty());
    REQUIRE(split_lines("a") == result_t{"a"});
    REQUIRE(split_lines("a\n") == result_t{"a"});
    REQUIRE(split_lines("a\r\nb") == result_t{"a", "b"});
    REQUIRE(split_lines("a\n\nb\n") == result_t{"a", "", "b"});
}

TEST_CASE ("join", "[strings]")
{
    std::vector<std::string> versions{"3.1.0", "8.0.100"};
    CHECK(Strings::join(", ", versions) == "3.1.0, 8.0.100");
    CHECK(Strings::join("|", std::vector<std::string>{}) == "");
    CHECK(Strings::join(", ", versions, [](const std::string& v) { return Strings::concat('\'', v, '\''); }) ==
          "'3.1.0', '8.0.100'");
}

TEST_CASE ("trim", "[strings]")
{
    CHECK(Strings::trim("  8.0.100\r\n") == "8.0.100");
    CHECK(Strings::trim("   ") == "");
    CHECK(Strings::trim_end("  error text \n") == "  error text");
}

TEST_CASE ("case insensitive comparisons", "[strings]")
{
    CHECK(Strings::case_insensitive_ascii_equals("LATEST", "latest"));
    CHECK(Strings::case_insensitive_ascii_equals("", ""));
    CHECK_FALSE(Strings::case_insensitive_ascii_equals("latest", "lates"));
    CHECK(Strings::ascii_to_lowercase("Uninstall-ALL") == "uninstall-all");
}

TEST_CASE ("find_first_of and search", "[strings]")
{
    StringView version = "8.0|1";
    CHECK(Strings::find_first_of(version, "|\r\n") == version.begin() + 3);
    StringView clean = "8.0.100";
    CHECK(Strings::find_first_of(clean, "|\r\n") == clean.end());
    StringView haystack = "hello world";
    CHECK(Strings::search(haystack, "world") == haystack.begin() + 6);
    CHECK(Strings::search(haystack, "nope") == haystack.end());
}

TEST_CASE ("concat mixes strings, characters and numbers", "[strings]")
{
    CHECK(Strings::concat("exit ", 127, ' ', std::string("done")) == "exit 127 done");
}
