#include <dnacq-test/util.h>

#include <dnacq/base/message_sinks.h>
#include <dnacq/base/messages.h>

using namespace dnacq;

TEST_CASE ("messages are formatted with their arguments", "[messages]")
{
    CHECK(msg::format(msgAcquisitionFailed, msg::version = "8.0.100").data() == "Failed to download .NET 8.0.100:");
    CHECK(msg::format(msgInstallerExitedWithCode, msg::exit_code = 127).data() ==
          "the install script exited with code 127:");
    CHECK(msg::format(msgEnvVarMustBeAbsolutePath, msg::path = "relative", msg::env_var = "$XDG_CACHE_HOME")
              .data() == "$XDG_CACHE_HOME (relative) was not an absolute path");
}

TEST_CASE ("error and warning prefixes", "[messages]")
{
    CHECK(msg::format_error(msgVersionRequired).data() == "error: a version is required");
    CHECK(msg::format_warning(LocalizedString::from_raw("careful")).data() == "warning: careful");
}

TEST_CASE ("localized strings compare by content", "[messages]")
{
    auto a = LocalizedString::from_raw("same");
    auto b = LocalizedString::from_raw("same");
    CHECK(a == b);
    CHECK(a != LocalizedString::from_raw("different"));

    LocalizedString appended;
    appended.append_raw("a").append_raw('\n').append(msgVersionRequired);
    CHECK(appended.data() == "a\na version is required");
}

TEST_CASE ("message lines merge segments of the same color", "[messages]")
{
    MessageLine line;
    line.print(Color::error, "Error");
    line.print(Color::error, "!");
    line.print(" details");
    REQUIRE(line.get_segments().size() == 2);
    CHECK(line.get_segments()[0].text == "Error!");
    CHECK(line.to_string() == "Error! details");
}
