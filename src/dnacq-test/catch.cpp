#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <dnacq/base/checks.h>
#include <dnacq/base/system.debug.h>
#include <dnacq/base/system.h>

namespace dnacq::Checks
{
    void on_final_cleanup_and_exit() { }
}

int main(int argc, char** argv)
{
    if (dnacq::get_environment_variable("DNACQ_DEBUG").value_or("") == "1") dnacq::Debug::g_debugging = true;
    // Tests always pass explicit roots; make sure nothing falls back to the user's real install root
    dnacq::set_environment_variable("DNACQ_INSTALL_ROOT", "DNACQ_TESTS_SHOULD_NOT_USE_DNACQ_INSTALL_ROOT");

    return Catch::Session().run(argc, argv);
}
