#pragma once

#include <catch2/catch.hpp>

#include <dnacq/base/files.h>
#include <dnacq/base/fmt.h>
#include <dnacq/base/messages.h>
#include <dnacq/base/optional.h>
#include <dnacq/base/path.h>
#include <dnacq/base/strings.h>

#include <string>

#define CHECK_EC(ec)                                                                                                   \
    do                                                                                                                 \
    {                                                                                                                  \
        if (ec)                                                                                                        \
        {                                                                                                              \
            FAIL(ec.message());                                                                                        \
        }                                                                                                              \
    } while (0)

namespace Catch
{
    template<>
    struct StringMaker<dnacq::LocalizedString>
    {
        static std::string convert(const dnacq::LocalizedString& value) { return "LL\"" + value.data() + "\""; }
    };

    template<>
    struct StringMaker<dnacq::Path>
    {
        static std::string convert(const dnacq::Path& value) { return "\"" + value.native() + "\""; }
    };

    template<class T>
    struct StringMaker<dnacq::Optional<T>>
    {
        static std::string convert(const dnacq::Optional<T>& value)
        {
            if (auto v = value.get())
            {
                return StringMaker<T>::convert(*v);
            }

            return "nullopt";
        }
    };
}

namespace dnacq::Test
{
    // /tmp/dnacq-test, or %TEMP%\dnacq-test on Windows
    const Path& base_temporary_directory() noexcept;

    // A fresh, empty directory below base_temporary_directory() unique to this process and name.
    Path make_clean_temporary_directory(StringView name);

    // Writes a shell script with the given body and marks it executable.
    void write_executable_script(const Path& script_path, StringView body);
}
