#pragma once

#include <dnacq/base/fwd/files.h>

#include <dnacq/base/expected.h>
#include <dnacq/base/lineinfo.h>
#include <dnacq/base/path.h>
#include <dnacq/base/stringview.h>

#include <initializer_list>
#include <string>
#include <system_error>
#include <vector>

namespace dnacq
{
    // Each operation comes in up to three flavors: one reporting through std::error_code, one taking a LineInfo that
    // exits the program on failure, and a try_ form returning ExpectedL.
    struct ReadOnlyFilesystem
    {
        virtual std::string read_contents(const Path& file_path, std::error_code& ec) const = 0;
        std::string read_contents(const Path& file_path, LineInfo li) const;
        ExpectedL<std::string> try_read_contents(const Path& file_path) const;

        // Does not follow symlinks.
        virtual FileType symlink_status(const Path& target, std::error_code& ec) const = 0;

        // A dangling symlink exists.
        bool exists(const Path& target, std::error_code& ec) const;
        bool exists(const Path& target, LineInfo li) const;

        // Follow symlinks; any failure reads as false.
        virtual bool is_directory(const Path& target) const = 0;
        virtual bool is_regular_file(const Path& target) const = 0;

        virtual Path current_path(std::error_code&) const = 0;
        Path current_path(LineInfo li) const;
    };

    struct Filesystem : ReadOnlyFilesystem
    {
        // Creates or truncates.
        virtual void write_contents(const Path& file_path, StringView data, std::error_code& ec) const = 0;
        void write_contents(const Path& file_path, StringView data, LineInfo li) const;

        virtual void write_contents_and_dirs(const Path& file_path, StringView data, std::error_code& ec) const = 0;
        void write_contents_and_dirs(const Path& file_path, StringView data, LineInfo li) const;

        // Writes data to temp_name beside file_path, then renames it over file_path. Readers observe either the old
        // or the new contents, never a partial write.
        ExpectedL<Unit> try_write_rename_contents(const Path& file_path, const Path& temp_name, StringView data) const;

        virtual void rename(const Path& old_path, const Path& new_path, std::error_code& ec) const = 0;

        // Returns whether target existed. An absent target is not an error.
        virtual bool remove(const Path& target, std::error_code& ec) const = 0;
        ExpectedL<bool> try_remove(const Path& target) const;

        // Removes base and everything below it. An absent base is not an error. On failure, failure_point names the
        // entry that could not be removed.
        virtual void remove_all(const Path& base, std::error_code& ec, Path& failure_point) const = 0;
        void remove_all(const Path& base, LineInfo li) const;
        ExpectedL<Unit> try_remove_all(const Path& base) const;

        // Returns whether anything was created.
        virtual bool create_directories(const Path& new_directory, std::error_code& ec) const = 0;
        bool create_directories(const Path& new_directory, LineInfo li) const;
        ExpectedL<bool> try_create_directories(const Path& new_directory) const;
    };

    extern const Filesystem& real_filesystem;

    // call_name("arg1", "arg2"): message
    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args);
    [[noreturn]] void exit_filesystem_call_error(LineInfo li,
                                                 const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args);
}
