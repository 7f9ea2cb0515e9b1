#pragma once

#include <dnacq/base/fwd/files.h>

#include <dnacq/base/expected.h>
#include <dnacq/base/stringview.h>

#include <dnacq/installpaths.h>

#include <string>
#include <vector>

namespace dnacq
{
    // Durable record of what is installed below an install root. The marker files encode three states:
    //   no begin marker, no lock file: nothing installed
    //   begin marker present: an install is running or was interrupted
    //   lock file only: the listed versions are installed
    // Every write goes to a sibling temporary file which is then renamed over the target.
    struct InstallStateStore
    {
        InstallStateStore(const Filesystem& fs, InstallPaths paths);

        const InstallPaths& paths() const noexcept { return m_paths; }

        // Versions recorded in the lock file, in the order they were installed. No lock file means none.
        ExpectedL<std::vector<std::string>> read_installed_versions() const;
        // Appends version to the lock file unless it is already recorded.
        ExpectedL<Unit> mark_installed(StringView version) const;

        bool has_begin_marker() const;
        // The version an unfinished install was started for, or empty if the marker is absent or unreadable.
        std::string read_begin_marker() const;
        ExpectedL<Unit> begin_install(StringView version) const;
        ExpectedL<Unit> clear_begin_marker() const;

        bool has_lock_file() const;
        bool has_installation_directory() const;

        // Deletes the installation directory, then the begin marker, then the lock file. Anything already absent is
        // skipped.
        ExpectedL<Unit> reset() const;

    private:
        ExpectedL<Unit> write_marker(const Path& target, StringView contents) const;

        const Filesystem& m_fs;
        InstallPaths m_paths;
    };
}
