#include <dnacq/base/files.h>
#include <dnacq/base/strings.h>
#include <dnacq/base/system.debug.h>

#include <dnacq/installstate.h>

#include <algorithm>

namespace dnacq
{
    InstallStateStore::InstallStateStore(const Filesystem& fs, InstallPaths paths) : m_fs(fs), m_paths(std::move(paths))
    {
    }

    ExpectedL<std::vector<std::string>> InstallStateStore::read_installed_versions() const
    {
        const auto lock_file = m_paths.lock_file();
        if (!m_fs.is_regular_file(lock_file))
        {
            return std::vector<std::string>{};
        }

        return m_fs.try_read_contents(lock_file).map(
            [](const std::string& contents) { return Strings::split(contents, InstallLockSeparator); });
    }

    ExpectedL<Unit> InstallStateStore::mark_installed(StringView version) const
    {
        auto maybe_installed = read_installed_versions();
        auto installed = maybe_installed.get();
        if (!installed)
        {
            return std::move(maybe_installed).error();
        }

        if (std::find(installed->begin(), installed->end(), version) != installed->end())
        {
            Debug::println(version, " is already recorded in ", m_paths.lock_file());
            return Unit{};
        }

        installed->push_back(version.to_string());
        Debug::println("recording ", version, " as installed");
        return write_marker(m_paths.lock_file(), Strings::join(InstallLockSeparatorText, *installed));
    }

    bool InstallStateStore::has_begin_marker() const
    {
        std::error_code ec;
        return m_fs.exists(m_paths.begin_marker(), ec);
    }

    std::string InstallStateStore::read_begin_marker() const
    {
        std::error_code ec;
        auto contents = m_fs.read_contents(m_paths.begin_marker(), ec);
        if (ec)
        {
            return std::string{};
        }

        return Strings::trim(contents).to_string();
    }

    ExpectedL<Unit> InstallStateStore::begin_install(StringView version) const
    {
        Debug::println("writing begin marker for ", version);
        return write_marker(m_paths.begin_marker(), version);
    }

    ExpectedL<Unit> InstallStateStore::clear_begin_marker() const
    {
        Debug::println("clearing begin marker");
        return m_fs.try_remove(m_paths.begin_marker()).map([](bool) { return Unit{}; });
    }

    bool InstallStateStore::has_lock_file() const { return m_fs.is_regular_file(m_paths.lock_file()); }

    bool InstallStateStore::has_installation_directory() const
    {
        return m_fs.is_directory(m_paths.installation_directory());
    }

    ExpectedL<Unit> InstallStateStore::reset() const
    {
        Debug::println("resetting install state under ", m_paths.root());
        auto removed_directory = m_fs.try_remove_all(m_paths.installation_directory());
        if (!removed_directory)
        {
            return std::move(removed_directory).error();
        }

        auto removed_marker = m_fs.try_remove(m_paths.begin_marker());
        if (!removed_marker)
        {
            return std::move(removed_marker).error();
        }

        auto removed_lock = m_fs.try_remove(m_paths.lock_file());
        if (!removed_lock)
        {
            return std::move(removed_lock).error();
        }

        return Unit{};
    }

    ExpectedL<Unit> InstallStateStore::write_marker(const Path& target, StringView contents) const
    {
        auto created = m_fs.try_create_directories(m_paths.root());
        if (!created)
        {
            return std::move(created).error();
        }

        // the temporary name is a sibling of target, not a path
        return m_fs.try_write_rename_contents(target, Strings::concat(target.filename(), ".tmp"), contents);
    }
}
