#include <dnacq/base/checks.h>
#include <dnacq/base/files.h>
#include <dnacq/base/strings.h>
#include <dnacq/base/system.debug.h>

#include <errno.h>
#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <memory>
#include <utility>

namespace
{
    using namespace dnacq;

    std::error_code errno_code() noexcept { return std::error_code(errno, std::generic_category()); }

    // Runs call(ec); exits with a diagnostic naming call_name and args if it fails.
    template<class Call>
    auto value_or_exit_fs(LineInfo li, StringView call_name, std::initializer_list<StringView> args, Call call)
    {
        std::error_code ec;
        auto result = call(ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, call_name, args);
        }

        return result;
    }

    // Runs call(ec); a failure becomes the error of the returned ExpectedL.
    template<class Call>
    auto expected_fs(StringView call_name, std::initializer_list<StringView> args, Call call)
        -> ExpectedL<decltype(call(std::declval<std::error_code&>()))>
    {
        std::error_code ec;
        auto result = call(ec);
        if (ec)
        {
            return format_filesystem_call_error(ec, call_name, args);
        }

        return result;
    }

    struct FileCloser
    {
        void operator()(FILE* f) const noexcept { ::fclose(f); }
    };

    using OwnedFile = std::unique_ptr<FILE, FileCloser>;

    bool stat_mode(const Path& target, mode_t& mode) noexcept
    {
        struct stat s;
        if (::stat(target.c_str(), &s) != 0)
        {
            return false;
        }

        mode = s.st_mode;
        return true;
    }

    struct PosixFilesystem final : Filesystem
    {
        std::string read_contents(const Path& file_path, std::error_code& ec) const override
        {
            ec.clear();
            OwnedFile file{::fopen(file_path.c_str(), "rb")};
            if (!file)
            {
                ec = errno_code();
                return std::string();
            }

            std::string output;
            char buffer[4096];
            size_t read_count;
            do
            {
                read_count = ::fread(buffer, 1, sizeof(buffer), file.get());
                output.append(buffer, read_count);
            } while (read_count == sizeof(buffer));

            if (::ferror(file.get()))
            {
                ec = std::make_error_code(std::errc::io_error);
                output.clear();
            }

            return output;
        }

        FileType symlink_status(const Path& target, std::error_code& ec) const override
        {
            ec.clear();
            struct stat s;
            if (::lstat(target.c_str(), &s) != 0)
            {
                if (errno == ENOENT || errno == ENOTDIR)
                {
                    return FileType::not_found;
                }

                ec = errno_code();
                return FileType::none;
            }

            if (S_ISREG(s.st_mode)) return FileType::regular;
            if (S_ISDIR(s.st_mode)) return FileType::directory;
            if (S_ISLNK(s.st_mode)) return FileType::symlink;
            return FileType::unknown;
        }

        bool is_directory(const Path& target) const override
        {
            mode_t mode;
            return stat_mode(target, mode) && S_ISDIR(mode);
        }

        bool is_regular_file(const Path& target) const override
        {
            mode_t mode;
            return stat_mode(target, mode) && S_ISREG(mode);
        }

        Path current_path(std::error_code& ec) const override
        {
            auto cwd = std::filesystem::current_path(ec);
            if (ec)
            {
                return Path{};
            }

            return Path{cwd.native()};
        }

        void write_contents(const Path& file_path, StringView data, std::error_code& ec) const override
        {
            ec.clear();
            OwnedFile file{::fopen(file_path.c_str(), "wb")};
            const bool written =
                file && (data.empty() || ::fwrite(data.data(), 1, data.size(), file.get()) == data.size());
            const bool ok = written && ::fflush(file.get()) == 0;
            if (!ok)
            {
                ec = errno_code();
            }
        }

        void write_contents_and_dirs(const Path& file_path, StringView data, std::error_code& ec) const override
        {
            ec.clear();
            const auto parent = file_path.parent_path();
            if (!parent.empty())
            {
                (void)this->create_directories(parent, ec);
            }

            if (!ec)
            {
                this->write_contents(file_path, data, ec);
            }
        }

        void rename(const Path& old_path, const Path& new_path, std::error_code& ec) const override
        {
            ec.clear();
            if (::rename(old_path.c_str(), new_path.c_str()) != 0)
            {
                ec = errno_code();
            }
        }

        bool remove(const Path& target, std::error_code& ec) const override
        {
            ec.clear();
            if (::unlink(target.c_str()) == 0) return true;
            if (errno == ENOENT) return false;
            if ((errno == EISDIR || errno == EPERM) && ::rmdir(target.c_str()) == 0) return true;

            ec = errno_code();
            return false;
        }

        void remove_all(const Path& base, std::error_code& ec, Path& failure_point) const override
        {
            failure_point = Path{};
            std::filesystem::remove_all(std::filesystem::path(base.native()), ec);
            if (ec)
            {
                Debug::println("remove_all(", base, ") failed: ", ec.message());
                failure_point = base;
            }
        }

        bool create_directories(const Path& new_directory, std::error_code& ec) const override
        {
            return std::filesystem::create_directories(std::filesystem::path(new_directory.native()), ec);
        }
    };
}

namespace dnacq
{
    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args)
    {
        std::string text = call_name.to_string();
        text.push_back('(');
        if (args.size() != 0)
        {
            Strings::append(text, '"', Strings::join("\", \"", args), '"');
        }

        Strings::append(text, "): ", ec.message());
        return LocalizedString::from_raw(std::move(text));
    }

    void exit_filesystem_call_error(LineInfo li,
                                    const std::error_code& ec,
                                    StringView call_name,
                                    std::initializer_list<StringView> args)
    {
        Checks::msg_exit_with_message(li, format_filesystem_call_error(ec, call_name, args));
    }

    std::string ReadOnlyFilesystem::read_contents(const Path& file_path, LineInfo li) const
    {
        return value_or_exit_fs(
            li, "read_contents", {file_path}, [&](std::error_code& ec) { return read_contents(file_path, ec); });
    }

    ExpectedL<std::string> ReadOnlyFilesystem::try_read_contents(const Path& file_path) const
    {
        return expected_fs("read_contents", {file_path}, [&](std::error_code& ec) {
            return read_contents(file_path, ec);
        });
    }

    bool ReadOnlyFilesystem::exists(const Path& target, std::error_code& ec) const
    {
        const auto type = symlink_status(target, ec);
        return type != FileType::not_found && type != FileType::none;
    }

    bool ReadOnlyFilesystem::exists(const Path& target, LineInfo li) const
    {
        return value_or_exit_fs(li, "exists", {target}, [&](std::error_code& ec) { return exists(target, ec); });
    }

    Path ReadOnlyFilesystem::current_path(LineInfo li) const
    {
        return value_or_exit_fs(li, "current_path", {}, [&](std::error_code& ec) { return current_path(ec); });
    }

    void Filesystem::write_contents(const Path& file_path, StringView data, LineInfo li) const
    {
        value_or_exit_fs(li, "write_contents", {file_path}, [&](std::error_code& ec) {
            write_contents(file_path, data, ec);
            return Unit{};
        });
    }

    void Filesystem::write_contents_and_dirs(const Path& file_path, StringView data, LineInfo li) const
    {
        value_or_exit_fs(li, "write_contents_and_dirs", {file_path}, [&](std::error_code& ec) {
            write_contents_and_dirs(file_path, data, ec);
            return Unit{};
        });
    }

    ExpectedL<Unit> Filesystem::try_write_rename_contents(const Path& file_path,
                                                         const Path& temp_name,
                                                         StringView data) const
    {
        auto temp_path = file_path;
        temp_path.replace_filename(temp_name);
        return expected_fs("write_rename_contents", {file_path, temp_name}, [&](std::error_code& ec) {
            write_contents(temp_path, data, ec);
            if (!ec)
            {
                rename(temp_path, file_path, ec);
            }

            if (ec)
            {
                std::error_code cleanup_ec;
                (void)remove(temp_path, cleanup_ec);
            }

            return Unit{};
        });
    }

    ExpectedL<bool> Filesystem::try_remove(const Path& target) const
    {
        return expected_fs("remove", {target}, [&](std::error_code& ec) { return remove(target, ec); });
    }

    void Filesystem::remove_all(const Path& base, LineInfo li) const
    {
        std::error_code ec;
        Path failure_point;
        remove_all(base, ec, failure_point);
        if (ec)
        {
            Checks::msg_exit_with_error(li,
                                        msgFailedToDeleteDueToFile,
                                        msg::value = base,
                                        msg::path = failure_point,
                                        msg::error_msg = ec.message());
        }
    }

    ExpectedL<Unit> Filesystem::try_remove_all(const Path& base) const
    {
        std::error_code ec;
        Path failure_point;
        remove_all(base, ec, failure_point);
        if (!ec)
        {
            return Unit{};
        }

        return msg::format(msgFailedToDeleteDueToFile,
                           msg::value = base,
                           msg::path = failure_point,
                           msg::error_msg = ec.message());
    }

    bool Filesystem::create_directories(const Path& new_directory, LineInfo li) const
    {
        return value_or_exit_fs(li, "create_directories", {new_directory}, [&](std::error_code& ec) {
            return create_directories(new_directory, ec);
        });
    }

    ExpectedL<bool> Filesystem::try_create_directories(const Path& new_directory) const
    {
        return expected_fs("create_directories", {new_directory}, [&](std::error_code& ec) {
            return create_directories(new_directory, ec);
        });
    }

    static const PosixFilesystem posix_filesystem_instance{};
    const Filesystem& real_filesystem = posix_filesystem_instance;
}
