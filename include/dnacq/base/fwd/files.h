#pragma once

#define DNACQ_PREFERRED_SEPARATOR "/"

namespace dnacq
{
    enum class FileType
    {
        none,
        not_found,
        regular,
        directory,
        symlink,
        unknown,
    };

    struct Path;
    struct ReadOnlyFilesystem;
    struct Filesystem;
}
