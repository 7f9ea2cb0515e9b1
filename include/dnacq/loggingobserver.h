#pragma once

#include <dnacq/base/fwd/files.h>

#include <dnacq/base/expected.h>
#include <dnacq/base/path.h>

#include <dnacq/eventstream.h>

#include <mutex>
#include <string>

namespace dnacq
{
    // Accumulates a timestamped entry per event and writes the whole log to log_file_path on flush() or destruction.
    struct LoggingObserver final : IEventStreamObserver
    {
        LoggingObserver(const Filesystem& fs, Path log_file_path);
        LoggingObserver(const LoggingObserver&) = delete;
        LoggingObserver& operator=(const LoggingObserver&) = delete;
        ~LoggingObserver();

        virtual void post(const AcquisitionEvent& event) override;

        // Rewrites the log file with everything recorded so far.
        ExpectedL<Unit> flush();

        const Path& log_file_path() const noexcept { return m_log_file_path; }
        std::string contents() const;

    private:
        void write_line(StringView line);

        const Filesystem& m_fs;
        Path m_log_file_path;
        mutable std::mutex m_mtx;
        std::string m_log;
        bool m_dirty = false;
    };
}
