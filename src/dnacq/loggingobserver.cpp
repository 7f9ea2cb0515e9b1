#include <dnacq/base/chrono.h>
#include <dnacq/base/files.h>
#include <dnacq/base/strings.h>
#include <dnacq/base/system.debug.h>

#include <dnacq/loggingobserver.h>

namespace dnacq
{
    LoggingObserver::LoggingObserver(const Filesystem& fs, Path log_file_path)
        : m_fs(fs), m_log_file_path(std::move(log_file_path))
    {
    }

    LoggingObserver::~LoggingObserver()
    {
        auto flushed = flush();
        if (!flushed)
        {
            msg::println_warning(flushed.error());
        }
    }

    void LoggingObserver::post(const AcquisitionEvent& event)
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        write_line(Strings::concat(CTime::now_string(), ' ', to_string_literal(event.kind)));
        write_line(event.version);
        if (!event.path.empty())
        {
            write_line(event.path);
        }

        if (!event.detail.empty())
        {
            write_line(event.detail);
        }

        write_line(StringView{});
        m_dirty = true;
    }

    ExpectedL<Unit> LoggingObserver::flush()
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (!m_dirty)
        {
            return Unit{};
        }

        std::error_code ec;
        m_fs.write_contents_and_dirs(m_log_file_path, m_log, ec);
        if (ec)
        {
            return format_filesystem_call_error(ec, "write_contents_and_dirs", {m_log_file_path});
        }

        Debug::println("wrote acquisition log to ", m_log_file_path);
        m_dirty = false;
        return Unit{};
    }

    std::string LoggingObserver::contents() const
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        return m_log;
    }

    void LoggingObserver::write_line(StringView line)
    {
        m_log.append(line.data(), line.size());
        m_log.push_back('\n');
    }
}
