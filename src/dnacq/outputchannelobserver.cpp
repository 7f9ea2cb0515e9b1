#include <dnacq/base/message_sinks.h>
#include <dnacq/base/strings.h>

#include <dnacq/outputchannelobserver.h>

#include <algorithm>

namespace dnacq
{
    void OutputChannelObserver::post(const AcquisitionEvent& event)
    {
        switch (event.kind)
        {
            case AcquisitionEventKind::Started:
                m_in_progress.push_back(event.version);
                if (m_in_progress.size() > 1)
                {
                    m_sink.println(msgAcquisitionConcurrentStart, msg::version = event.version);
                }

                m_sink.println(msgAcquisitionDownloading, msg::value = Strings::join(", ", m_in_progress));
                break;
            case AcquisitionEventKind::Completed:
                m_sink.println(Color::success, msgAcquisitionDone);
                m_sink.println(msgAcquisitionExecutablePath, msg::version = event.version, msg::path = event.path);
                version_done(event.version);
                print_still_downloading();
                break;
            case AcquisitionEventKind::InstallError:
            case AcquisitionEventKind::ScriptError:
            case AcquisitionEventKind::UnexpectedError:
                m_sink.println(Color::error, msgAcquisitionErrorHeader);
                m_sink.println(msgAcquisitionFailed, msg::version = event.version);
                m_sink.println(LocalizedString::from_raw(event.detail));
                version_done(event.version);
                print_still_downloading();
                break;
        }
    }

    void OutputChannelObserver::version_done(const std::string& version)
    {
        auto it = std::find(m_in_progress.begin(), m_in_progress.end(), version);
        if (it != m_in_progress.end())
        {
            m_in_progress.erase(it);
        }
    }

    void OutputChannelObserver::print_still_downloading()
    {
        if (!m_in_progress.empty())
        {
            m_sink.println(msgAcquisitionStillDownloading,
                           msg::value = Strings::join(", ", m_in_progress, [](const std::string& v) {
                               return Strings::concat('\'', v, '\'');
                           }));
        }
    }
}
