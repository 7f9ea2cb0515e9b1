#include <dnacq/base/checks.h>
#include <dnacq/base/system.debug.h>

#include <dnacq/eventstream.h>

#include <algorithm>

namespace dnacq
{
    StringLiteral to_string_literal(AcquisitionEventKind kind) noexcept
    {
        switch (kind)
        {
            case AcquisitionEventKind::Started: return "AcquisitionStarted";
            case AcquisitionEventKind::Completed: return "AcquisitionCompleted";
            case AcquisitionEventKind::InstallError: return "AcquisitionInstallError";
            case AcquisitionEventKind::ScriptError: return "AcquisitionScriptError";
            case AcquisitionEventKind::UnexpectedError: return "AcquisitionUnexpectedError";
            default: Checks::unreachable(DNACQ_LINE_INFO);
        }
    }

    AcquisitionEvent AcquisitionEvent::started(StringView version)
    {
        return AcquisitionEvent{AcquisitionEventKind::Started, version.to_string(), Path{}, std::string{}};
    }

    AcquisitionEvent AcquisitionEvent::completed(StringView version, const Path& path)
    {
        return AcquisitionEvent{AcquisitionEventKind::Completed, version.to_string(), path, std::string{}};
    }

    AcquisitionEvent AcquisitionEvent::install_error(StringView version, StringView detail)
    {
        return AcquisitionEvent{AcquisitionEventKind::InstallError, version.to_string(), Path{}, detail.to_string()};
    }

    AcquisitionEvent AcquisitionEvent::script_error(StringView version, StringView detail)
    {
        return AcquisitionEvent{AcquisitionEventKind::ScriptError, version.to_string(), Path{}, detail.to_string()};
    }

    AcquisitionEvent AcquisitionEvent::unexpected_error(StringView version, StringView detail)
    {
        return AcquisitionEvent{
            AcquisitionEventKind::UnexpectedError, version.to_string(), Path{}, detail.to_string()};
    }

    bool AcquisitionEvent::is_error() const noexcept
    {
        return kind == AcquisitionEventKind::InstallError || kind == AcquisitionEventKind::ScriptError ||
               kind == AcquisitionEventKind::UnexpectedError;
    }

    void EventStream::subscribe(IEventStreamObserver& observer)
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        m_observers.push_back(&observer);
    }

    void EventStream::unsubscribe(IEventStreamObserver& observer)
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        m_observers.erase(std::remove(m_observers.begin(), m_observers.end(), &observer), m_observers.end());
    }

    void EventStream::post(const AcquisitionEvent& event)
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        Debug::println("event: ", to_string_literal(event.kind), ' ', event.version);
        for (auto observer : m_observers)
        {
            observer->post(event);
        }
    }
}
