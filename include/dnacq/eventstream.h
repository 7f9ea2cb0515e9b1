#pragma once

#include <dnacq/fwd/acquisition.h>

#include <dnacq/base/path.h>
#include <dnacq/base/stringview.h>

#include <mutex>
#include <string>
#include <vector>

namespace dnacq
{
    StringLiteral to_string_literal(AcquisitionEventKind kind) noexcept;

    // One lifecycle notification. For each installer invocation there is a Started event followed by exactly one of
    // the other kinds.
    struct AcquisitionEvent
    {
        AcquisitionEventKind kind;
        std::string version;
        // set for Completed
        Path path;
        // error text for InstallError, ScriptError and UnexpectedError
        std::string detail;

        static AcquisitionEvent started(StringView version);
        static AcquisitionEvent completed(StringView version, const Path& path);
        static AcquisitionEvent install_error(StringView version, StringView detail);
        static AcquisitionEvent script_error(StringView version, StringView detail);
        static AcquisitionEvent unexpected_error(StringView version, StringView detail);

        bool is_terminal() const noexcept { return kind != AcquisitionEventKind::Started; }
        bool is_error() const noexcept;
    };

    struct IEventStreamObserver
    {
        virtual void post(const AcquisitionEvent& event) = 0;

        virtual ~IEventStreamObserver() = default;
    };

    // Synchronous fan-out. Observers are called on the posting thread, one event at a time, in subscription order.
    // Observers must outlive the stream or be unsubscribed first.
    struct EventStream
    {
        EventStream() = default;
        EventStream(const EventStream&) = delete;
        EventStream& operator=(const EventStream&) = delete;

        void subscribe(IEventStreamObserver& observer);
        void unsubscribe(IEventStreamObserver& observer);
        void post(const AcquisitionEvent& event);

    private:
        std::mutex m_mtx;
        std::vector<IEventStreamObserver*> m_observers;
    };
}

DNACQ_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(dnacq::AcquisitionEventKind);
