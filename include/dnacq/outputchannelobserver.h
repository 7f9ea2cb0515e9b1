#pragma once

#include <dnacq/base/fwd/message_sinks.h>

#include <dnacq/eventstream.h>

#include <string>
#include <vector>

namespace dnacq
{
    // Console progress for acquisitions. Tracks which versions are still being downloaded so that
    // concurrent acquisitions are reported as such.
    struct OutputChannelObserver final : IEventStreamObserver
    {
        explicit OutputChannelObserver(MessageSink& sink) : m_sink(sink) { }

        virtual void post(const AcquisitionEvent& event) override;

        const std::vector<std::string>& in_progress_versions() const noexcept { return m_in_progress; }

    private:
        void version_done(const std::string& version);
        void print_still_downloading();

        MessageSink& m_sink;
        std::vector<std::string> m_in_progress;
    };
}
