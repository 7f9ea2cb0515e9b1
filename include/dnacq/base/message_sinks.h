#pragma once

#include <dnacq/base/fwd/message_sinks.h>

#include <dnacq/base/messages.h>

#include <string>
#include <vector>

namespace dnacq
{
    struct MessageLineSegment
    {
        Color color;
        std::string text;
    };

    // One line of console output made of colored runs; adjacent runs of the same color are merged.
    struct MessageLine
    {
        MessageLine() = default;
        explicit MessageLine(const LocalizedString& text);

        void print(Color color, StringView text);
        void print(StringView text) { print(Color::none, text); }
        const std::vector<MessageLineSegment>& get_segments() const noexcept { return m_segments; }

        std::string to_string() const;
        void to_string(std::string& into) const;

    private:
        std::vector<MessageLineSegment> m_segments;
    };

    // Destination for whole lines of user facing output. Observers write through a MessageSink so tests can capture
    // what would have gone to the console.
    struct MessageSink
    {
        virtual void println(const MessageLine& line) = 0;

        void println(const LocalizedString& text) { println(MessageLine(text)); }
        void println(Color color, const LocalizedString& text);

        template<DNACQ_DECL_MSG_TEMPLATE>
        void println(DNACQ_DECL_MSG_ARGS)
        {
            println(msg::format(DNACQ_EXPAND_MSG_ARGS));
        }

        template<DNACQ_DECL_MSG_TEMPLATE>
        void println(Color color, DNACQ_DECL_MSG_ARGS)
        {
            println(color, msg::format(DNACQ_EXPAND_MSG_ARGS));
        }

        MessageSink(const MessageSink&) = delete;
        MessageSink& operator=(const MessageSink&) = delete;

    protected:
        MessageSink() = default;
        ~MessageSink() = default;
    };

    extern MessageSink& stdout_sink;
    extern MessageSink& stderr_sink;
}

DNACQ_FORMAT_WITH_TO_STRING(dnacq::MessageLine);
