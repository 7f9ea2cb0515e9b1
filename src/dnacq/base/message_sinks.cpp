#include <dnacq/base/message_sinks.h>

namespace dnacq
{
    namespace
    {
        template<void (*Write)(Color, StringView)>
        struct ConsoleMessageSink final : MessageSink
        {
            void println(const MessageLine& line) override
            {
                for (const auto& segment : line.get_segments())
                {
                    Write(segment.color, segment.text);
                }

                Write(Color::none, "\n");
            }
        };

        ConsoleMessageSink<&msg::write_unlocalized_text_to_stdout> console_stdout;
        ConsoleMessageSink<&msg::write_unlocalized_text_to_stderr> console_stderr;
    }

    MessageSink& stdout_sink = console_stdout;
    MessageSink& stderr_sink = console_stderr;

    MessageLine::MessageLine(const LocalizedString& text) { print(text); }

    void MessageLine::print(Color color, StringView text)
    {
        if (!m_segments.empty() && m_segments.back().color == color)
        {
            m_segments.back().text.append(text.data(), text.size());
            return;
        }

        m_segments.push_back(MessageLineSegment{color, text.to_string()});
    }

    std::string MessageLine::to_string() const
    {
        std::string result;
        to_string(result);
        return result;
    }

    void MessageLine::to_string(std::string& into) const
    {
        for (const auto& segment : m_segments)
        {
            into += segment.text;
        }
    }

    void MessageSink::println(Color color, const LocalizedString& text)
    {
        MessageLine line;
        line.print(color, text);
        println(line);
    }
}
