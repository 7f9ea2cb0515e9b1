#include <dnacq/base/chrono.h>

#include <array>

namespace
{
    struct TimeUnit
    {
        double nanoseconds;
        const char* suffix;
    };

    constexpr TimeUnit time_units[] = {
        {60e9, "min"},
        {1e9, "s"},
        {1e6, "ms"},
        {1e3, "us"},
    };
}

namespace dnacq
{
    std::string ElapsedTimer::to_string() const
    {
        const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed()).count();
        for (auto&& unit : time_units)
        {
            if (static_cast<double>(ns) >= unit.nanoseconds)
            {
                return fmt::format("{:.3g} {}", static_cast<double>(ns) / unit.nanoseconds, unit.suffix);
            }
        }

        return fmt::format("{} ns", ns);
    }

    Optional<CTime> CTime::now()
    {
        using std::chrono::system_clock;
        const auto now = system_clock::now();
        const std::time_t seconds = system_clock::to_time_t(now);
        const auto milliseconds =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

        tm parts{};
        if (!gmtime_r(&seconds, &parts))
        {
            return nullopt;
        }

        return CTime{parts, static_cast<int>(milliseconds)};
    }

    std::string CTime::now_string()
    {
        auto maybe_now = CTime::now();
        if (auto now = maybe_now.get())
        {
            return now->to_string();
        }

        return std::string();
    }

    std::string CTime::to_string() const
    {
        std::array<char, 32> buffer{};
        const auto length = ::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%S", &m_tm);
        return fmt::format("{}.{:03}Z", fmt::string_view(buffer.data(), length), m_milliseconds);
    }
}
