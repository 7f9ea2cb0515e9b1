#pragma once

#include <dnacq/base/fmt.h>
#include <dnacq/base/optional.h>

#include <time.h>

#include <atomic>
#include <chrono>
#include <string>

namespace dnacq
{
    // Measures time since construction. Safe to read from multiple threads.
    struct ElapsedTimer
    {
        using clock = std::chrono::steady_clock;

        ElapsedTimer() noexcept : m_start_tick(clock::now().time_since_epoch().count()) { }

        clock::duration elapsed() const noexcept
        {
            return clock::now().time_since_epoch() - clock::duration(m_start_tick.load());
        }

        // Three significant digits in the largest fitting unit, such as "1.25 s" or "830 us".
        std::string to_string() const;
        void to_string(std::string& into) const { into.append(to_string()); }

    private:
        std::atomic<clock::rep> m_start_tick;
    };

    // A UTC wall clock time with millisecond precision.
    struct CTime
    {
        static Optional<CTime> now();
        // 2024-05-01T10:32:04.123Z, or empty when the clock cannot be read.
        static std::string now_string();

        std::string to_string() const;

    private:
        CTime(const tm& parts, int milliseconds) noexcept : m_tm(parts), m_milliseconds(milliseconds) { }

        tm m_tm;
        int m_milliseconds;
    };
}

DNACQ_FORMAT_WITH_TO_STRING(dnacq::ElapsedTimer);
DNACQ_FORMAT_WITH_TO_STRING(dnacq::CTime);
