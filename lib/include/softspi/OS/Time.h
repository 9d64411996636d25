#ifndef SOFTSPI_OS_TIME_H
#define SOFTSPI_OS_TIME_H

#include <chrono>
#include <ctime>

namespace softspi
{
    using namespace std::chrono;

    /// Block the calling thread for the given duration.
    void sleep(nanoseconds ns);

    // Convert an std::chrono duration to a POSIX timespec
    constexpr timespec to_timespec(nanoseconds time)
    {
        auto secs = duration_cast<seconds>(time);
        nanoseconds nsecs = (time - secs);
        return timespec{static_cast<time_t>(secs.count()), static_cast<long>(nsecs.count())};
    }
}

#endif
