#include "softspi/OS/Time.h"
#include "softspi/Error.h"

namespace softspi
{
    extern "C"
    {
        static void __sleep_ns(nanoseconds ns)
        {
            timespec remaining_time = to_timespec(ns);

            while (true)
            {
                timespec required_time = remaining_time;

                int32_t result = clock_nanosleep(CLOCK_MONOTONIC, 0, &required_time, &remaining_time);
                if (result == 0)
                {
                    return;
                }

                if (result == EINTR)
                {
                    // call interrupted by a POSIX signal: must sleep again.
                    continue;
                }

                // only possible if timespec is wrongly defined or wrong clock ID
                THROW_SYSTEM_ERROR_CODE("clock_nanosleep()", result);
            }
        }
    }
    __attribute__((weak,alias("__sleep_ns"))) void sleep(nanoseconds ns);
}
