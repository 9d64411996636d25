#ifndef SOFTSPI_UNIT_MOCKS_TIME_H
#define SOFTSPI_UNIT_MOCKS_TIME_H

#include <vector>

#include "softspi/OS/Time.h"

namespace softspi
{
    // sleep() is replaced in the unit tests: it records the requested durations instead of blocking.
    std::vector<nanoseconds> const& sleepHistory();
    void resetSleepHistory();
}

#endif
