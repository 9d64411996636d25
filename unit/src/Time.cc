#include "mocks/Time.h"

namespace softspi
{
    static std::vector<nanoseconds> sleep_history;

    std::vector<nanoseconds> const& sleepHistory()
    {
        return sleep_history;
    }

    void resetSleepHistory()
    {
        sleep_history.clear();
    }

    void sleep(nanoseconds ns)
    {
        sleep_history.push_back(ns);
    }
}
