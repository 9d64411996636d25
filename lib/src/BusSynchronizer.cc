#include "softspi/BusSynchronizer.h"

namespace softspi
{
    BusSynchronizer::BusSynchronizer(std::shared_ptr<AbstractOutputPin> clock, nanoseconds delay)
        : clock_(clock)
        , delay_(delay)
    {
    }


    void BusSynchronizer::pulse()
    {
        clock_->write(true);
        sleep(delay_);
        clock_->write(false);
    }
}
