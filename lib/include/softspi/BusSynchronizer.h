#ifndef SOFTSPI_BUS_SYNCHRONIZER_H
#define SOFTSPI_BUS_SYNCHRONIZER_H

#include <memory>

#include "softspi/AbstractPin.h"
#include "softspi/OS/Time.h"

namespace softspi
{
    /// Time the clock line is held high for each bit.
    constexpr nanoseconds SYNC_DELAY = 1ms;

    /// Generate the bus clock: one pulse per exchanged bit.
    class BusSynchronizer
    {
    public:
        BusSynchronizer(std::shared_ptr<AbstractOutputPin> clock, nanoseconds delay = SYNC_DELAY);
        ~BusSynchronizer() = default;

        /// Drive the clock high, hold it for delay(), then drive it low.
        /// Nothing is waited once the clock is back low.
        void pulse();

        nanoseconds delay() const { return delay_; }

    private:
        std::shared_ptr<AbstractOutputPin> clock_;
        nanoseconds delay_;
    };
}

#endif
