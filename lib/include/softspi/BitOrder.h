#ifndef SOFTSPI_BIT_ORDER_H
#define SOFTSPI_BIT_ORDER_H

#include <cstdint>

#include "softspi/Error.h"

namespace softspi
{
    /// Order in which the bits of a word are put on (or taken from) the data lines.
    /// BigEndian sends bit 0 first, LittleEndian sends bit (n - 1) first.
    enum class Endianness
    {
        LittleEndian,
        BigEndian
    };

    constexpr char const* toString(Endianness endianness)
    {
        switch (endianness)
        {
            case Endianness::LittleEndian: { return "LittleEndian"; }
            case Endianness::BigEndian:    { return "BigEndian";    }
            default:
            {
                return "Unknown";
            }
        }
    }

    constexpr uint32_t MAX_BIT_COUNT = 64;

    /// \param  endianness  bit order of the transfer
    /// \param  bit_count   number of bits exchanged for the word
    /// \param  step        transmission step, in [0, bit_count)
    /// \return index of the word bit handled at this step
    constexpr uint32_t bitIndex(Endianness endianness, uint32_t bit_count, uint32_t step)
    {
        if (endianness == Endianness::BigEndian)
        {
            return step;
        }
        return bit_count - 1 - step;
    }

    /// Check that bit_count bits fit in a word of the given width.
    inline void checkBitCount(uint32_t bit_count, uint32_t width)
    {
        if (bit_count > width)
        {
            THROW_ERROR_OUT_OF_RANGE("bit count exceeds the word width", bit_count, width);
        }
    }
}

#endif
