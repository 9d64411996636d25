#include <gtest/gtest.h>
#include "softspi/BitOrder.h"

using namespace softspi;

TEST(BitOrder, little_endian_sends_highest_bit_first)
{
    for (uint32_t n = 1; n <= 8; ++n)
    {
        for (uint32_t i = 0; i < n; ++i)
        {
            ASSERT_EQ(n - 1 - i, bitIndex(Endianness::LittleEndian, n, i));
        }
    }
}

TEST(BitOrder, big_endian_sends_bit_zero_first)
{
    for (uint32_t n = 1; n <= 8; ++n)
    {
        for (uint32_t i = 0; i < n; ++i)
        {
            ASSERT_EQ(i, bitIndex(Endianness::BigEndian, n, i));
        }
    }
}

TEST(BitOrder, full_word)
{
    static_assert(bitIndex(Endianness::LittleEndian, 64, 0)  == 63, "first bit of a 64 bits word");
    static_assert(bitIndex(Endianness::LittleEndian, 64, 63) == 0,  "last bit of a 64 bits word");
    static_assert(bitIndex(Endianness::BigEndian,    64, 63) == 63, "last bit of a 64 bits word");
}

TEST(BitOrder, check_bit_count)
{
    ASSERT_NO_THROW(checkBitCount(0, 8));
    ASSERT_NO_THROW(checkBitCount(8, 8));
    ASSERT_NO_THROW(checkBitCount(64, MAX_BIT_COUNT));

    try
    {
        checkBitCount(17, 16);
        FAIL() << "Shall never be reached";
    }
    catch (ErrorOutOfRange const& e)
    {
        ASSERT_EQ(17u, e.bitCount());
        ASSERT_EQ(16u, e.width());
    }

    ASSERT_THROW(checkBitCount(65, MAX_BIT_COUNT), ErrorOutOfRange);
}

TEST(BitOrder, to_string)
{
    ASSERT_STREQ("LittleEndian", toString(Endianness::LittleEndian));
    ASSERT_STREQ("BigEndian",    toString(Endianness::BigEndian));
    ASSERT_STREQ("Unknown",      toString(static_cast<Endianness>(42)));
}
