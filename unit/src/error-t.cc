#include <gtest/gtest.h>
#include "softspi/Error.h"

using namespace softspi;


TEST(Error, what)
{
    char const* ERROR_MSG = "I am an error";
    try
    {
        throw Error(ERROR_MSG);
        FAIL() << "Shall never be reached";
    }
    catch(std::exception const& e)
    {
        ASSERT_STREQ(ERROR_MSG, e.what());
    }
}


TEST(Error, location_is_stripped)
{
    try
    {
        THROW_ERROR("boom");
        FAIL() << "Shall never be reached";
    }
    catch(Error const& e)
    {
        ASSERT_EQ(std::string{e.what()}.rfind("error-t.cc:", 0), 0u);
        ASSERT_NE(std::string{e.what()}.find(": boom"), std::string::npos);
    }
}


TEST(Error, out_of_range_carries_bit_count_and_width)
{
    try
    {
        THROW_ERROR_OUT_OF_RANGE("too many bits", 9, 8);
        FAIL() << "Shall never be reached";
    }
    catch(ErrorOutOfRange const& e)
    {
        ASSERT_EQ(9u, e.bitCount());
        ASSERT_EQ(8u, e.width());
    }
}


TEST(Error, unsupported_carries_line)
{
    try
    {
        THROW_ERROR_UNSUPPORTED("no MISO", Line::MISO);
        FAIL() << "Shall never be reached";
    }
    catch(Error const& e)
    {
        ErrorUnsupported const* unsupported = dynamic_cast<ErrorUnsupported const*>(&e);
        ASSERT_NE(nullptr, unsupported);
        ASSERT_EQ(Line::MISO, unsupported->line());
        ASSERT_STREQ("MISO", toString(unsupported->line()));
    }
}


TEST(Error, system_error)
{
    ASSERT_THROW(THROW_SYSTEM_ERROR_CODE("sleep", EINVAL), std::system_error);
}
