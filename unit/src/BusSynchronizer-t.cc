#include <gtest/gtest.h>
#include "mocks/Pins.h"
#include "mocks/Time.h"

#include "softspi/BusSynchronizer.h"

using namespace softspi;
using namespace testing;

class BusSynchronizerTest : public testing::Test
{
public:
    void SetUp() override
    {
        resetSleepHistory();
    }

    std::shared_ptr<StrictMock<MockOutputPin>> clock_ = std::make_shared<StrictMock<MockOutputPin>>();
};

TEST_F(BusSynchronizerTest, pulse_holds_the_clock_high)
{
    BusSynchronizer synchronizer{clock_};
    ASSERT_EQ(SYNC_DELAY, synchronizer.delay());
    ASSERT_EQ(1ms, SYNC_DELAY);

    {
        InSequence s;
        EXPECT_CALL(*clock_, write(true)).WillOnce(Invoke([](bool)
        {
            ASSERT_TRUE(sleepHistory().empty());
        }));
        EXPECT_CALL(*clock_, write(false)).WillOnce(Invoke([](bool)
        {
            // low phase starts once the hold delay is elapsed
            ASSERT_EQ(1u, sleepHistory().size());
        }));
    }

    synchronizer.pulse();

    // no wait after the falling edge
    ASSERT_EQ(1u, sleepHistory().size());
    ASSERT_EQ(nanoseconds(1ms), sleepHistory().at(0));
}

TEST_F(BusSynchronizerTest, custom_delay)
{
    BusSynchronizer synchronizer{clock_, 250us};
    ASSERT_EQ(nanoseconds(250us), synchronizer.delay());

    EXPECT_CALL(*clock_, write(true)).Times(3);
    EXPECT_CALL(*clock_, write(false)).Times(3);

    synchronizer.pulse();
    synchronizer.pulse();
    synchronizer.pulse();

    ASSERT_EQ(3u, sleepHistory().size());
    for (auto const& delay : sleepHistory())
    {
        ASSERT_EQ(nanoseconds(250us), delay);
    }
}
