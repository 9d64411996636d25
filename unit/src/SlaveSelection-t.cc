#include <gtest/gtest.h>
#include "mocks/Pins.h"
#include "mocks/Time.h"

#include "softspi/SpiConnection.h"

using namespace softspi;
using namespace testing;

class SlaveSelectionTest : public testing::Test
{
public:
    void SetUp() override
    {
        resetSleepHistory();

        EXPECT_CALL(*clock_,  write(false));
        EXPECT_CALL(*slave1_, write(true));
        EXPECT_CALL(*slave2_, write(true));
        EXPECT_CALL(*mosi_,   write(false));
        spi_ = std::make_unique<SpiConnection>(clock_, slave1_, slave2_, miso_, mosi_);
    }

    void TearDown() override
    {
        if (not spi_->isClosed())
        {
            EXPECT_CALL(*clock_,  close());
            EXPECT_CALL(*slave1_, close());
            EXPECT_CALL(*slave2_, close());
            EXPECT_CALL(*miso_,   close());
            EXPECT_CALL(*mosi_,   close());
        }
        spi_.reset();
    }

    std::shared_ptr<StrictMock<MockOutputPin>> clock_  = std::make_shared<StrictMock<MockOutputPin>>();
    std::shared_ptr<StrictMock<MockOutputPin>> slave1_ = std::make_shared<StrictMock<MockOutputPin>>();
    std::shared_ptr<StrictMock<MockOutputPin>> slave2_ = std::make_shared<StrictMock<MockOutputPin>>();
    std::shared_ptr<StrictMock<MockInputPin>>  miso_   = std::make_shared<StrictMock<MockInputPin>>();
    std::shared_ptr<StrictMock<MockOutputPin>> mosi_   = std::make_shared<StrictMock<MockOutputPin>>();

    std::unique_ptr<SpiConnection> spi_;
};


TEST_F(SlaveSelectionTest, select_slave1_until_release)
{
    {
        InSequence s;
        EXPECT_CALL(*slave1_, write(false));
        EXPECT_CALL(*slave1_, write(true));
    }

    SlaveSelection selection = spi_->selectSlave1();
    ASSERT_TRUE(selection.isActive());

    selection.release();
    ASSERT_FALSE(selection.isActive());

    // already released: nothing more on the line
    selection.release();
}


TEST_F(SlaveSelectionTest, select_slave2_until_scope_exit)
{
    {
        InSequence s;
        EXPECT_CALL(*slave2_, write(false));
        EXPECT_CALL(*slave2_, write(true));
    }

    {
        SlaveSelection selection = spi_->selectSlave2();
    }
}


TEST_F(SlaveSelectionTest, released_on_exception)
{
    {
        InSequence s;
        EXPECT_CALL(*slave1_, write(false));
        EXPECT_CALL(*slave1_, write(true));
    }

    try
    {
        SlaveSelection selection = spi_->selectSlave1();
        spi_->write(uint8_t{0}, 9);
        FAIL() << "Shall never be reached";
    }
    catch (ErrorOutOfRange const&)
    {
    }
}


TEST_F(SlaveSelectionTest, transfer_between_select_and_release)
{
    {
        InSequence s;
        EXPECT_CALL(*slave1_, write(false));
        EXPECT_CALL(*mosi_,   write(true));
        EXPECT_CALL(*clock_,  write(true));
        EXPECT_CALL(*clock_,  write(false));
        EXPECT_CALL(*clock_,  write(true));
        EXPECT_CALL(*clock_,  write(false));
        EXPECT_CALL(*miso_,   read()).WillOnce(Return(true));
        EXPECT_CALL(*slave1_, write(true));
    }

    SlaveSelection selection = spi_->selectSlave1();
    spi_->write(true);
    ASSERT_TRUE(spi_->read());
    selection.release();
}


TEST_F(SlaveSelectionTest, move_keeps_a_single_release)
{
    {
        InSequence s;
        EXPECT_CALL(*slave1_, write(false));
        EXPECT_CALL(*slave1_, write(true)).Times(1);
    }

    SlaveSelection first = spi_->selectSlave1();
    SlaveSelection second = std::move(first);
    ASSERT_FALSE(first.isActive());
    ASSERT_TRUE(second.isActive());

    first.release();
    second.release();
}


TEST_F(SlaveSelectionTest, move_assignment_releases_the_previous_selection)
{
    {
        InSequence s;
        EXPECT_CALL(*slave1_, write(false));
        EXPECT_CALL(*slave2_, write(false));
        EXPECT_CALL(*slave1_, write(true));
        EXPECT_CALL(*slave2_, write(true));
    }

    SlaveSelection selection = spi_->selectSlave1();
    selection = spi_->selectSlave2();
    ASSERT_TRUE(selection.isActive());
    selection.release();
}


TEST_F(SlaveSelectionTest, connection_closed_before_release)
{
    EXPECT_CALL(*slave1_, write(false));

    SlaveSelection selection = spi_->selectSlave1();

    EXPECT_CALL(*clock_,  close());
    EXPECT_CALL(*slave1_, close());
    EXPECT_CALL(*slave2_, close());
    EXPECT_CALL(*miso_,   close());
    EXPECT_CALL(*mosi_,   close());
    spi_->close();

    // lines are closed: explicit release fails fast, scope exit leaves them alone
    ASSERT_THROW(selection.release(), Error);
    ASSERT_FALSE(selection.isActive());
}


TEST_F(SlaveSelectionTest, scope_exit_after_close_does_not_touch_lines)
{
    EXPECT_CALL(*slave2_, write(false));

    {
        SlaveSelection selection = spi_->selectSlave2();

        EXPECT_CALL(*clock_,  close());
        EXPECT_CALL(*slave1_, close());
        EXPECT_CALL(*slave2_, close());
        EXPECT_CALL(*miso_,   close());
        EXPECT_CALL(*mosi_,   close());
        spi_->close();
    }
}
