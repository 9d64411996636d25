#include <gtest/gtest.h>
#include "mocks/Pins.h"
#include "mocks/Time.h"

#include "softspi/SpiConnection.h"

using namespace softspi;
using namespace testing;

class SpiConnectionTest : public testing::Test
{
public:
    void SetUp() override
    {
        resetSleepHistory();
    }

    void TearDown() override
    {
        if (spi_ and not spi_->isClosed())
        {
            expectClose();
        }
        spi_.reset();
    }

    void open(Endianness endianness, bool with_slave2 = true, bool with_miso = true, bool with_mosi = true)
    {
        if (not with_slave2) { slave2_ = nullptr; }
        if (not with_miso)   { miso_   = nullptr; }
        if (not with_mosi)   { mosi_   = nullptr; }

        EXPECT_CALL(*clock_,  write(false)).Times(1);
        EXPECT_CALL(*slave1_, write(true)).Times(1);
        if (slave2_) { EXPECT_CALL(*slave2_, write(true)).Times(1);  }
        if (mosi_)   { EXPECT_CALL(*mosi_,   write(false)).Times(1); }

        spi_ = std::make_unique<SpiConnection>(clock_, slave1_, slave2_, miso_, mosi_, endianness);
        Mock::VerifyAndClearExpectations(clock_.get());
        Mock::VerifyAndClearExpectations(slave1_.get());
        if (slave2_) { Mock::VerifyAndClearExpectations(slave2_.get()); }
        if (mosi_)   { Mock::VerifyAndClearExpectations(mosi_.get());   }
    }

    void expectClose()
    {
        EXPECT_CALL(*clock_,  close()).Times(1);
        EXPECT_CALL(*slave1_, close()).Times(1);
        if (slave2_) { EXPECT_CALL(*slave2_, close()).Times(1); }
        if (miso_)   { EXPECT_CALL(*miso_,   close()).Times(1); }
        if (mosi_)   { EXPECT_CALL(*mosi_,   close()).Times(1); }
    }

    // one bit on MOSI: data first, then the clock pulse
    void expectWriteBit(bool bit)
    {
        EXPECT_CALL(*mosi_,  write(bit));
        EXPECT_CALL(*clock_, write(true));
        EXPECT_CALL(*clock_, write(false));
    }

    // one bit from MISO: clock pulse first, then the sample
    void expectReadBit(bool bit)
    {
        EXPECT_CALL(*clock_, write(true));
        EXPECT_CALL(*clock_, write(false));
        EXPECT_CALL(*miso_,  read()).WillOnce(Return(bit));
    }

    std::shared_ptr<StrictMock<MockOutputPin>> clock_  = std::make_shared<StrictMock<MockOutputPin>>();
    std::shared_ptr<StrictMock<MockOutputPin>> slave1_ = std::make_shared<StrictMock<MockOutputPin>>();
    std::shared_ptr<StrictMock<MockOutputPin>> slave2_ = std::make_shared<StrictMock<MockOutputPin>>();
    std::shared_ptr<StrictMock<MockInputPin>>  miso_   = std::make_shared<StrictMock<MockInputPin>>();
    std::shared_ptr<StrictMock<MockOutputPin>> mosi_   = std::make_shared<StrictMock<MockOutputPin>>();

    std::unique_ptr<SpiConnection> spi_;
};


TEST_F(SpiConnectionTest, init_drives_lines_to_idle)
{
    {
        InSequence s;
        EXPECT_CALL(*clock_,  write(false));
        EXPECT_CALL(*slave1_, write(true));
        EXPECT_CALL(*slave2_, write(true));
        EXPECT_CALL(*mosi_,   write(false));
    }

    spi_ = std::make_unique<SpiConnection>(clock_, slave1_, slave2_, miso_, mosi_, Endianness::BigEndian);
    ASSERT_EQ(Endianness::BigEndian, spi_->endianness());
    ASSERT_EQ(nanoseconds(SYNC_DELAY), spi_->syncDelay());
    ASSERT_TRUE(spi_->hasSlave2());
    ASSERT_TRUE(spi_->canRead());
    ASSERT_TRUE(spi_->canWrite());
    ASSERT_FALSE(spi_->isClosed());
}


TEST_F(SpiConnectionTest, init_single_slave_without_data_lines)
{
    EXPECT_CALL(*clock_,  write(false));
    EXPECT_CALL(*slave1_, write(true));

    spi_ = std::make_unique<SpiConnection>(clock_, slave1_, nullptr, nullptr);
    slave2_ = nullptr;
    miso_   = nullptr;
    mosi_   = nullptr;

    ASSERT_EQ(Endianness::LittleEndian, spi_->endianness());
    ASSERT_FALSE(spi_->hasSlave2());
    ASSERT_FALSE(spi_->canRead());
    ASSERT_FALSE(spi_->canWrite());
}


TEST_F(SpiConnectionTest, init_custom_sync_delay)
{
    EXPECT_CALL(*clock_,  write(false));
    EXPECT_CALL(*slave1_, write(true));
    EXPECT_CALL(*mosi_,   write(false));

    spi_ = std::make_unique<SpiConnection>(clock_, slave1_, miso_, mosi_, Endianness::LittleEndian, 10us);
    slave2_ = nullptr;
    ASSERT_EQ(nanoseconds(10us), spi_->syncDelay());

    expectWriteBit(true);
    spi_->write(true);
    ASSERT_EQ(1u, sleepHistory().size());
    ASSERT_EQ(nanoseconds(10us), sleepHistory().at(0));
}


TEST_F(SpiConnectionTest, init_mandatory_lines)
{
    // nothing is touched when a mandatory line is missing
    ASSERT_THROW(SpiConnection(nullptr, slave1_, slave2_, miso_, mosi_), Error);
    ASSERT_THROW(SpiConnection(clock_, nullptr, slave2_, miso_, mosi_), Error);
}


TEST_F(SpiConnectionTest, write_bit)
{
    open(Endianness::LittleEndian);

    {
        InSequence s;
        expectWriteBit(true);
        expectWriteBit(false);
    }

    spi_->write(true);
    spi_->write(false);
    ASSERT_EQ(2u, sleepHistory().size());
}


TEST_F(SpiConnectionTest, write_bit_without_mosi)
{
    open(Endianness::LittleEndian, true, true, false);

    try
    {
        spi_->write(true);
        FAIL() << "Shall never be reached";
    }
    catch (ErrorUnsupported const& e)
    {
        ASSERT_EQ(Line::MOSI, e.line());
    }
    ASSERT_TRUE(sleepHistory().empty());
}


TEST_F(SpiConnectionTest, write_byte_big_endian)
{
    open(Endianness::BigEndian);

    // 0xA5 = 1010 0101: bit i is sent at step i
    {
        InSequence s;
        for (bool bit : {true, false, true, false, false, true, false, true})
        {
            expectWriteBit(bit);
        }
    }

    spi_->write(uint8_t{0xA5}, 8);
    ASSERT_EQ(8u, sleepHistory().size());
}


TEST_F(SpiConnectionTest, write_little_endian_highest_bit_first)
{
    open(Endianness::LittleEndian);

    // 0x0B on 5 bits = 0 1011, highest bit first
    {
        InSequence s;
        for (bool bit : {false, true, false, true, true})
        {
            expectWriteBit(bit);
        }
    }

    spi_->write(uint16_t{0x0B}, 5);
    ASSERT_EQ(5u, sleepHistory().size());
}


TEST_F(SpiConnectionTest, write_ignores_bits_above_bit_count)
{
    open(Endianness::BigEndian);

    {
        InSequence s;
        for (bool bit : {true, true, false, false})
        {
            expectWriteBit(bit);
        }
    }

    spi_->write(uint32_t{0xFFFFFFF3}, 4);
}


TEST_F(SpiConnectionTest, write_zero_bit)
{
    open(Endianness::LittleEndian);

    spi_->write(uint64_t{0xFFFF}, 0);
    ASSERT_TRUE(sleepHistory().empty());
}


TEST_F(SpiConnectionTest, write_out_of_range)
{
    open(Endianness::LittleEndian);

    // StrictMock: any line transition fails the test
    try
    {
        spi_->write(uint8_t{0xFF}, 9);
        FAIL() << "Shall never be reached";
    }
    catch (ErrorOutOfRange const& e)
    {
        ASSERT_EQ(9u, e.bitCount());
        ASSERT_EQ(8u, e.width());
    }

    ASSERT_THROW(spi_->write(uint16_t{0}, 17), ErrorOutOfRange);
    ASSERT_THROW(spi_->write(uint32_t{0}, 33), ErrorOutOfRange);
    ASSERT_THROW(spi_->write(uint64_t{0}, 65), ErrorOutOfRange);
    ASSERT_TRUE(sleepHistory().empty());
}


TEST_F(SpiConnectionTest, write_word_without_mosi)
{
    open(Endianness::LittleEndian, true, true, false);

    ASSERT_THROW(spi_->write(uint8_t{0xA5}, 8), ErrorUnsupported);
    ASSERT_TRUE(sleepHistory().empty());
}


TEST_F(SpiConnectionTest, write_full_64_bits)
{
    open(Endianness::LittleEndian);

    uint64_t const word = 0x8000000000000001;
    {
        InSequence s;
        for (int32_t i = 0; i < 64; ++i)
        {
            expectWriteBit((i == 0) or (i == 63));
        }
    }

    spi_->write(word, 64);
    ASSERT_EQ(64u, sleepHistory().size());
}


TEST_F(SpiConnectionTest, read_bit)
{
    open(Endianness::LittleEndian);

    {
        InSequence s;
        expectReadBit(true);
        expectReadBit(false);
    }

    ASSERT_TRUE(spi_->read());
    ASSERT_FALSE(spi_->read());
}


TEST_F(SpiConnectionTest, read_without_miso)
{
    open(Endianness::LittleEndian, true, false, true);

    try
    {
        spi_->read();
        FAIL() << "Shall never be reached";
    }
    catch (ErrorUnsupported const& e)
    {
        ASSERT_EQ(Line::MISO, e.line());
    }
    ASSERT_THROW(spi_->read(8), ErrorUnsupported);
    ASSERT_TRUE(sleepHistory().empty());
}


TEST_F(SpiConnectionTest, read_word_big_endian)
{
    open(Endianness::BigEndian);

    {
        InSequence s;
        for (bool bit : {true, false, true, false, false, true, false, true})
        {
            expectReadBit(bit);
        }
    }

    ASSERT_EQ(0xA5u, spi_->read(8));
    ASSERT_EQ(8u, sleepHistory().size());
}


TEST_F(SpiConnectionTest, read_word_little_endian)
{
    open(Endianness::LittleEndian);

    {
        InSequence s;
        for (bool bit : {true, true, false})
        {
            expectReadBit(bit);
        }
    }

    ASSERT_EQ(0x6u, spi_->read(3));
}


TEST_F(SpiConnectionTest, read_zero_bit)
{
    open(Endianness::LittleEndian);
    ASSERT_EQ(0u, spi_->read(0));
    ASSERT_TRUE(sleepHistory().empty());
}


TEST_F(SpiConnectionTest, read_out_of_range)
{
    open(Endianness::LittleEndian);

    try
    {
        spi_->read(65);
        FAIL() << "Shall never be reached";
    }
    catch (ErrorOutOfRange const& e)
    {
        ASSERT_EQ(65u, e.bitCount());
        ASSERT_EQ(64u, e.width());
    }
    ASSERT_TRUE(sleepHistory().empty());
}


TEST_F(SpiConnectionTest, synchronize)
{
    open(Endianness::LittleEndian);

    {
        InSequence s;
        EXPECT_CALL(*clock_, write(true));
        EXPECT_CALL(*clock_, write(false));
    }
    spi_->synchronize();
    ASSERT_EQ(1u, sleepHistory().size());
}


TEST_F(SpiConnectionTest, select_slave2_without_line)
{
    open(Endianness::LittleEndian, false);

    try
    {
        spi_->selectSlave2();
        FAIL() << "Shall never be reached";
    }
    catch (ErrorUnsupported const& e)
    {
        ASSERT_EQ(Line::SELECT_SLAVE2, e.line());
    }
}


TEST_F(SpiConnectionTest, close_disposes_every_line_once)
{
    open(Endianness::LittleEndian);

    expectClose();
    spi_->close();
    ASSERT_TRUE(spi_->isClosed());

    // second close does nothing
    spi_->close();
}


TEST_F(SpiConnectionTest, close_without_optional_lines)
{
    open(Endianness::LittleEndian, false, false, false);

    EXPECT_CALL(*clock_,  close()).Times(1);
    EXPECT_CALL(*slave1_, close()).Times(1);
    spi_->close();
}


TEST_F(SpiConnectionTest, destructor_closes)
{
    open(Endianness::LittleEndian);

    expectClose();
    spi_.reset();
}


TEST_F(SpiConnectionTest, operations_after_close)
{
    open(Endianness::LittleEndian);

    expectClose();
    spi_->close();

    ASSERT_THROW(spi_->write(true), Error);
    ASSERT_THROW(spi_->write(uint8_t{1}, 8), Error);
    ASSERT_THROW(spi_->read(), Error);
    ASSERT_THROW(spi_->read(8), Error);
    ASSERT_THROW(spi_->synchronize(), Error);
    ASSERT_THROW(spi_->selectSlave1(), Error);
    ASSERT_THROW(spi_->selectSlave2(), Error);
    ASSERT_TRUE(sleepHistory().empty());
}


class SpiConnectionLoopbackTest : public testing::TestWithParam<Endianness>
{
public:
    void SetUp() override
    {
        auto clock = std::make_shared<NiceMock<MockOutputPin>>();
        auto select = std::make_shared<NiceMock<MockOutputPin>>();
        spi_ = std::make_unique<SpiConnection>(clock, select,
                                               std::make_shared<LoopbackWire::In>(wire_),
                                               std::make_shared<LoopbackWire::Out>(wire_),
                                               GetParam(), 0ns);
        wire_.clear();
    }

    LoopbackWire wire_;
    std::unique_ptr<SpiConnection> spi_;
};


TEST_P(SpiConnectionLoopbackTest, round_trip)
{
    uint64_t const patterns[] = {0, 1, UINT64_MAX, 0xAAAAAAAAAAAAAAAA, 0x5555555555555555, 0x0123456789ABCDEF};

    for (uint32_t n = 1; n <= 64; ++n)
    {
        uint64_t const mask = (n == 64) ? UINT64_MAX : ((uint64_t{1} << n) - 1);
        for (uint64_t word : patterns)
        {
            SlaveSelection selection = spi_->selectSlave1();
            spi_->write(word, n);
            ASSERT_EQ(n, wire_.history().size());
            ASSERT_EQ(word & mask, spi_->read(n)) << "n=" << n << " word=" << word;
            wire_.clear();
        }
    }
}


TEST_P(SpiConnectionLoopbackTest, round_trip_every_width)
{
    SlaveSelection selection = spi_->selectSlave1();

    spi_->write(uint8_t{0xC3}, 8);
    ASSERT_EQ(0xC3u, spi_->read(8));

    spi_->write(uint16_t{0x1234}, 13);
    ASSERT_EQ(0x1234u, spi_->read(13));

    spi_->write(uint32_t{0xDEADBEEF}, 32);
    ASSERT_EQ(0xDEADBEEFu, spi_->read(32));

    spi_->write(uint64_t{0xFEEDFACECAFEBEEF}, 64);
    ASSERT_EQ(0xFEEDFACECAFEBEEFu, spi_->read(64));
}


TEST_P(SpiConnectionLoopbackTest, close_loopback_lines)
{
    spi_->close();
    ASSERT_EQ(2, wire_.closed());
}


INSTANTIATE_TEST_SUITE_P(BitOrders, SpiConnectionLoopbackTest,
                         testing::Values(Endianness::LittleEndian, Endianness::BigEndian));
